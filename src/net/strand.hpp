#ifndef LANSHARE_NET_STRAND_HPP
#define LANSHARE_NET_STRAND_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

namespace lanshare {

// The one strand that serializes every handler of a room.
using Strand = boost::asio::strand<boost::asio::any_io_executor>;

} // namespace lanshare

#endif
