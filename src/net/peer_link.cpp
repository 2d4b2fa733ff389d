#include "peer_link.hpp"
#include "observability/metrics.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <iostream>

namespace lanshare {

PeerLink::PeerLink(boost::asio::ip::tcp::socket socket, Strand strand,
                   ILinkHandler &handler, Direction direction,
                   size_t max_frame_bytes)
    : socket_(std::move(socket)), strand_(std::move(strand)),
      handler_(handler), direction_(direction),
      state_(direction == Direction::Outbound ? State::Connecting
                                              : State::Handshaking),
      framer_(max_frame_bytes), deadline_(strand_) {
  boost::system::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  if (!ec)
    remote_address_ = remote.address().to_string();
}

void PeerLink::start_outbound(const boost::asio::ip::tcp::endpoint &endpoint,
                              Message handshake,
                              std::chrono::milliseconds timeout) {
  remote_address_ = endpoint.address().to_string();
  arm_deadline(timeout);
  auto self(shared_from_this());
  socket_.async_connect(
      endpoint,
      boost::asio::bind_executor(
          strand_, [this, self, hs = std::move(handshake)](
                       const boost::system::error_code &ec) {
            if (state_ == State::Closed)
              return;
            if (ec) {
              std::cerr << "[Transport] Connect to " << remote_address_
                        << " failed: " << ec.message() << "\n";
              fail(ec);
              return;
            }
            boost::system::error_code opt_ec;
            socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
            socket_.non_blocking(true, opt_ec);
            state_ = State::Handshaking;
            send(hs);
            do_read();
          }));
}

void PeerLink::start_inbound(std::chrono::milliseconds timeout) {
  boost::system::error_code opt_ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket_.non_blocking(true, opt_ec);
  arm_deadline(timeout);
  do_read();
}

void PeerLink::mark_connected(const PeerId &peer_id, const std::string &name) {
  peer_id_ = peer_id;
  display_name_ = name;
  state_ = State::Connected;
  if (timer_armed_) {
    deadline_.cancel();
    timer_armed_ = false;
  }
}

void PeerLink::arm_deadline(std::chrono::milliseconds timeout) {
  timer_armed_ = true;
  deadline_.expires_after(timeout);
  auto self(shared_from_this());
  deadline_.async_wait(boost::asio::bind_executor(
      strand_, [this, self](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        timer_armed_ = false;
        if (state_ == State::Connecting || state_ == State::Handshaking) {
          std::cerr << "[Transport] Handshake with " << remote_address_
                    << " timed out\n";
          fail(boost::asio::error::timed_out);
        }
      }));
}

void PeerLink::do_read() {
  auto self(shared_from_this());
  socket_.async_read_some(
      boost::asio::buffer(read_buffer_),
      boost::asio::bind_executor(strand_, [this, self](
                                              boost::system::error_code ec,
                                              std::size_t length) {
        if (state_ == State::Closed)
          return;
        if (ec) {
          fail(ec);
          return;
        }
        if (auto *m = metrics())
          m->record_bytes_received(length);

        auto frames = framer_.feed(std::string_view(read_buffer_.data(), length));
        for (const auto &frame : frames) {
          auto msg = decode(frame);
          if (!msg) {
            std::cerr << "[Transport] Dropping malformed frame from "
                      << remote_address_ << "\n";
            if (auto *m = metrics())
              m->increment_frames_dropped("malformed");
            continue;
          }
          if (auto *m = metrics())
            m->increment_messages(kind_to_string(msg->kind), false);
          handler_.on_link_message(self, *msg);
          if (state_ == State::Closed)
            return; // Closed by the handler
        }

        if (framer_.overflowed()) {
          std::cerr << "[Transport] Frame from " << remote_address_
                    << " exceeds limit, closing\n";
          if (auto *m = metrics())
            m->increment_frames_dropped("oversize");
          fail(boost::asio::error::message_size);
          return;
        }
        do_read(); // Loop
      }));
}

bool PeerLink::send(const Message &msg) {
  if (state_ == State::Closed || state_ == State::Connecting)
    return false;
  std::string line = encode(msg);
  line.push_back('\n');
  if (auto *m = metrics()) {
    m->increment_messages(kind_to_string(msg.kind), true);
    m->record_bytes_sent(line.size());
  }
  outbox_.push_back(std::move(line));
  if (!write_posted_ && !awaiting_writable_) {
    write_posted_ = true;
    auto self(shared_from_this());
    boost::asio::post(strand_, [this, self]() { do_write(); });
  }
  return true;
}

bool PeerLink::send_final(const Message &msg) {
  if (state_ == State::Closed || state_ == State::Connecting)
    return false;
  std::string line = encode(msg);
  line.push_back('\n');
  if (auto *m = metrics()) {
    m->increment_messages(kind_to_string(msg.kind), true);
    m->record_bytes_sent(line.size());
  }
  outbox_.push_back(std::move(line));

  boost::system::error_code ec;
  flush_outbox(ec);
  if (ec) {
    std::cerr << "[Transport] Final write to " << remote_address_
              << " failed: " << ec.message() << "\n";
    return false;
  }
  return true;
}

// Writes from the strand only, so front_written_ is always exact. Stops with
// would_block once the socket buffer is full.
void PeerLink::flush_outbox(boost::system::error_code &ec) {
  ec.clear();
  while (!outbox_.empty()) {
    const std::string &front = outbox_.front();
    size_t n = socket_.write_some(
        boost::asio::buffer(front.data() + front_written_,
                            front.size() - front_written_),
        ec);
    if (ec)
      return;
    front_written_ += n;
    if (front_written_ == front.size()) {
      outbox_.pop_front();
      front_written_ = 0;
    }
  }
}

void PeerLink::do_write() {
  write_posted_ = false;
  if (state_ == State::Closed || awaiting_writable_)
    return;

  boost::system::error_code ec;
  flush_outbox(ec);
  if (ec == boost::asio::error::would_block ||
      ec == boost::asio::error::try_again) {
    awaiting_writable_ = true;
    auto self(shared_from_this());
    socket_.async_wait(
        boost::asio::ip::tcp::socket::wait_write,
        boost::asio::bind_executor(
            strand_, [this, self](const boost::system::error_code &wait_ec) {
              awaiting_writable_ = false;
              if (state_ == State::Closed)
                return;
              if (wait_ec) {
                fail(wait_ec);
                return;
              }
              do_write();
            }));
    return;
  }
  if (ec)
    fail(ec);
}

void PeerLink::close() {
  if (state_ == State::Closed)
    return;
  state_ = State::Closed;
  if (timer_armed_) {
    deadline_.cancel();
    timer_armed_ = false;
  }
  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

void PeerLink::fail(const boost::system::error_code &ec) {
  if (state_ == State::Closed)
    return;
  close();
  handler_.on_link_closed(shared_from_this(), ec);
}

} // namespace lanshare
