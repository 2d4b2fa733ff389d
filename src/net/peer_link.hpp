#ifndef LANSHARE_NET_PEER_LINK_HPP
#define LANSHARE_NET_PEER_LINK_HPP

#include "protocol/framing.hpp"
#include "protocol/message.hpp"
#include "strand.hpp"
#include <array>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace lanshare {

class PeerLink;

class ILinkHandler {
public:
  virtual ~ILinkHandler() = default;
  virtual void on_link_message(const std::shared_ptr<PeerLink> &link,
                               const Message &msg) = 0;
  // Not called for links closed with close().
  virtual void on_link_closed(const std::shared_ptr<PeerLink> &link,
                              const boost::system::error_code &ec) = 0;
};

// One TCP connection to a peer, carrying newline-delimited JSON frames.
// Every member runs on the room strand; the socket and the handshake timer
// are bound to it.
class PeerLink : public std::enable_shared_from_this<PeerLink> {
public:
  enum class Direction { Inbound, Outbound };
  enum class State { Connecting, Handshaking, Connected, Closed };

  PeerLink(boost::asio::ip::tcp::socket socket, Strand strand,
           ILinkHandler &handler, Direction direction,
           size_t max_frame_bytes);

  // Dials, sends the handshake and waits for handshake-ack.
  void start_outbound(const boost::asio::ip::tcp::endpoint &endpoint,
                      Message handshake, std::chrono::milliseconds timeout);
  // Waits for the peer's handshake.
  void start_inbound(std::chrono::milliseconds timeout);
  void mark_connected(const PeerId &peer_id, const std::string &name);

  // Queues a frame. False before the TCP connect completes or once closed.
  bool send(const Message &msg);
  // Writes the rest of the outbox and then msg without waiting; used for
  // goodbye right before close(). False if the socket buffer fills first.
  bool send_final(const Message &msg);

  // Closes the socket without notifying the handler.
  void close();

  State state() const { return state_; }
  Direction direction() const { return direction_; }
  bool is_open() const { return socket_.is_open(); }
  bool timer_armed() const { return timer_armed_; }

  const PeerId &peer_id() const { return peer_id_; }
  const std::string &display_name() const { return display_name_; }
  const PeerId &expected_peer_id() const { return expected_peer_id_; }
  void set_expected_peer(const PeerId &id) { expected_peer_id_ = id; }
  const std::string &remote_address() const { return remote_address_; }

private:
  boost::asio::ip::tcp::socket socket_;
  Strand strand_;
  ILinkHandler &handler_;
  Direction direction_;
  State state_;
  LineFramer framer_;
  boost::asio::steady_timer deadline_;
  bool timer_armed_{false};
  std::array<char, 8192> read_buffer_;
  std::deque<std::string> outbox_;
  size_t front_written_{0}; // Bytes of outbox_.front() already sent
  bool write_posted_{false};
  bool awaiting_writable_{false};

  PeerId peer_id_;
  std::string display_name_;
  PeerId expected_peer_id_;
  std::string remote_address_;

  void arm_deadline(std::chrono::milliseconds timeout);
  void do_read();
  void do_write();
  void flush_outbox(boost::system::error_code &ec);
  void fail(const boost::system::error_code &ec);
};

} // namespace lanshare

#endif
