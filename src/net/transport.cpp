#include "transport.hpp"
#include "observability/metrics.hpp"
#include <boost/asio/bind_executor.hpp>
#include <chrono>
#include <iostream>

namespace lanshare {

using boost::asio::ip::tcp;

Transport::Transport(Strand strand, const RoomOptions &options,
                     ITransportListener &listener)
    : strand_(std::move(strand)), options_(options), listener_(listener),
      acceptor_(strand_) {}

Transport::~Transport() { shutdown(); }

void Transport::set_identity(const PeerId &local_id,
                             const std::string &display_name) {
  local_id_ = local_id;
  local_name_ = display_name;
}

boost::system::error_code Transport::listen() {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(options_.listen_address, ec);
  if (ec)
    return ec;

  for (uint32_t p = options_.tcp_port_first; p <= options_.tcp_port_last;
       ++p) {
    tcp::endpoint endpoint(address, static_cast<uint16_t>(p));
    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
      return ec;
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec == boost::asio::error::address_in_use) {
      boost::system::error_code ignored;
      acceptor_.close(ignored);
      continue; // Try next port
    }
    if (!ec)
      acceptor_.listen(tcp::acceptor::max_listen_connections, ec);
    if (ec) {
      boost::system::error_code ignored;
      acceptor_.close(ignored);
      return ec;
    }

    port_ = static_cast<uint16_t>(p);
    ++generation_;
    std::cout << "[Transport] Listening on port " << port_ << std::endl;
    do_accept();
    return {};
  }

  std::cerr << "[Transport] No free TCP port in " << options_.tcp_port_first
            << "-" << options_.tcp_port_last << "\n";
  return boost::asio::error::address_in_use;
}

void Transport::do_accept() {
  acceptor_.async_accept(boost::asio::bind_executor(
      strand_, [this, gen = generation_](boost::system::error_code ec,
                                         tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || gen != generation_)
          return;
        if (!ec) {
          auto link = std::make_shared<PeerLink>(
              std::move(socket), strand_, *this, PeerLink::Direction::Inbound,
              options_.max_frame_bytes);
          std::cout << "[Transport] Incoming connection from "
                    << link->remote_address() << std::endl;
          pending_.insert(link);
          link->start_inbound(options_.handshake_timeout);
        } else {
          std::cerr << "[Transport] Accept failed: " << ec.message() << "\n";
          if (!acceptor_.is_open())
            return;
        }
        do_accept();
      }));
}

void Transport::dial(const PeerId &expected, const std::string &address,
                     uint16_t port) {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    std::cerr << "[Transport] Bad peer address " << address << ": "
              << ec.message() << "\n";
    listener_.on_dial_failed(expected);
    return;
  }

  std::cout << "[Transport] Connecting to " << expected << " at " << address
            << ":" << port << std::endl;
  auto link = std::make_shared<PeerLink>(tcp::socket(strand_), strand_, *this,
                                         PeerLink::Direction::Outbound,
                                         options_.max_frame_bytes);
  link->set_expected_peer(expected);
  pending_.insert(link);
  link->start_outbound(tcp::endpoint(ip, port),
                       make_handshake(local_id_, local_name_),
                       options_.handshake_timeout);
}

void Transport::on_link_message(const std::shared_ptr<PeerLink> &link,
                                const Message &msg) {
  if (link->state() == PeerLink::State::Connected) {
    listener_.on_peer_message(link->peer_id(), msg);
    return;
  }

  if (link->direction() == PeerLink::Direction::Inbound &&
      msg.kind == MessageKind::Handshake) {
    if (msg.peer_id.empty() || msg.peer_id == local_id_) {
      std::cerr << "[Transport] Rejecting handshake from "
                << link->remote_address() << "\n";
      pending_.erase(link);
      link->close();
      return;
    }
    link->send(make_handshake_ack(local_id_, local_name_));
    promote(link, msg.peer_id,
            msg.display_name.empty() ? "Unknown" : msg.display_name);
    return;
  }

  if (link->direction() == PeerLink::Direction::Outbound &&
      msg.kind == MessageKind::HandshakeAck) {
    PeerId peer = msg.peer_id.empty() ? link->expected_peer_id() : msg.peer_id;
    if (peer != link->expected_peer_id())
      std::cerr << "[Transport] Dialed " << link->expected_peer_id()
                << " but " << peer << " answered\n";
    promote(link, peer,
            msg.display_name.empty() ? "Unknown" : msg.display_name);
    return;
  }

  if (auto *m = metrics())
    m->increment_frames_dropped("before_handshake");
}

void Transport::promote(const std::shared_ptr<PeerLink> &link,
                        const PeerId &peer, const std::string &name) {
  pending_.erase(link);
  auto it = links_.find(peer);
  if (it != links_.end() && it->second != link) {
    std::cout << "[Transport] New link from " << peer
              << " replaces the existing one" << std::endl;
    it->second->close();
  }
  link->mark_connected(peer, name);
  links_[peer] = link;
  std::cout << "[Transport] Connected to " << name << " (" << peer << ")"
            << std::endl;
  listener_.on_peer_connected(peer, name, link->remote_address());
}

void Transport::on_link_closed(const std::shared_ptr<PeerLink> &link,
                               const boost::system::error_code &ec) {
  if (pending_.erase(link) > 0) {
    if (link->direction() == PeerLink::Direction::Outbound)
      listener_.on_dial_failed(link->expected_peer_id());
    return;
  }

  auto it = links_.find(link->peer_id());
  if (it == links_.end() || it->second != link)
    return; // Superseded
  links_.erase(it);
  std::cout << "[Transport] Disconnected from " << link->peer_id() << " ("
            << ec.message() << ")" << std::endl;
  listener_.on_peer_lost(link->peer_id(), ec);
}

bool Transport::send(const PeerId &peer, const Message &msg) {
  auto it = links_.find(peer);
  if (it == links_.end())
    return false;
  return it->second->send(msg);
}

bool Transport::send_final(const PeerId &peer, const Message &msg) {
  auto it = links_.find(peer);
  if (it == links_.end())
    return false;
  return it->second->send_final(msg);
}

bool Transport::is_connected(const PeerId &peer) const {
  return links_.contains(peer);
}

std::vector<PeerId> Transport::connected_peers() const {
  std::vector<PeerId> ids;
  ids.reserve(links_.size());
  for (const auto &[id, link] : links_)
    ids.push_back(id);
  return ids;
}

void Transport::drop(const PeerId &peer) {
  auto it = links_.find(peer);
  if (it == links_.end())
    return;
  it->second->close();
  links_.erase(it);
}

void Transport::shutdown() {
  ++generation_;
  if (acceptor_.is_open()) {
    boost::system::error_code ec;
    acceptor_.close(ec);
    std::cout << "[Transport] Stopped listening on port " << port_
              << std::endl;
  }
  port_ = 0;

  for (const auto &link : pending_)
    link->close();
  pending_.clear();
  for (const auto &[id, link] : links_)
    link->close();
  links_.clear();
}

size_t Transport::open_sockets() const {
  size_t n = acceptor_.is_open() ? 1 : 0;
  for (const auto &link : pending_)
    n += link->is_open() ? 1 : 0;
  for (const auto &[id, link] : links_)
    n += link->is_open() ? 1 : 0;
  return n;
}

size_t Transport::armed_timers() const {
  size_t n = 0;
  for (const auto &link : pending_)
    n += link->timer_armed() ? 1 : 0;
  for (const auto &[id, link] : links_)
    n += link->timer_armed() ? 1 : 0;
  return n;
}

} // namespace lanshare
