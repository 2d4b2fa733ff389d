#ifndef LANSHARE_TESTS_TEST_SUPPORT_HPP
#define LANSHARE_TESTS_TEST_SUPPORT_HPP

#include "../engine/room_controller.hpp"
#include "../engine/types.hpp"
#include "../net/io_thread.hpp"
#include "../protocol/framing.hpp"
#include "../protocol/message.hpp"
#include "../store/pending_share_store.hpp"
#include "../store/settings_store.hpp"
#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace lanshare::test {

template <typename Pred>
bool wait_until(Pred pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

// Loopback room with short timings. Discovery datagrams go to
// announce_port, which is the other node's discovery_port in pair tests.
inline RoomOptions loopback_options(uint16_t discovery_port,
                                    uint16_t announce_port, uint16_t tcp_first,
                                    uint16_t tcp_last) {
  RoomOptions o;
  o.discovery_port = discovery_port;
  o.announce_port = announce_port;
  o.broadcast_address = "127.0.0.1";
  o.listen_address = "127.0.0.1";
  o.tcp_port_first = tcp_first;
  o.tcp_port_last = tcp_last;
  o.broadcast_interval = std::chrono::milliseconds(200);
  o.heartbeat_interval = std::chrono::milliseconds(300);
  o.dead_window = std::chrono::milliseconds(1500);
  o.ack_timeout = std::chrono::milliseconds(500);
  o.handshake_timeout = std::chrono::milliseconds(1000);
  return o;
}

class TempDir {
public:
  explicit TempDir(const std::string &prefix) {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "-" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};

// Hand-driven peer speaking the line protocol over its own io_context, so
// tests can stay silent, skip acks or drop the connection at will.
class RawPeer {
public:
  RawPeer() : socket_(io_) {}

  bool connect(uint16_t port) {
    boost::system::error_code ec;
    socket_.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
    return !ec;
  }

  // Connects and completes the handshake as peer_id.
  bool join(uint16_t port, const PeerId &peer_id, const std::string &name) {
    if (!connect(port))
      return false;
    send(make_handshake(peer_id, name));
    auto ack = read_until(MessageKind::HandshakeAck);
    return ack.has_value();
  }

  void send(const Message &msg) { send_raw(encode(msg) + "\n"); }

  void send_raw(const std::string &bytes) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
  }

  std::optional<Message>
  read(std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (lines_.empty()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0)
        return std::nullopt;

      bool done = false;
      boost::system::error_code rec;
      std::size_t n = 0;
      socket_.async_read_some(boost::asio::buffer(buf_),
                              [&](boost::system::error_code ec,
                                  std::size_t len) {
                                rec = ec;
                                n = len;
                                done = true;
                              });
      io_.restart();
      io_.run_for(left);
      if (!done) {
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        io_.restart();
        io_.run();
        return std::nullopt;
      }
      if (rec) {
        closed_ = true;
        return std::nullopt;
      }
      for (auto &line : framer_.feed(std::string_view(buf_.data(), n)))
        lines_.push_back(std::move(line));
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return decode(line);
  }

  // Skips other frames (heartbeats and the like).
  std::optional<Message>
  read_until(MessageKind kind,
             std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      auto msg = read(left);
      if (!msg)
        return std::nullopt;
      if (msg->kind == kind)
        return msg;
    }
    return std::nullopt;
  }

  // True once the other side closed the connection.
  bool wait_closed(std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!closed_ && std::chrono::steady_clock::now() < deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      read(left);
    }
    return closed_;
  }

  void close() {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

private:
  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::array<char, 4096> buf_{};
  LineFramer framer_;
  std::deque<std::string> lines_;
  bool closed_{false};
};

// Records every room event; safe to read from the test thread.
class EventLog {
public:
  void attach(RoomEvents &events) {
    events.connection_state.subscribe(
        [this](const ConnectionStateChanged &e) { push(states_, e); });
    events.peer_disconnected.subscribe(
        [this](const PeerDisconnected &e) { push(disconnects_, e); });
    events.article_received.subscribe(
        [this](const ArticleReceived &e) { push(articles_, e); });
    events.articles_received.subscribe(
        [this](const ArticlesReceivedBatch &e) { push(batches_, e); });
    events.echo_response.subscribe(
        [this](const EchoResponse &e) { push(echoes_, e); });
    events.pending_shares.subscribe(
        [this](const PendingSharesChanged &e) { push(pending_, e); });
  }

  std::vector<ConnectionStateChanged> states() { return copy(states_); }
  std::vector<PeerDisconnected> disconnects() { return copy(disconnects_); }
  std::vector<ArticleReceived> articles() { return copy(articles_); }
  std::vector<ArticlesReceivedBatch> batches() { return copy(batches_); }
  std::vector<EchoResponse> echoes() { return copy(echoes_); }
  std::vector<PendingSharesChanged> pending() { return copy(pending_); }

  void clear() {
    std::lock_guard<std::mutex> lock(mx_);
    states_.clear();
    disconnects_.clear();
    articles_.clear();
    batches_.clear();
    echoes_.clear();
    pending_.clear();
  }

private:
  std::mutex mx_;
  std::vector<ConnectionStateChanged> states_;
  std::vector<PeerDisconnected> disconnects_;
  std::vector<ArticleReceived> articles_;
  std::vector<ArticlesReceivedBatch> batches_;
  std::vector<EchoResponse> echoes_;
  std::vector<PendingSharesChanged> pending_;

  template <typename T> void push(std::vector<T> &v, const T &e) {
    std::lock_guard<std::mutex> lock(mx_);
    v.push_back(e);
  }
  template <typename T> std::vector<T> copy(const std::vector<T> &v) {
    std::lock_guard<std::mutex> lock(mx_);
    return v;
  }
};

// One controller with in-memory settings, a private pending-share log and
// its own io thread.
class TestNode {
public:
  TestNode(const std::string &name, const PeerId &peer_id,
           const RoomOptions &options)
      : dir_("lanshare-" + name), pending_(dir_.file("pending.wal")),
        io_thread_(io_) {
    if (!peer_id.empty())
      settings_.save_peer_id(peer_id);
    room_ = std::make_unique<RoomController>(io_, settings_, pending_,
                                             options);
    log_.attach(room_->events());
  }

  ~TestNode() {
    room_->leave_room(false, false);
    io_thread_.stop();
    room_.reset();
  }

  RoomController &room() { return *room_; }
  EventLog &log() { return log_; }
  MemorySettingsStore &settings() { return settings_; }
  WalPendingShareStore &pending() { return pending_; }

  bool connected_to(const PeerId &peer) {
    for (const auto &p : room_->status().peers) {
      if (p.peer_id == peer && p.connected)
        return true;
    }
    return false;
  }

private:
  TempDir dir_;
  MemorySettingsStore settings_;
  WalPendingShareStore pending_;
  EventLog log_;
  boost::asio::io_context io_;
  IoThread io_thread_;
  std::unique_ptr<RoomController> room_;
};

inline Article make_article(int n) {
  return Article{"https://example.com/articles/" + std::to_string(n),
                 "Article " + std::to_string(n), "Example Feed",
                 "https://example.com/feed.xml", std::nullopt};
}

} // namespace lanshare::test

#endif
