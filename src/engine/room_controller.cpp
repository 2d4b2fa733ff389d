#include "room_controller.hpp"
#include "identity.hpp"
#include "observability/metrics.hpp"
#include <boost/asio/dispatch.hpp>
#include <iostream>
#include <memory>

namespace lanshare {

RoomController::RoomController(boost::asio::io_context &io,
                               ISettingsStore &settings,
                               IPendingShareStore &pending, RoomOptions options)
    : io_(io), settings_(settings), pending_(pending),
      options_(std::move(options)),
      strand_(boost::asio::make_strand(
          boost::asio::any_io_executor(io.get_executor()))),
      local_id_(load_or_create_peer_id(settings)),
      transport_(strand_, options_, *this),
      discovery_(strand_, options_,
                 [this](const Announcement &a, const std::string &address) {
                   on_announcement(a, address);
                 }),
      acks_(strand_, options_.ack_timeout),
      liveness_(strand_, options_.heartbeat_interval,
                [this]() { on_liveness_tick(); }) {}

RoomController::~RoomController() {
  run_sync([this]() { do_leave(false, false); });
}

// ---------------------------------------------------------------------------
// Room membership
// ---------------------------------------------------------------------------

bool RoomController::join_room(const std::string &room_code,
                               const std::string &display_name,
                               bool remember) {
  return run_sync(
      [&]() { return do_join(room_code, display_name, remember); });
}

void RoomController::leave_room(bool send_goodbye, bool forget_room) {
  run_sync([&]() { do_leave(send_goodbye, forget_room); });
}

bool RoomController::rejoin_saved_room() {
  return run_sync([this]() {
    std::optional<StoredRoom> saved;
    try {
      saved = settings_.load_room();
    } catch (const StoreError &e) {
      std::cerr << "[Room] Cannot read saved room: " << e.what() << "\n";
      return false;
    }
    if (!saved)
      return false;
    std::cout << "[Room] Rejoining saved room " << saved->room_code
              << std::endl;
    return do_join(saved->room_code, saved->display_name, false);
  });
}

bool RoomController::do_join(const std::string &room_code,
                             const std::string &display_name,
                             bool remember) {
  auto code = normalize_room_code(room_code);
  if (!code) {
    std::cerr << "[Room] Invalid room code \"" << room_code << "\"\n";
    return false;
  }

  if (active_room_)
    do_leave(true, false);

  std::string name = display_name;
  if (name.empty()) {
    try {
      name = settings_.load_display_name();
    } catch (const StoreError &e) {
      std::cerr << "[Room] Cannot read display name: " << e.what() << "\n";
    }
  }
  if (name.empty())
    name = options_.default_display_name;

  active_room_ = *code;
  display_name_ = name;

  if (remember) {
    try {
      settings_.save_room({*code, name});
    } catch (const StoreError &e) {
      std::cerr << "[Room] Cannot save room: " << e.what() << "\n";
    }
  }

  transport_.set_identity(local_id_, display_name_);
  if (auto ec = transport_.listen()) {
    std::cerr << "[Room] Join failed, TCP listener: " << ec.message() << "\n";
    do_leave(false, true);
    return false;
  }
  if (auto ec = discovery_.start(*code, local_id_, display_name_,
                                 transport_.port())) {
    std::cerr << "[Room] Join failed, discovery: " << ec.message() << "\n";
    do_leave(false, true);
    return false;
  }
  liveness_.start();

  std::cout << "[Room] Joined room " << *code << " as " << display_name_
            << " (peer " << local_id_ << ", tcp " << transport_.port() << ")"
            << std::endl;
  notify_connection_state();
  return true;
}

void RoomController::do_leave(bool send_goodbye, bool forget_room) {
  bool was_active = active_room_.has_value() || transport_.open_sockets() > 0 ||
                    discovery_.is_open();

  if (send_goodbye) {
    for (const auto &[peer, info] : connected_)
      transport_.send_final(peer, make_goodbye(local_id_));
  }

  liveness_.stop();
  discovery_.stop();
  acks_.fail_all();
  transport_.shutdown();

  if (auto *m = metrics()) {
    for (size_t i = 0; i < connected_.size(); ++i)
      m->decrement_active_peers();
  }
  connected_.clear();
  discovered_.clear();
  dialing_.clear();
  draining_.clear();

  if (active_room_)
    std::cout << "[Room] Left room " << *active_room_ << std::endl;
  active_room_.reset();

  if (forget_room && was_active) {
    try {
      settings_.clear_room();
    } catch (const StoreError &e) {
      std::cerr << "[Room] Cannot clear saved room: " << e.what() << "\n";
    }
  }
  if (was_active)
    notify_connection_state();
}

RoomStatus RoomController::status() {
  return run_sync([this]() { return snapshot(); });
}

RoomStatus RoomController::snapshot() const {
  RoomStatus s;
  s.in_room = active_room_.has_value();
  s.room_code = active_room_;
  for (const auto &[peer, info] : connected_)
    s.peers.push_back({peer, info.display_name, true});
  for (const auto &[peer, info] : discovered_) {
    if (!connected_.contains(peer))
      s.peers.push_back({peer, info.display_name, false});
  }
  return s;
}

void RoomController::notify_connection_state() {
  events_.connection_state.emit({snapshot()});
}

void RoomController::notify_pending_shares() {
  PendingShareCounts counts;
  try {
    counts = pending_.counts();
  } catch (const StoreError &e) {
    std::cerr << "[Room] Cannot count pending shares: " << e.what() << "\n";
    return;
  }
  events_.pending_shares.emit({std::move(counts)});
}

std::string RoomController::display_name() {
  return run_sync([this]() { return display_name_; });
}

uint16_t RoomController::tcp_port() {
  return run_sync([this]() { return transport_.port(); });
}

ResourceSnapshot RoomController::resources() {
  return run_sync([this]() {
    ResourceSnapshot r;
    r.sockets = transport_.open_sockets() + (discovery_.is_open() ? 1 : 0);
    r.timers = transport_.armed_timers() + acks_.armed_timers() +
               (discovery_.timer_armed() ? 1 : 0) +
               (liveness_.timer_armed() ? 1 : 0);
    return r;
  });
}

size_t RoomController::connect_attempts() {
  return run_sync([this]() { return dials_; });
}

std::string RoomController::name_of(const PeerId &peer) const {
  if (auto it = connected_.find(peer); it != connected_.end())
    return it->second.display_name;
  if (auto it = discovered_.find(peer); it != discovered_.end())
    return it->second.display_name;
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

void RoomController::handle_announcement(const Announcement &announcement,
                                         const std::string &address) {
  run_sync([&]() { on_announcement(announcement, address); });
}

void RoomController::on_announcement(const Announcement &a,
                                     const std::string &address) {
  if (!active_room_)
    return;

  auto verdict = classify_announcement(a, *active_room_, local_id_);
  if (auto *m = metrics())
    m->increment_discovery(to_string(verdict));
  if (verdict != AnnouncementVerdict::Accepted)
    return;

  auto [it, inserted] = discovered_.try_emplace(a.peer_id);
  DiscoveredPeer &peer = it->second;
  peer.peer_id = a.peer_id;
  peer.display_name = a.display_name;
  peer.address = address;
  peer.tcp_port = a.tcp_port;
  peer.last_seen = Clock::now();
  if (inserted) {
    std::cout << "[Discovery] Discovered " << a.display_name << " ("
              << address << ":" << a.tcp_port << ")" << std::endl;
    notify_connection_state();
  }

  if (!transport_.is_connected(a.peer_id) && !dialing_.contains(a.peer_id) &&
      should_initiate(local_id_, a.peer_id)) {
    dialing_.insert(a.peer_id);
    ++dials_;
    transport_.dial(a.peer_id, address, a.tcp_port);
  }

  if (a.type == Announcement::Type::Request)
    discovery_.respond_to(address);
}

// ---------------------------------------------------------------------------
// Peer links
// ---------------------------------------------------------------------------

void RoomController::on_peer_connected(const PeerId &peer,
                                       const std::string &name,
                                       const std::string &address) {
  dialing_.erase(peer);
  auto [it, inserted] = connected_.try_emplace(peer);
  it->second.display_name = name;
  it->second.address = address;
  it->second.last_seen = Clock::now();
  if (inserted) {
    if (auto *m = metrics())
      m->increment_active_peers();
  }
  std::cout << "[Room] Peer " << name << " connected" << std::endl;
  notify_connection_state();
  drain(peer);
}

void RoomController::on_peer_message(const PeerId &peer, const Message &msg) {
  auto it = connected_.find(peer);
  if (it != connected_.end())
    it->second.last_seen = Clock::now();

  switch (msg.kind) {
  case MessageKind::ArticleShareBatch:
    transport_.send(peer, make_share_ack(msg.message_id));
    std::cout << "[Room] Received " << msg.articles.size()
              << " article(s) from " << msg.sender_name << std::endl;
    if (msg.articles.size() == 1) {
      events_.article_received.emit(
          {peer, msg.sender_name, msg.articles.front(), msg.timestamp});
    } else if (msg.articles.size() > 1) {
      events_.articles_received.emit(
          {peer, msg.sender_name, msg.articles, msg.timestamp});
    }
    break;
  case MessageKind::ArticleShareAck:
    if (!acks_.acknowledge(msg.message_id))
      std::cerr << "[Room] Ack for unknown message " << msg.message_id
                << "\n";
    break;
  case MessageKind::ArticleLink:
    if (!msg.articles.empty())
      events_.article_received.emit(
          {peer, msg.sender_name, msg.articles.front(), msg.timestamp});
    break;
  case MessageKind::Heartbeat:
    transport_.send(peer, make_heartbeat_ack());
    break;
  case MessageKind::HeartbeatAck:
    break;
  case MessageKind::EchoRequest:
    transport_.send(peer, make_echo_response(display_name_, msg.timestamp));
    break;
  case MessageKind::EchoResponse: {
    int64_t rtt = now_ms() - msg.original_timestamp;
    std::cout << "[Room] Echo from " << msg.sender_name << ": " << rtt << "ms"
              << std::endl;
    events_.echo_response.emit({peer, msg.sender_name, rtt});
    break;
  }
  case MessageKind::Goodbye:
    std::cout << "[Room] " << name_of(peer) << " left the room" << std::endl;
    transport_.drop(peer);
    remove_peer(peer, DisconnectReason::Goodbye);
    notify_connection_state();
    break;
  case MessageKind::Handshake:
  case MessageKind::HandshakeAck:
    break;
  case MessageKind::Unknown:
    if (auto *m = metrics())
      m->increment_frames_dropped("unknown_type");
    break;
  }
}

void RoomController::on_peer_lost(const PeerId &peer,
                                  const boost::system::error_code &ec) {
  std::cerr << "[Room] Lost " << name_of(peer) << ": " << ec.message() << "\n";
  remove_peer(peer, DisconnectReason::Error);
  notify_connection_state();
}

void RoomController::on_dial_failed(const PeerId &expected) {
  dialing_.erase(expected);
  std::cerr << "[Room] Could not connect to " << name_of(expected)
            << ", waiting for the next announcement\n";
}

void RoomController::remove_peer(const PeerId &peer, DisconnectReason reason) {
  auto it = connected_.find(peer);
  if (it == connected_.end())
    return;
  std::string name = it->second.display_name;
  connected_.erase(it);
  discovered_.erase(peer);
  draining_.erase(peer);
  if (auto *m = metrics())
    m->decrement_active_peers();
  events_.peer_disconnected.emit({peer, name, reason});
}

void RoomController::on_liveness_tick() {
  std::map<PeerId, Clock::time_point> last_seen;
  for (const auto &[peer, info] : connected_)
    last_seen[peer] = info.last_seen;

  auto sweep = sweep_liveness(last_seen, Clock::now(), options_.dead_window);
  for (const auto &peer : sweep.expired) {
    std::cerr << "[Room] " << name_of(peer) << " timed out\n";
    transport_.drop(peer);
    remove_peer(peer, DisconnectReason::Timeout);
  }
  for (const auto &peer : sweep.ping)
    transport_.send(peer, make_heartbeat());
  if (!sweep.expired.empty())
    notify_connection_state();
}

// ---------------------------------------------------------------------------
// Sending
// ---------------------------------------------------------------------------

size_t RoomController::broadcast(const Message &msg) {
  return run_sync([&]() {
    size_t sent = 0;
    for (const auto &peer : transport_.connected_peers())
      sent += transport_.send(peer, msg) ? 1 : 0;
    return sent;
  });
}

bool RoomController::send_to_peer(const PeerId &peer, const Message &msg) {
  return run_sync([&]() { return transport_.send(peer, msg); });
}

bool RoomController::send_echo(const PeerId &peer) {
  return run_sync([&]() {
    return transport_.send(peer, make_echo_request(display_name_));
  });
}

void RoomController::send_articles_with_ack(const PeerId &peer,
                                            std::vector<Article> articles,
                                            bool queue_on_failure,
                                            SendCallback done) {
  boost::asio::dispatch(
      strand_, [this, peer, articles = std::move(articles), queue_on_failure,
                done = std::move(done)]() mutable {
        send_with_ack(peer, name_of(peer), std::move(articles),
                      queue_on_failure, std::move(done));
      });
}

void RoomController::send_article_with_queue(const PeerId &peer,
                                             const std::string &peer_name,
                                             const Article &article,
                                             SendCallback done) {
  boost::asio::dispatch(strand_, [this, peer, peer_name, article,
                                  done = std::move(done)]() mutable {
    if (!is_valid_share_url(article.url)) {
      std::cerr << "[Room] Refusing to share " << article.url << "\n";
      if (done)
        done({false, false, "invalid article url"});
      return;
    }
    std::string name = peer_name.empty() ? name_of(peer) : peer_name;
    send_with_ack(peer, name, {article}, true, std::move(done));
  });
}

void RoomController::broadcast_articles_with_ack(std::vector<Article> articles,
                                                 bool queue_on_failure,
                                                 BroadcastCallback done) {
  boost::asio::dispatch(strand_, [this, articles = std::move(articles),
                                  queue_on_failure,
                                  done = std::move(done)]() mutable {
    auto peers = transport_.connected_peers();
    if (peers.empty()) {
      if (done)
        done({});
      return;
    }

    struct Fanout {
      std::map<PeerId, SendResult> results;
      size_t remaining;
      BroadcastCallback done;
    };
    auto state = std::make_shared<Fanout>();
    state->remaining = peers.size();
    state->done = std::move(done);

    for (const auto &peer : peers) {
      send_with_ack(peer, name_of(peer), articles, queue_on_failure,
                    [state, peer](const SendResult &r) {
                      state->results[peer] = r;
                      if (--state->remaining == 0 && state->done)
                        state->done(state->results);
                    });
    }
  });
}

void RoomController::send_with_ack(const PeerId &peer,
                                   const std::string &peer_name,
                                   std::vector<Article> articles,
                                   bool queue_on_failure, SendCallback done) {
  if (!transport_.is_connected(peer)) {
    SendResult r{false, false, "peer not connected"};
    if (queue_on_failure)
      r.queued = queue_articles(peer, peer_name, articles, r.error);
    if (done)
      done(r);
    return;
  }

  std::string id = acks_.next_message_id();
  transport_.send(peer, make_share_batch(id, display_name_, articles));
  acks_.track(id, peer,
              [this, peer, peer_name, articles = std::move(articles),
               queue_on_failure, done = std::move(done)](AckOutcome outcome) {
                SendResult r;
                if (outcome == AckOutcome::Acknowledged) {
                  r.success = true;
                } else {
                  r.error = outcome == AckOutcome::TimedOut ? "ack timeout"
                                                            : "cancelled";
                  if (queue_on_failure)
                    r.queued = queue_articles(peer, peer_name, articles,
                                              r.error);
                }
                if (done)
                  done(r);
              });
}

bool RoomController::queue_articles(const PeerId &peer,
                                    const std::string &peer_name,
                                    const std::vector<Article> &articles,
                                    std::string &error) {
  size_t added = 0;
  try {
    for (const auto &article : articles) {
      pending_.add(peer, peer_name, article);
      ++added;
    }
  } catch (const StoreError &e) {
    std::cerr << "[Room] Cannot queue share for " << peer_name << ": "
              << e.what() << "\n";
    error = e.what();
  }
  if (added > 0) {
    if (auto *m = metrics())
      m->increment_pending_shares("queued", added);
    notify_pending_shares();
  }
  return added == articles.size();
}

// ---------------------------------------------------------------------------
// Pending shares
// ---------------------------------------------------------------------------

bool RoomController::process_pending_shares_for_peer(const PeerId &peer) {
  return run_sync([&]() { return drain(peer); });
}

bool RoomController::drain(const PeerId &peer) {
  if (draining_.contains(peer) || !transport_.is_connected(peer))
    return false;

  std::vector<PendingShare> rows;
  try {
    rows = pending_.list_for_peer(peer);
  } catch (const StoreError &e) {
    std::cerr << "[Room] Cannot read pending shares: " << e.what() << "\n";
    return false;
  }
  if (rows.empty())
    return false;

  std::vector<Article> articles;
  std::vector<int64_t> ids;
  for (const auto &row : rows) {
    articles.push_back(row.article);
    ids.push_back(row.id);
  }
  std::cout << "[Room] Delivering " << rows.size() << " pending share(s) to "
            << name_of(peer) << std::endl;

  draining_.insert(peer);
  send_with_ack(
      peer, name_of(peer), std::move(articles), false,
      [this, peer, ids](const SendResult &r) {
        draining_.erase(peer);
        size_t removed = 0;
        try {
          if (r.success) {
            for (auto id : ids)
              removed += pending_.remove(id) ? 1 : 0;
            if (auto *m = metrics())
              m->increment_pending_shares("delivered", removed);
          } else {
            for (auto id : ids) {
              int attempts = pending_.increment_attempts(id);
              if (attempts >= options_.max_share_attempts &&
                  pending_.remove(id)) {
                ++removed;
                if (auto *m = metrics())
                  m->increment_pending_shares("discarded", 1);
              }
            }
            std::cerr << "[Room] Pending share delivery to " << peer
                      << " failed: " << r.error << "\n";
          }
        } catch (const StoreError &e) {
          std::cerr << "[Room] Cannot update pending shares: " << e.what()
                    << "\n";
        }
        notify_pending_shares();
      });
  return true;
}

PendingShareCounts RoomController::pending_share_counts() {
  return run_sync([this]() { return pending_.counts(); });
}

std::vector<PendingShare> RoomController::pending_shares() {
  return run_sync([this]() { return pending_.list_all(); });
}

bool RoomController::remove_pending_share(int64_t id) {
  return run_sync([&]() {
    bool removed = pending_.remove(id);
    if (removed)
      notify_pending_shares();
    return removed;
  });
}

size_t RoomController::remove_pending_shares_for_peer(const PeerId &peer) {
  return run_sync([&]() {
    size_t removed = pending_.remove_for_peer(peer);
    if (removed > 0)
      notify_pending_shares();
    return removed;
  });
}

size_t RoomController::clear_pending_shares_older_than(int days) {
  return run_sync([&]() {
    size_t removed = pending_.remove_older_than(days);
    if (removed > 0) {
      if (auto *m = metrics())
        m->increment_pending_shares("evicted", removed);
      notify_pending_shares();
    }
    return removed;
  });
}

} // namespace lanshare
