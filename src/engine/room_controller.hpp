#ifndef LANSHARE_ENGINE_ROOM_CONTROLLER_HPP
#define LANSHARE_ENGINE_ROOM_CONTROLLER_HPP

#include "events.hpp"
#include "liveness_monitor.hpp"
#include "net/discovery.hpp"
#include "net/strand.hpp"
#include "net/transport.hpp"
#include "protocol/ack_tracker.hpp"
#include "store/pending_share_store.hpp"
#include "store/settings_store.hpp"
#include "types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

namespace lanshare {

// Owns one room membership: discovery, the peer links, acknowledged sends,
// the pending-share queue and liveness. All state lives on a single strand
// of the caller's io_context.
//
// Synchronous methods may be called from any thread. Completion callbacks
// and events are delivered on the strand. The io_context must be running
// (or stopped) while a synchronous method is called, and stopped or idle
// before the controller is destroyed.
class RoomController : public ITransportListener {
public:
  using SendCallback = std::function<void(const SendResult &)>;
  using BroadcastCallback =
      std::function<void(const std::map<PeerId, SendResult> &)>;

  RoomController(boost::asio::io_context &io, ISettingsStore &settings,
                 IPendingShareStore &pending, RoomOptions options = {});
  ~RoomController() override;

  RoomController(const RoomController &) = delete;
  RoomController &operator=(const RoomController &) = delete;

  // Leaves any current room first. remember=false skips saving the room.
  bool join_room(const std::string &room_code, const std::string &display_name,
                 bool remember = true);
  void leave_room(bool send_goodbye = true, bool forget_room = true);
  // Joins the saved room without re-saving it; forgets it on failure.
  bool rejoin_saved_room();

  RoomStatus status();

  // Returns the number of peers the message was queued for.
  size_t broadcast(const Message &msg);
  bool send_to_peer(const PeerId &peer, const Message &msg);
  bool send_echo(const PeerId &peer);

  void send_articles_with_ack(const PeerId &peer, std::vector<Article> articles,
                              bool queue_on_failure, SendCallback done);
  void send_article_with_queue(const PeerId &peer, const std::string &peer_name,
                               const Article &article, SendCallback done);
  // done receives one result per peer connected when the call was made.
  void broadcast_articles_with_ack(std::vector<Article> articles,
                                   bool queue_on_failure,
                                   BroadcastCallback done);

  // Sends everything queued for a connected peer as one batch. False when
  // nothing was sent (offline, empty queue, or a drain already running).
  bool process_pending_shares_for_peer(const PeerId &peer);

  PendingShareCounts pending_share_counts();
  std::vector<PendingShare> pending_shares();
  bool remove_pending_share(int64_t id);
  size_t remove_pending_shares_for_peer(const PeerId &peer);
  size_t clear_pending_shares_older_than(int days);

  // Entry point for decoded discovery datagrams.
  void handle_announcement(const Announcement &announcement,
                           const std::string &address);

  RoomEvents &events() { return events_; }
  const PeerId &local_peer_id() const { return local_id_; }
  std::string display_name();
  uint16_t tcp_port();
  ResourceSnapshot resources();
  // Outbound dials started since construction.
  size_t connect_attempts();

  void on_peer_connected(const PeerId &peer, const std::string &name,
                         const std::string &address) override;
  void on_peer_message(const PeerId &peer, const Message &msg) override;
  void on_peer_lost(const PeerId &peer,
                    const boost::system::error_code &ec) override;
  void on_dial_failed(const PeerId &expected) override;

private:
  struct ConnectedPeer {
    std::string display_name;
    std::string address;
    Clock::time_point last_seen;
  };

  boost::asio::io_context &io_;
  ISettingsStore &settings_;
  IPendingShareStore &pending_;
  RoomOptions options_;
  Strand strand_;
  PeerId local_id_;
  RoomEvents events_;

  Transport transport_;
  Discovery discovery_;
  AckTracker acks_;
  LivenessMonitor liveness_;

  std::optional<std::string> active_room_;
  std::string display_name_;
  std::map<PeerId, DiscoveredPeer> discovered_;
  std::map<PeerId, ConnectedPeer> connected_;
  std::set<PeerId> dialing_;
  std::set<PeerId> draining_;
  size_t dials_{0};

  template <typename F> std::invoke_result_t<F> run_sync(F &&f) {
    if (strand_.running_in_this_thread() || io_.stopped())
      return f();
    std::packaged_task<std::invoke_result_t<F>()> task(std::forward<F>(f));
    auto result = task.get_future();
    boost::asio::post(strand_, [&task]() { task(); });
    return result.get();
  }

  bool do_join(const std::string &room_code, const std::string &display_name,
               bool remember);
  void do_leave(bool send_goodbye, bool forget_room);
  RoomStatus snapshot() const;
  void notify_connection_state();
  void notify_pending_shares();

  void on_announcement(const Announcement &a, const std::string &address);
  void on_liveness_tick();
  void remove_peer(const PeerId &peer, DisconnectReason reason);

  void send_with_ack(const PeerId &peer, const std::string &peer_name,
                     std::vector<Article> articles, bool queue_on_failure,
                     SendCallback done);
  bool queue_articles(const PeerId &peer, const std::string &peer_name,
                      const std::vector<Article> &articles, std::string &error);
  bool drain(const PeerId &peer);
  std::string name_of(const PeerId &peer) const;
};

} // namespace lanshare

#endif
