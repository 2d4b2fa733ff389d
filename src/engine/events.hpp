#ifndef LANSHARE_ENGINE_EVENTS_HPP
#define LANSHARE_ENGINE_EVENTS_HPP

#include "store/pending_share_store.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace lanshare {

// Observer list for one event type. Handlers run on the emitting thread
// (the room strand) and may unsubscribe themselves.
template <typename Event> class EventChannel {
public:
  using Handler = std::function<void(const Event &)>;
  using Token = uint64_t;

  Token subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mx_);
    Token token = ++last_token_;
    handlers_[token] = std::move(handler);
    return token;
  }

  bool unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mx_);
    return handlers_.erase(token) > 0;
  }

  void emit(const Event &event) {
    std::vector<Handler> snapshot;
    {
      std::lock_guard<std::mutex> lock(mx_);
      snapshot.reserve(handlers_.size());
      for (const auto &[token, handler] : handlers_)
        snapshot.push_back(handler);
    }
    for (const auto &handler : snapshot)
      handler(event);
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mx_);
    return handlers_.size();
  }

private:
  mutable std::mutex mx_;
  std::map<Token, Handler> handlers_;
  Token last_token_{0};
};

struct ConnectionStateChanged {
  RoomStatus status;
};

struct PeerDisconnected {
  PeerId peer_id;
  std::string display_name;
  DisconnectReason reason{DisconnectReason::Error};
};

struct ArticleReceived {
  PeerId peer_id;
  std::string sender_name;
  Article article;
  int64_t timestamp{0};
};

struct ArticlesReceivedBatch {
  PeerId peer_id;
  std::string sender_name;
  std::vector<Article> articles;
  int64_t timestamp{0};
};

struct EchoResponse {
  PeerId peer_id;
  std::string sender_name;
  int64_t round_trip_ms{0};
};

struct PendingSharesChanged {
  PendingShareCounts counts;
};

struct RoomEvents {
  EventChannel<ConnectionStateChanged> connection_state;
  EventChannel<PeerDisconnected> peer_disconnected;
  EventChannel<ArticleReceived> article_received;
  EventChannel<ArticlesReceivedBatch> articles_received;
  EventChannel<EchoResponse> echo_response;
  EventChannel<PendingSharesChanged> pending_shares;
};

} // namespace lanshare

#endif
