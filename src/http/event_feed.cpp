#include "event_feed.hpp"
#include "json_views.hpp"

namespace lanshare {

void EventFeed::attach(RoomEvents &events) {
  detach();
  events_ = &events;
  tokens_[0] = events.connection_state.subscribe(
      [this](const ConnectionStateChanged &e) {
        push("connection-state-changed", event_to_json(e));
      });
  tokens_[1] =
      events.peer_disconnected.subscribe([this](const PeerDisconnected &e) {
        push("peer-disconnected", event_to_json(e));
      });
  tokens_[2] =
      events.article_received.subscribe([this](const ArticleReceived &e) {
        push("article-received", event_to_json(e));
      });
  tokens_[3] = events.articles_received.subscribe(
      [this](const ArticlesReceivedBatch &e) {
        push("articles-received-batch", event_to_json(e));
      });
  tokens_[4] = events.echo_response.subscribe([this](const EchoResponse &e) {
    push("echo-response", event_to_json(e));
  });
  tokens_[5] =
      events.pending_shares.subscribe([this](const PendingSharesChanged &e) {
        push("pending-shares-changed", event_to_json(e));
      });
}

void EventFeed::detach() {
  if (!events_)
    return;
  events_->connection_state.unsubscribe(tokens_[0]);
  events_->peer_disconnected.unsubscribe(tokens_[1]);
  events_->article_received.unsubscribe(tokens_[2]);
  events_->articles_received.unsubscribe(tokens_[3]);
  events_->echo_response.unsubscribe(tokens_[4]);
  events_->pending_shares.unsubscribe(tokens_[5]);
  events_ = nullptr;
}

void EventFeed::push(std::string type, nlohmann::json data) {
  std::lock_guard<std::mutex> lock(mx_);
  entries_.push_back({++seq_, std::move(type), std::move(data)});
  while (entries_.size() > capacity_)
    entries_.pop_front();
}

nlohmann::json EventFeed::since(uint64_t since) const {
  std::lock_guard<std::mutex> lock(mx_);
  nlohmann::json events = nlohmann::json::array();
  for (const auto &e : entries_) {
    if (e.seq > since)
      events.push_back({{"seq", e.seq}, {"type", e.type}, {"data", e.data}});
  }
  return {{"last", seq_}, {"events", std::move(events)}};
}

uint64_t EventFeed::last_sequence() const {
  std::lock_guard<std::mutex> lock(mx_);
  return seq_;
}

} // namespace lanshare
