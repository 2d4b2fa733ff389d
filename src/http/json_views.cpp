#include "json_views.hpp"

namespace lanshare {

nlohmann::json status_to_json(const RoomStatus &status) {
  nlohmann::json peers = nlohmann::json::array();
  for (const auto &p : status.peers)
    peers.push_back({{"peerId", p.peer_id},
                     {"displayName", p.display_name},
                     {"connected", p.connected}});
  return {{"inRoom", status.in_room},
          {"roomCode", status.room_code ? nlohmann::json(*status.room_code)
                                        : nlohmann::json(nullptr)},
          {"peers", std::move(peers)}};
}

nlohmann::json send_result_to_json(const SendResult &result) {
  nlohmann::json j = {{"success", result.success}, {"queued", result.queued}};
  if (!result.error.empty())
    j["error"] = result.error;
  return j;
}

nlohmann::json pending_share_to_json(const PendingShare &share) {
  nlohmann::json j = {{"id", share.id},
                      {"peerId", share.peer_id},
                      {"peerName", share.peer_name},
                      {"article", article_to_json(share.article)},
                      {"createdAt", share.created_at},
                      {"attempts", share.attempts}};
  j["lastAttempt"] = share.last_attempt ? nlohmann::json(*share.last_attempt)
                                        : nlohmann::json(nullptr);
  return j;
}

nlohmann::json pending_counts_to_json(const PendingShareCounts &counts) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[peer, c] : counts)
    j[peer] = {{"peerName", c.peer_name}, {"count", c.count}};
  return j;
}

nlohmann::json event_to_json(const ConnectionStateChanged &e) {
  return status_to_json(e.status);
}

nlohmann::json event_to_json(const PeerDisconnected &e) {
  return {{"peerId", e.peer_id},
          {"displayName", e.display_name},
          {"reason", to_string(e.reason)}};
}

nlohmann::json event_to_json(const ArticleReceived &e) {
  return {{"peerId", e.peer_id},
          {"senderName", e.sender_name},
          {"article", article_to_json(e.article)},
          {"timestamp", e.timestamp}};
}

nlohmann::json event_to_json(const ArticlesReceivedBatch &e) {
  nlohmann::json articles = nlohmann::json::array();
  for (const auto &a : e.articles)
    articles.push_back(article_to_json(a));
  return {{"peerId", e.peer_id},
          {"senderName", e.sender_name},
          {"articles", std::move(articles)},
          {"timestamp", e.timestamp}};
}

nlohmann::json event_to_json(const EchoResponse &e) {
  return {{"peerId", e.peer_id},
          {"senderName", e.sender_name},
          {"roundTripMs", e.round_trip_ms}};
}

nlohmann::json event_to_json(const PendingSharesChanged &e) {
  return {{"counts", pending_counts_to_json(e.counts)}};
}

} // namespace lanshare
