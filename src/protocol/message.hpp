#ifndef LANSHARE_PROTOCOL_MESSAGE_HPP
#define LANSHARE_PROTOCOL_MESSAGE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanshare {

using PeerId = std::string;

struct Article {
  std::string url;
  std::string title;
  std::optional<std::string> feed_name;
  std::optional<std::string> feed_url;
  std::optional<std::string> feed_icon_url;

  bool operator==(const Article &o) const {
    return url == o.url && title == o.title && feed_name == o.feed_name &&
           feed_url == o.feed_url && feed_icon_url == o.feed_icon_url;
  }
};

enum class MessageKind {
  Handshake,
  HandshakeAck,
  ArticleShareBatch,
  ArticleShareAck,
  ArticleLink, // Legacy single-article share
  Heartbeat,
  HeartbeatAck,
  EchoRequest,
  EchoResponse,
  Goodbye,
  Unknown
};

std::string_view kind_to_string(MessageKind kind);
MessageKind kind_from_string(std::string_view type);

// One frame on a peer link. Fields not used by a kind stay empty.
struct Message {
  MessageKind kind{MessageKind::Unknown};
  std::string peer_id;      // handshake, handshake-ack, goodbye
  std::string display_name; // handshake, handshake-ack
  std::string sender_name;  // shares, echo
  std::string message_id;   // article-share-batch, article-share-ack
  int64_t timestamp{0};     // epoch millis at the sender
  std::vector<Article> articles;
  int64_t original_timestamp{0}; // echo-response
  int64_t received_at{0};        // echo-response
};

int64_t now_ms();

nlohmann::json article_to_json(const Article &article);
// Throws nlohmann::json::exception on missing url/title.
Article article_from_json(const nlohmann::json &j);

nlohmann::json message_to_json(const Message &msg);
// Returns nullopt when the object has no string "type" or a field has the
// wrong type. Unknown types decode to MessageKind::Unknown.
std::optional<Message> message_from_json(const nlohmann::json &j);

// Single JSON line, without the trailing newline.
std::string encode(const Message &msg);
std::optional<Message> decode(std::string_view line);

Message make_handshake(const PeerId &peer_id, const std::string &name);
Message make_handshake_ack(const PeerId &peer_id, const std::string &name);
Message make_share_batch(const std::string &message_id,
                         const std::string &sender_name,
                         std::vector<Article> articles);
Message make_share_ack(const std::string &message_id);
Message make_heartbeat();
Message make_heartbeat_ack();
Message make_echo_request(const std::string &sender_name);
Message make_echo_response(const std::string &sender_name,
                           int64_t original_timestamp);
Message make_goodbye(const PeerId &peer_id);

} // namespace lanshare

#endif
