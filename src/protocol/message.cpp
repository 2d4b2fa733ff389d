#include "message.hpp"
#include <array>
#include <chrono>
#include <utility>

namespace lanshare {

namespace {

struct KindName {
  MessageKind kind;
  std::string_view name;
};

constexpr std::array<KindName, 10> kKindNames{{
    {MessageKind::Handshake, "handshake"},
    {MessageKind::HandshakeAck, "handshake-ack"},
    {MessageKind::ArticleShareBatch, "article-share-batch"},
    {MessageKind::ArticleShareAck, "article-share-ack"},
    {MessageKind::ArticleLink, "article-link"},
    {MessageKind::Heartbeat, "heartbeat"},
    {MessageKind::HeartbeatAck, "heartbeat-ack"},
    {MessageKind::EchoRequest, "echo-request"},
    {MessageKind::EchoResponse, "echo-response"},
    {MessageKind::Goodbye, "goodbye"},
}};

std::optional<std::string> optional_string(const nlohmann::json &j,
                                           const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

} // namespace

std::string_view kind_to_string(MessageKind kind) {
  for (const auto &entry : kKindNames) {
    if (entry.kind == kind)
      return entry.name;
  }
  return "unknown";
}

MessageKind kind_from_string(std::string_view type) {
  for (const auto &entry : kKindNames) {
    if (entry.name == type)
      return entry.kind;
  }
  return MessageKind::Unknown;
}

int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

nlohmann::json article_to_json(const Article &article) {
  nlohmann::json j = {{"url", article.url}, {"title", article.title}};
  if (article.feed_name)
    j["feedName"] = *article.feed_name;
  if (article.feed_url)
    j["feedUrl"] = *article.feed_url;
  if (article.feed_icon_url)
    j["feedIconUrl"] = *article.feed_icon_url;
  return j;
}

Article article_from_json(const nlohmann::json &j) {
  Article a;
  a.url = j.at("url").get<std::string>();
  a.title = j.at("title").get<std::string>();
  a.feed_name = optional_string(j, "feedName");
  a.feed_url = optional_string(j, "feedUrl");
  a.feed_icon_url = optional_string(j, "feedIconUrl");
  return a;
}

nlohmann::json message_to_json(const Message &msg) {
  nlohmann::json j;
  j["type"] = std::string(kind_to_string(msg.kind));

  switch (msg.kind) {
  case MessageKind::Handshake:
  case MessageKind::HandshakeAck:
    j["peerId"] = msg.peer_id;
    j["displayName"] = msg.display_name;
    break;
  case MessageKind::ArticleShareBatch: {
    j["messageId"] = msg.message_id;
    j["senderName"] = msg.sender_name;
    j["timestamp"] = msg.timestamp;
    auto arr = nlohmann::json::array();
    for (const auto &a : msg.articles)
      arr.push_back(article_to_json(a));
    j["articles"] = std::move(arr);
    break;
  }
  case MessageKind::ArticleShareAck:
    j["messageId"] = msg.message_id;
    j["timestamp"] = msg.timestamp;
    break;
  case MessageKind::ArticleLink:
    j["senderName"] = msg.sender_name;
    j["timestamp"] = msg.timestamp;
    if (!msg.articles.empty()) {
      j["url"] = msg.articles.front().url;
      j["title"] = msg.articles.front().title;
    }
    break;
  case MessageKind::EchoRequest:
    j["senderName"] = msg.sender_name;
    j["timestamp"] = msg.timestamp;
    break;
  case MessageKind::EchoResponse:
    j["senderName"] = msg.sender_name;
    j["timestamp"] = msg.timestamp;
    j["echoData"] = {{"originalTimestamp", msg.original_timestamp},
                     {"receivedAt", msg.received_at}};
    break;
  case MessageKind::Goodbye:
    j["peerId"] = msg.peer_id;
    j["timestamp"] = msg.timestamp;
    break;
  case MessageKind::Heartbeat:
  case MessageKind::HeartbeatAck:
  case MessageKind::Unknown:
    j["timestamp"] = msg.timestamp;
    break;
  }
  return j;
}

std::optional<Message> message_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;
  auto type = j.find("type");
  if (type == j.end() || !type->is_string())
    return std::nullopt;

  try {
    Message msg;
    msg.kind = kind_from_string(type->get<std::string>());
    msg.peer_id = j.value("peerId", std::string{});
    msg.display_name = j.value("displayName", std::string{});
    msg.sender_name = j.value("senderName", std::string{});
    msg.message_id = j.value("messageId", std::string{});
    msg.timestamp = j.value("timestamp", int64_t{0});

    if (msg.kind == MessageKind::ArticleShareBatch) {
      auto arr = j.find("articles");
      if (arr == j.end() || !arr->is_array())
        return std::nullopt;
      for (const auto &item : *arr)
        msg.articles.push_back(article_from_json(item));
    } else if (msg.kind == MessageKind::ArticleLink) {
      Article a;
      a.url = j.value("url", std::string{});
      a.title = j.value("title", std::string{});
      if (a.url.empty() || a.title.empty())
        return std::nullopt;
      msg.articles.push_back(std::move(a));
    } else if (msg.kind == MessageKind::EchoResponse) {
      auto echo = j.find("echoData");
      if (echo != j.end() && echo->is_object()) {
        msg.original_timestamp = echo->value("originalTimestamp", int64_t{0});
        msg.received_at = echo->value("receivedAt", int64_t{0});
      }
    }
    return msg;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

std::string encode(const Message &msg) { return message_to_json(msg).dump(); }

std::optional<Message> decode(std::string_view line) {
  auto j = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
  if (j.is_discarded())
    return std::nullopt;
  return message_from_json(j);
}

Message make_handshake(const PeerId &peer_id, const std::string &name) {
  Message m;
  m.kind = MessageKind::Handshake;
  m.peer_id = peer_id;
  m.display_name = name;
  return m;
}

Message make_handshake_ack(const PeerId &peer_id, const std::string &name) {
  Message m = make_handshake(peer_id, name);
  m.kind = MessageKind::HandshakeAck;
  return m;
}

Message make_share_batch(const std::string &message_id,
                         const std::string &sender_name,
                         std::vector<Article> articles) {
  Message m;
  m.kind = MessageKind::ArticleShareBatch;
  m.message_id = message_id;
  m.sender_name = sender_name;
  m.timestamp = now_ms();
  m.articles = std::move(articles);
  return m;
}

Message make_share_ack(const std::string &message_id) {
  Message m;
  m.kind = MessageKind::ArticleShareAck;
  m.message_id = message_id;
  m.timestamp = now_ms();
  return m;
}

Message make_heartbeat() {
  Message m;
  m.kind = MessageKind::Heartbeat;
  m.timestamp = now_ms();
  return m;
}

Message make_heartbeat_ack() {
  Message m;
  m.kind = MessageKind::HeartbeatAck;
  m.timestamp = now_ms();
  return m;
}

Message make_echo_request(const std::string &sender_name) {
  Message m;
  m.kind = MessageKind::EchoRequest;
  m.sender_name = sender_name;
  m.timestamp = now_ms();
  return m;
}

Message make_echo_response(const std::string &sender_name,
                           int64_t original_timestamp) {
  Message m;
  m.kind = MessageKind::EchoResponse;
  m.sender_name = sender_name;
  m.timestamp = now_ms();
  m.original_timestamp = original_timestamp;
  m.received_at = m.timestamp;
  return m;
}

Message make_goodbye(const PeerId &peer_id) {
  Message m;
  m.kind = MessageKind::Goodbye;
  m.peer_id = peer_id;
  m.timestamp = now_ms();
  return m;
}

} // namespace lanshare
