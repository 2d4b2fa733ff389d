#include "control_api.hpp"
#include "engine/identity.hpp"
#include "json_views.hpp"
#include "observability/simple_metrics.hpp"
#include <iostream>
#include <vector>

namespace lanshare {

namespace http = boost::beast::http;

namespace {

HttpResponse json_response(http::status status, const HttpRequest &req,
                           const nlohmann::json &body) {
  HttpResponse res{status, req.version()};
  res.set(http::field::server, "LanShare");
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = body.dump();
  res.prepare_payload();
  return res;
}

HttpResponse error_response(http::status status, const HttpRequest &req,
                            std::string_view why) {
  return json_response(status, req, {{"error", std::string(why)}});
}

std::vector<std::string> split_path(std::string_view path) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos < path.size()) {
    size_t slash = path.find('/', pos);
    if (slash == std::string_view::npos)
      slash = path.size();
    if (slash > pos)
      parts.emplace_back(path.substr(pos, slash - pos));
    pos = slash + 1;
  }
  return parts;
}

std::vector<Article> articles_from(const nlohmann::json &j) {
  std::vector<Article> articles;
  for (const auto &a : j.at("articles"))
    articles.push_back(article_from_json(a));
  return articles;
}

} // namespace

std::map<std::string, std::string> parse_query(std::string_view query) {
  std::map<std::string, std::string> res;
  size_t pos = 0;
  while (pos < query.size()) {
    size_t eq = query.find('=', pos);
    if (eq == std::string_view::npos)
      break;
    size_t amp = query.find('&', eq);
    if (amp == std::string_view::npos)
      amp = query.size();
    std::string k(query.substr(pos, eq - pos));
    std::string v(query.substr(eq + 1, amp - eq - 1));
    res[k] = v;
    pos = amp + 1;
  }
  return res;
}

void ControlApi::handle(const HttpRequest &req, Reply reply) {
  try {
    route(req, reply);
  } catch (const StoreError &e) {
    std::cerr << "[Control] Storage error: " << e.what() << "\n";
    reply(error_response(http::status::internal_server_error, req, e.what()));
  } catch (const nlohmann::json::exception &e) {
    reply(error_response(http::status::bad_request, req, e.what()));
  } catch (const std::invalid_argument &e) {
    reply(error_response(http::status::bad_request, req, e.what()));
  } catch (const std::out_of_range &e) {
    reply(error_response(http::status::bad_request, req, e.what()));
  }
}

void ControlApi::route(const HttpRequest &req, const Reply &reply) {
  std::string target(req.target());
  std::string_view path = target;
  std::map<std::string, std::string> query;
  if (auto q = target.find('?'); q != std::string::npos) {
    path = std::string_view(target).substr(0, q);
    query = parse_query(std::string_view(target).substr(q + 1));
  }
  auto parts = split_path(path);
  auto method = req.method();

  nlohmann::json body = nlohmann::json::object();
  if (!req.body().empty()) {
    body = nlohmann::json::parse(req.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object())
      return reply(
          error_response(http::status::bad_request, req, "invalid JSON body"));
  }

  auto ok = [&](const nlohmann::json &j) {
    reply(json_response(http::status::ok, req, j));
  };
  // Deferred replies outlive this call, so they keep their own request copy.
  auto deferred = [reply, version = req.version(),
                   keep_alive = req.keep_alive()](const nlohmann::json &j) {
    HttpRequest head{http::verb::get, "/", version};
    head.keep_alive(keep_alive);
    reply(json_response(http::status::ok, head, j));
  };

  if (method == http::verb::get && path == "/status") {
    auto j = status_to_json(room_.status());
    j["peerId"] = room_.local_peer_id();
    j["displayName"] = room_.display_name();
    j["tcpPort"] = room_.tcp_port();
    return ok(j);
  }

  if (method == http::verb::post && path == "/room/join") {
    if (!body.contains("roomCode"))
      return reply(
          error_response(http::status::bad_request, req, "missing roomCode"));
    bool joined = room_.join_room(body["roomCode"].get<std::string>(),
                                  body.value("displayName", std::string{}));
    return ok({{"success", joined}});
  }

  if (method == http::verb::post && path == "/room/leave") {
    room_.leave_room(body.value("sendGoodbye", true), true);
    return ok({{"success", true}});
  }

  if (method == http::verb::get && path == "/room/code")
    return ok({{"roomCode", generate_room_code()}});

  if (method == http::verb::post && path == "/broadcast") {
    auto msg = message_from_json(body.value("message", nlohmann::json()));
    if (!msg || msg->kind == MessageKind::Unknown)
      return reply(
          error_response(http::status::bad_request, req, "invalid message"));
    return ok({{"sent", room_.broadcast(*msg)}});
  }

  if (method == http::verb::post && path == "/articles/broadcast") {
    auto articles = articles_from(body);
    room_.broadcast_articles_with_ack(
        std::move(articles), body.value("queueOnFailure", true),
        [deferred](const std::map<PeerId, SendResult> &results) {
          nlohmann::json j = nlohmann::json::object();
          for (const auto &[peer, r] : results)
            j[peer] = send_result_to_json(r);
          deferred({{"results", j}});
        });
    return;
  }

  // /peers/{id}/...
  if (method == http::verb::post && parts.size() == 3 && parts[0] == "peers") {
    const PeerId &peer = parts[1];
    const std::string &action = parts[2];

    if (action == "message") {
      auto msg = message_from_json(body.value("message", nlohmann::json()));
      if (!msg || msg->kind == MessageKind::Unknown)
        return reply(
            error_response(http::status::bad_request, req, "invalid message"));
      return ok({{"success", room_.send_to_peer(peer, *msg)}});
    }
    if (action == "echo")
      return ok({{"success", room_.send_echo(peer)}});
    if (action == "articles") {
      auto articles = articles_from(body);
      room_.send_articles_with_ack(
          peer, std::move(articles), body.value("queueOnFailure", false),
          [deferred](const SendResult &r) {
            deferred(send_result_to_json(r));
          });
      return;
    }
    if (action == "share") {
      Article article = article_from_json(body);
      room_.send_article_with_queue(
          peer, body.value("peerName", std::string{}), article,
          [deferred](const SendResult &r) {
            deferred(send_result_to_json(r));
          });
      return;
    }
  }

  if (method == http::verb::get && path == "/pending") {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto &share : room_.pending_shares())
      rows.push_back(pending_share_to_json(share));
    return ok(rows);
  }

  if (method == http::verb::get && path == "/pending/counts")
    return ok(pending_counts_to_json(room_.pending_share_counts()));

  if (method == http::verb::post && path == "/pending/cleanup") {
    int days = query.contains("days") ? std::stoi(query["days"]) : 30;
    if (days < 0)
      return reply(
          error_response(http::status::bad_request, req, "days is negative"));
    return ok({{"removed", room_.clear_pending_shares_older_than(days)}});
  }

  if (method == http::verb::delete_ && parts.size() == 2 &&
      parts[0] == "pending") {
    int64_t id = std::stoll(parts[1]);
    if (!room_.remove_pending_share(id))
      return reply(error_response(http::status::not_found, req,
                                  "no such pending share"));
    return ok({{"success", true}});
  }

  if (method == http::verb::delete_ && parts.size() == 3 &&
      parts[0] == "pending" && parts[1] == "peer") {
    return ok({{"removed", room_.remove_pending_shares_for_peer(parts[2])}});
  }

  if (method == http::verb::get && path == "/events") {
    uint64_t since = query.contains("since") ? std::stoull(query["since"]) : 0;
    return ok(feed_.since(since));
  }

  if (method == http::verb::get && path == "/metrics") {
    if (auto *sm = dynamic_cast<SimpleMetrics *>(metrics())) {
      HttpResponse res{http::status::ok, req.version()};
      res.set(http::field::server, "LanShare");
      res.set(http::field::content_type, "application/json");
      res.keep_alive(req.keep_alive());
      res.body() = sm->get_json();
      res.prepare_payload();
      return reply(std::move(res));
    }
    return ok(nlohmann::json::object());
  }

  reply(error_response(http::status::not_found, req, "unknown route"));
}

} // namespace lanshare
