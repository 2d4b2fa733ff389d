#ifndef LANSHARE_HTTP_CONTROL_API_HPP
#define LANSHARE_HTTP_CONTROL_API_HPP

#include "engine/room_controller.hpp"
#include "event_feed.hpp"
#include <boost/beast/http.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace lanshare {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse =
    boost::beast::http::response<boost::beast::http::string_body>;

std::map<std::string, std::string> parse_query(std::string_view query);

// JSON routes over a RoomController. Most requests are answered before
// handle() returns; acknowledged sends reply later from the room strand.
class ControlApi {
public:
  using Reply = std::function<void(HttpResponse)>;

  ControlApi(RoomController &room, EventFeed &feed) : room_(room), feed_(feed) {}

  void handle(const HttpRequest &req, Reply reply);

private:
  RoomController &room_;
  EventFeed &feed_;

  void route(const HttpRequest &req, const Reply &reply);
};

} // namespace lanshare

#endif
