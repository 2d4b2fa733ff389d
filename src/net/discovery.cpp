#include "discovery.hpp"
#include "observability/metrics.hpp"
#include <boost/asio/bind_executor.hpp>
#include <iostream>
#include <nlohmann/json.hpp>

namespace lanshare {

using boost::asio::ip::udp;

namespace {

constexpr const char *kRequestType = "discovery";
constexpr const char *kResponseType = "discovery-response";

} // namespace

std::string encode_announcement(const Announcement &a) {
  nlohmann::json j = {
      {"type", a.type == Announcement::Type::Request ? kRequestType
                                                     : kResponseType},
      {"roomCode", a.room_code},
      {"peerId", a.peer_id},
      {"displayName", a.display_name},
      {"tcpPort", a.tcp_port},
      {"timestamp", a.timestamp}};
  return j.dump();
}

std::optional<Announcement> decode_announcement(std::string_view datagram) {
  auto j = nlohmann::json::parse(datagram, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    return std::nullopt;

  try {
    Announcement a;
    auto type = j.at("type").get<std::string>();
    if (type == kRequestType)
      a.type = Announcement::Type::Request;
    else if (type == kResponseType)
      a.type = Announcement::Type::Response;
    else
      return std::nullopt;

    a.room_code = j.at("roomCode").get<std::string>();
    a.peer_id = j.at("peerId").get<std::string>();
    a.display_name = j.value("displayName", std::string{});
    auto port = j.at("tcpPort").get<int64_t>();
    if (port <= 0 || port > 65535)
      return std::nullopt;
    a.tcp_port = static_cast<uint16_t>(port);
    a.timestamp = j.value("timestamp", int64_t{0});
    if (a.peer_id.empty())
      return std::nullopt;
    return a;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

const char *to_string(AnnouncementVerdict v) {
  switch (v) {
  case AnnouncementVerdict::Accepted:
    return "accepted";
  case AnnouncementVerdict::SelfEcho:
    return "self";
  case AnnouncementVerdict::ForeignRoom:
    return "foreign_room";
  }
  return "unknown";
}

AnnouncementVerdict classify_announcement(const Announcement &a,
                                          std::string_view active_room,
                                          const PeerId &local_id) {
  if (a.peer_id == local_id)
    return AnnouncementVerdict::SelfEcho;
  if (a.room_code != active_room)
    return AnnouncementVerdict::ForeignRoom;
  return AnnouncementVerdict::Accepted;
}

Discovery::Discovery(Strand strand, const RoomOptions &options,
                     Handler handler)
    : strand_(std::move(strand)), options_(options),
      handler_(std::move(handler)), socket_(strand_), timer_(strand_) {}

Discovery::~Discovery() { stop(); }

boost::system::error_code Discovery::start(const std::string &room_code,
                                           const PeerId &local_id,
                                           const std::string &display_name,
                                           uint16_t tcp_port) {
  stop();

  boost::system::error_code ec;
  socket_.open(udp::v4(), ec);
  if (!ec)
    socket_.set_option(udp::socket::reuse_address(true), ec);
  if (!ec)
    socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (!ec)
    socket_.bind(udp::endpoint(udp::v4(), options_.discovery_port), ec);
  if (ec) {
    std::cerr << "[Discovery] Cannot bind UDP port " << options_.discovery_port
              << ": " << ec.message() << "\n";
    boost::system::error_code ignored;
    socket_.close(ignored);
    return ec;
  }

  self_.room_code = room_code;
  self_.peer_id = local_id;
  self_.display_name = display_name;
  self_.tcp_port = tcp_port;
  ++generation_;

  std::cout << "[Discovery] UDP listening on port " << options_.discovery_port
            << " for room " << room_code << std::endl;

  do_receive();

  auto broadcast = boost::asio::ip::make_address_v4(options_.broadcast_address,
                                                    ec);
  if (ec) {
    std::cerr << "[Discovery] Bad broadcast address "
              << options_.broadcast_address << "\n";
    stop();
    return ec;
  }
  // Send immediately and then periodically
  send_to(Announcement::Type::Request,
          udp::endpoint(broadcast, options_.effective_announce_port()));
  schedule_broadcast();
  return {};
}

void Discovery::stop() {
  ++generation_;
  if (timer_armed_) {
    timer_.cancel();
    timer_armed_ = false;
  }
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.close(ec);
    std::cout << "[Discovery] Stopped" << std::endl;
  }
}

void Discovery::do_receive() {
  socket_.async_receive_from(
      boost::asio::buffer(recv_buffer_), sender_,
      boost::asio::bind_executor(
          strand_, [this, gen = generation_](boost::system::error_code ec,
                                             std::size_t length) {
            if (ec == boost::asio::error::operation_aborted ||
                gen != generation_)
              return;
            if (ec) {
              std::cerr << "[Discovery] Receive failed: " << ec.message()
                        << "\n";
            } else {
              auto a = decode_announcement(
                  std::string_view(recv_buffer_.data(), length));
              if (a) {
                handler_(*a, sender_.address().to_string());
              } else if (auto *m = metrics()) {
                m->increment_discovery("malformed");
              }
            }
            // The handler may have stopped discovery.
            if (gen == generation_ && socket_.is_open())
              do_receive();
          }));
}

void Discovery::schedule_broadcast() {
  timer_armed_ = true;
  timer_.expires_after(options_.broadcast_interval);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [this, gen = generation_](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted || gen != generation_)
          return;
        timer_armed_ = false;
        boost::system::error_code addr_ec;
        auto broadcast = boost::asio::ip::make_address_v4(
            options_.broadcast_address, addr_ec);
        if (!addr_ec)
          send_to(Announcement::Type::Request,
                  udp::endpoint(broadcast, options_.effective_announce_port()));
        schedule_broadcast();
      }));
}

void Discovery::respond_to(const std::string &address) {
  if (!socket_.is_open())
    return;
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address_v4(address, ec);
  if (ec)
    return;
  send_to(Announcement::Type::Response,
          udp::endpoint(ip, options_.effective_announce_port()));
}

void Discovery::send_to(Announcement::Type type, const udp::endpoint &target) {
  Announcement a = self_;
  a.type = type;
  a.timestamp = now_ms();
  std::string data = encode_announcement(a);

  boost::system::error_code ec;
  socket_.send_to(boost::asio::buffer(data), target, 0, ec);
  if (ec)
    std::cerr << "[Discovery] Send to " << target << " failed: "
              << ec.message() << "\n";
}

} // namespace lanshare
