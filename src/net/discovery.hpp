#ifndef LANSHARE_NET_DISCOVERY_HPP
#define LANSHARE_NET_DISCOVERY_HPP

#include "engine/types.hpp"
#include "strand.hpp"
#include <array>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lanshare {

struct Announcement {
  enum class Type { Request, Response };

  Type type{Type::Request};
  std::string room_code;
  PeerId peer_id;
  std::string display_name;
  uint16_t tcp_port{0};
  int64_t timestamp{0};
};

std::string encode_announcement(const Announcement &a);
std::optional<Announcement> decode_announcement(std::string_view datagram);

enum class AnnouncementVerdict { Accepted, SelfEcho, ForeignRoom };

const char *to_string(AnnouncementVerdict v);

AnnouncementVerdict classify_announcement(const Announcement &a,
                                          std::string_view active_room,
                                          const PeerId &local_id);

// Of two peers that discover each other, only the one whose id sorts lower
// (plain byte order) dials.
inline bool should_initiate(const PeerId &local, const PeerId &remote) {
  return local < remote;
}

// UDP presence for one room: periodic broadcast announcements and a receive
// loop handing decoded announcements to the owner.
class Discovery {
public:
  using Handler =
      std::function<void(const Announcement &, const std::string &address)>;

  Discovery(Strand strand, const RoomOptions &options, Handler handler);
  ~Discovery();

  Discovery(const Discovery &) = delete;
  Discovery &operator=(const Discovery &) = delete;

  // Binds the discovery port, sends the first announcement and arms the
  // broadcast timer.
  boost::system::error_code start(const std::string &room_code,
                                  const PeerId &local_id,
                                  const std::string &display_name,
                                  uint16_t tcp_port);
  void stop();

  // Unicasts a discovery-response to the given address.
  void respond_to(const std::string &address);

  bool is_open() const { return socket_.is_open(); }
  bool timer_armed() const { return timer_armed_; }

private:
  Strand strand_;
  RoomOptions options_;
  Handler handler_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::steady_timer timer_;
  bool timer_armed_{false};
  uint64_t generation_{0};

  std::array<char, 65536> recv_buffer_;
  boost::asio::ip::udp::endpoint sender_;

  Announcement self_;

  void do_receive();
  void schedule_broadcast();
  void send_to(Announcement::Type type,
               const boost::asio::ip::udp::endpoint &target);
};

} // namespace lanshare

#endif
