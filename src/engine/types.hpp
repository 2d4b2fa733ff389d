#ifndef LANSHARE_ENGINE_TYPES_HPP
#define LANSHARE_ENGINE_TYPES_HPP

#include "protocol/framing.hpp"
#include "protocol/message.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

using Clock = std::chrono::steady_clock;

constexpr uint16_t kDiscoveryPort = 41899;
constexpr uint16_t kTcpPortFirst = 41900;
constexpr uint16_t kTcpPortLast = 41999;
constexpr int kMaxShareAttempts = 5;

// Network endpoints and timings of one room. Defaults are the production
// values; tests shorten the timings and move everything to loopback.
struct RoomOptions {
  uint16_t discovery_port{kDiscoveryPort};
  uint16_t announce_port{0}; // 0 = same as discovery_port
  std::string broadcast_address{"255.255.255.255"};
  std::string listen_address{"0.0.0.0"};
  uint16_t tcp_port_first{kTcpPortFirst};
  uint16_t tcp_port_last{kTcpPortLast};

  std::chrono::milliseconds broadcast_interval{5000};
  std::chrono::milliseconds heartbeat_interval{5000};
  std::chrono::milliseconds dead_window{15000};
  std::chrono::milliseconds ack_timeout{5000};
  std::chrono::milliseconds handshake_timeout{10000};

  size_t max_frame_bytes{kDefaultMaxFrameBytes};
  int max_share_attempts{kMaxShareAttempts};
  std::string default_display_name{"LanShare"};

  uint16_t effective_announce_port() const {
    return announce_port != 0 ? announce_port : discovery_port;
  }
};

struct DiscoveredPeer {
  PeerId peer_id;
  std::string display_name;
  std::string address;
  uint16_t tcp_port{0};
  Clock::time_point last_seen;
};

struct PeerSummary {
  PeerId peer_id;
  std::string display_name;
  bool connected{false};
};

struct RoomStatus {
  bool in_room{false};
  std::optional<std::string> room_code;
  std::vector<PeerSummary> peers;
};

enum class DisconnectReason { Timeout, Goodbye, Error };

inline const char *to_string(DisconnectReason r) {
  switch (r) {
  case DisconnectReason::Timeout:
    return "timeout";
  case DisconnectReason::Goodbye:
    return "goodbye";
  case DisconnectReason::Error:
    return "error";
  }
  return "unknown";
}

// Outcome of an acknowledged send. queued is true when the articles ended up
// in the pending-share queue.
struct SendResult {
  bool success{false};
  bool queued{false};
  std::string error;
};

// Open handles held by a controller; both are zero after leave_room().
struct ResourceSnapshot {
  size_t sockets{0};
  size_t timers{0};
};

} // namespace lanshare

#endif
