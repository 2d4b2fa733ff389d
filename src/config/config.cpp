#include "config.hpp"
#include <fstream>
#include <limits>

namespace lanshare {

namespace {

uint16_t to_port(int64_t value, const std::string &what) {
  if (value <= 0 || value > std::numeric_limits<uint16_t>::max())
    throw ConfigError(what + " must be a port number, got " +
                      std::to_string(value));
  return static_cast<uint16_t>(value);
}

std::chrono::milliseconds to_interval(int64_t value, const std::string &what) {
  if (value <= 0)
    throw ConfigError(what + " must be positive");
  return std::chrono::milliseconds(value);
}

int64_t parse_int(const std::string &text, const std::string &what) {
  try {
    size_t used = 0;
    int64_t v = std::stoll(text, &used);
    if (used != text.size())
      throw ConfigError(what + ": trailing characters in \"" + text + "\"");
    return v;
  } catch (const std::invalid_argument &) {
    throw ConfigError(what + ": not a number \"" + text + "\"");
  } catch (const std::out_of_range &) {
    throw ConfigError(what + ": out of range \"" + text + "\"");
  }
}

void apply_room_json(RoomOptions &room, const nlohmann::json &j) {
  if (j.contains("discoveryPort"))
    room.discovery_port =
        to_port(j["discoveryPort"].get<int64_t>(), "room.discoveryPort");
  if (j.contains("announcePort"))
    room.announce_port =
        to_port(j["announcePort"].get<int64_t>(), "room.announcePort");
  if (j.contains("broadcastAddress"))
    room.broadcast_address = j["broadcastAddress"].get<std::string>();
  if (j.contains("listenAddress"))
    room.listen_address = j["listenAddress"].get<std::string>();
  if (j.contains("tcpPortFirst"))
    room.tcp_port_first =
        to_port(j["tcpPortFirst"].get<int64_t>(), "room.tcpPortFirst");
  if (j.contains("tcpPortLast"))
    room.tcp_port_last =
        to_port(j["tcpPortLast"].get<int64_t>(), "room.tcpPortLast");
  if (j.contains("broadcastIntervalMs"))
    room.broadcast_interval = to_interval(
        j["broadcastIntervalMs"].get<int64_t>(), "room.broadcastIntervalMs");
  if (j.contains("heartbeatIntervalMs"))
    room.heartbeat_interval = to_interval(
        j["heartbeatIntervalMs"].get<int64_t>(), "room.heartbeatIntervalMs");
  if (j.contains("deadWindowMs"))
    room.dead_window =
        to_interval(j["deadWindowMs"].get<int64_t>(), "room.deadWindowMs");
  if (j.contains("ackTimeoutMs"))
    room.ack_timeout =
        to_interval(j["ackTimeoutMs"].get<int64_t>(), "room.ackTimeoutMs");
  if (j.contains("handshakeTimeoutMs"))
    room.handshake_timeout = to_interval(
        j["handshakeTimeoutMs"].get<int64_t>(), "room.handshakeTimeoutMs");
  if (j.contains("maxFrameBytes")) {
    auto v = j["maxFrameBytes"].get<int64_t>();
    if (v < 1024)
      throw ConfigError("room.maxFrameBytes must be at least 1024");
    room.max_frame_bytes = static_cast<size_t>(v);
  }
  if (j.contains("maxShareAttempts")) {
    auto v = j["maxShareAttempts"].get<int>();
    if (v < 1)
      throw ConfigError("room.maxShareAttempts must be at least 1");
    room.max_share_attempts = v;
  }
  if (j.contains("defaultDisplayName"))
    room.default_display_name = j["defaultDisplayName"].get<std::string>();

  if (room.tcp_port_first > room.tcp_port_last)
    throw ConfigError("room.tcpPortFirst is above room.tcpPortLast");
}

} // namespace

void apply_config_json(DaemonConfig &config, const nlohmann::json &j) {
  if (!j.is_object())
    throw ConfigError("configuration must be a JSON object");
  try {
    if (j.contains("dataDir"))
      config.data_dir = j["dataDir"].get<std::string>();
    if (j.contains("httpAddress"))
      config.http_address = j["httpAddress"].get<std::string>();
    if (j.contains("httpPort"))
      config.http_port = to_port(j["httpPort"].get<int64_t>(), "httpPort");
    if (j.contains("autoRejoin"))
      config.auto_rejoin = j["autoRejoin"].get<bool>();
    if (j.contains("rejoinDelayMs"))
      config.rejoin_delay =
          to_interval(j["rejoinDelayMs"].get<int64_t>(), "rejoinDelayMs");
    if (j.contains("pendingMaxAgeDays")) {
      config.pending_max_age_days = j["pendingMaxAgeDays"].get<int>();
      if (config.pending_max_age_days < 1)
        throw ConfigError("pendingMaxAgeDays must be at least 1");
    }
    if (j.contains("room"))
      apply_room_json(config.room, j["room"]);
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("bad configuration value: ") + e.what());
  }
}

DaemonConfig load_config_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigError("cannot open config file " + path);
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded())
    throw ConfigError("config file " + path + " is not valid JSON");
  DaemonConfig config;
  apply_config_json(config, j);
  return config;
}

bool parse_command_line(const std::vector<std::string> &args,
                        DaemonConfig &config) {
  auto value_of = [&](size_t &i) -> const std::string & {
    if (i + 1 >= args.size())
      throw ConfigError("missing value for " + args[i]);
    return args[++i];
  };

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config")
      config = load_config_file(value_of(i));
  }

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--help" || arg == "-h") {
      return false;
    } else if (arg == "--config") {
      ++i;
    } else if (arg == "--data-dir") {
      config.data_dir = value_of(i);
    } else if (arg == "--http-port") {
      config.http_port = to_port(parse_int(value_of(i), arg), arg);
    } else if (arg == "--http-address") {
      config.http_address = value_of(i);
    } else if (arg == "--discovery-port") {
      config.room.discovery_port = to_port(parse_int(value_of(i), arg), arg);
    } else if (arg == "--broadcast-address") {
      config.room.broadcast_address = value_of(i);
    } else if (arg == "--no-rejoin") {
      config.auto_rejoin = false;
    } else {
      throw ConfigError("unknown option " + arg);
    }
  }
  return true;
}

std::string usage() {
  return "Usage: lanshared [options]\n"
         "  --config <file>             JSON configuration file\n"
         "  --data-dir <dir>            settings and pending-share log\n"
         "  --http-address <addr>       control server address\n"
         "  --http-port <port>          control server port\n"
         "  --discovery-port <port>     UDP discovery port\n"
         "  --broadcast-address <addr>  discovery broadcast address\n"
         "  --no-rejoin                 do not rejoin the saved room\n";
}

} // namespace lanshare
