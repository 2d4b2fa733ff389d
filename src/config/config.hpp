#ifndef LANSHARE_CONFIG_CONFIG_HPP
#define LANSHARE_CONFIG_CONFIG_HPP

#include "engine/types.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanshare {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct DaemonConfig {
  std::string data_dir{"lanshare-data"};
  std::string http_address{"127.0.0.1"};
  uint16_t http_port{41880};
  bool auto_rejoin{true};
  std::chrono::milliseconds rejoin_delay{2000};
  int pending_max_age_days{30};
  RoomOptions room;
};

// Overrides the fields present in a JSON object such as
//   {"dataDir": "...", "httpPort": 41880,
//    "room": {"discoveryPort": 41899, "ackTimeoutMs": 5000}}
void apply_config_json(DaemonConfig &config, const nlohmann::json &j);

DaemonConfig load_config_file(const std::string &path);

// --config <file> is applied first, then the other flags in order.
// Returns false when --help was given.
bool parse_command_line(const std::vector<std::string> &args,
                        DaemonConfig &config);

std::string usage();

} // namespace lanshare

#endif
