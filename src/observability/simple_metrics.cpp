#include "simple_metrics.hpp"
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace lanshare {

void SimpleMetrics::add(std::string key, uint64_t n) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  counters_[std::move(key)] += n;
}

bool SimpleMetrics::increment_messages(std::string_view kind, bool is_send) {
  add(std::string(is_send ? "msg_send_" : "msg_recv_") + std::string(kind), 1);
  return true;
}

bool SimpleMetrics::record_bytes_received(size_t bytes) {
  bytes_received_.fetch_add(bytes, std::memory_order_relaxed);
  return true;
}

bool SimpleMetrics::record_bytes_sent(size_t bytes) {
  bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
  return true;
}

bool SimpleMetrics::increment_active_peers() {
  active_peers_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool SimpleMetrics::decrement_active_peers() {
  active_peers_.fetch_sub(1, std::memory_order_relaxed);
  return true;
}

bool SimpleMetrics::increment_ack_outcome(std::string_view outcome) {
  add("ack_" + std::string(outcome), 1);
  return true;
}

bool SimpleMetrics::record_ack_latency(double seconds) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ack_latency_.count++;
  ack_latency_.total += seconds;
  if (seconds > ack_latency_.max)
    ack_latency_.max = seconds;
  return true;
}

bool SimpleMetrics::increment_frames_dropped(std::string_view reason) {
  add("frames_dropped_" + std::string(reason), 1);
  return true;
}

bool SimpleMetrics::increment_discovery(std::string_view verdict) {
  add("discovery_" + std::string(verdict), 1);
  return true;
}

bool SimpleMetrics::increment_pending_shares(std::string_view op,
                                             size_t count) {
  add("pending_" + std::string(op), count);
  return true;
}

uint64_t SimpleMetrics::get_count(std::string_view key) const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  auto it = counters_.find(std::string(key));
  return it == counters_.end() ? 0 : it->second;
}

void SimpleMetrics::dump_metrics() const {
  std::cout << get_metrics_string() << std::endl;
}

std::string SimpleMetrics::get_metrics_string() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  std::stringstream ss;
  ss << "\n=== LanShare Metrics ===\n";
  ss << "Active Peers: " << active_peers_.load() << "\n";
  ss << "Bytes Sent: " << bytes_sent_.load()
     << " Received: " << bytes_received_.load() << "\n";
  double avg =
      ack_latency_.count > 0 ? ack_latency_.total / ack_latency_.count : 0.0;
  ss << "Ack Latency: count " << ack_latency_.count << " avg " << std::fixed
     << std::setprecision(6) << avg << "s max " << ack_latency_.max << "s\n";
  ss << "Counters:\n";
  for (const auto &[key, count] : counters_) {
    ss << "  " << std::left << std::setw(32) << key << count << "\n";
  }
  ss << "========================\n";
  return ss.str();
}

std::string SimpleMetrics::get_json() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  nlohmann::json j;
  j["peers"] = {{"active", active_peers_.load()}};
  j["throughput"] = {{"bytes_sent_total", bytes_sent_.load()},
                     {"bytes_received_total", bytes_received_.load()}};
  double avg =
      ack_latency_.count > 0 ? ack_latency_.total / ack_latency_.count : 0.0;
  j["ack_latency"] = {{"count", ack_latency_.count},
                      {"avg_latency_s", avg},
                      {"max_latency_s", ack_latency_.max}};
  j["counters"] = nlohmann::json::object();
  for (const auto &[key, count] : counters_)
    j["counters"][key] = count;
  return j.dump(2);
}

} // namespace lanshare
