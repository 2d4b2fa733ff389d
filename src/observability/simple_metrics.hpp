#ifndef SIMPLE_METRICS_HPP
#define SIMPLE_METRICS_HPP

#include "metrics.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace lanshare {

class SimpleMetrics : public IMetrics {
public:
  SimpleMetrics() = default;
  ~SimpleMetrics() override = default;

  bool increment_messages(std::string_view kind, bool is_send) override;
  bool record_bytes_received(size_t bytes) override;
  bool record_bytes_sent(size_t bytes) override;

  bool increment_active_peers() override;
  bool decrement_active_peers() override;

  bool increment_ack_outcome(std::string_view outcome) override;
  bool record_ack_latency(double seconds) override;

  bool increment_frames_dropped(std::string_view reason) override;
  bool increment_discovery(std::string_view verdict) override;
  bool increment_pending_shares(std::string_view op, size_t count) override;

  int64_t get_active_peers() const { return active_peers_.load(); }
  uint64_t get_count(std::string_view key) const;

  void dump_metrics() const;
  std::string get_metrics_string() const;
  std::string get_json() const;

private:
  struct LatencyStats {
    uint64_t count{0};
    double total{0.0};
    double max{0.0};
  };

  // Counter names are a small fixed set ("msg_send_heartbeat",
  // "ack_timeout", ...), so one map under a mutex is enough.
  mutable std::mutex stats_mutex_;
  std::map<std::string, uint64_t> counters_;
  LatencyStats ack_latency_;

  std::atomic<size_t> bytes_received_{0};
  std::atomic<size_t> bytes_sent_{0};
  std::atomic<int64_t> active_peers_{0};

  void add(std::string key, uint64_t n);
};

} // namespace lanshare

#endif // SIMPLE_METRICS_HPP
