#ifndef LANSHARE_OBSERVABILITY_METRICS_HPP
#define LANSHARE_OBSERVABILITY_METRICS_HPP

#include <atomic>
#include <cstddef>
#include <string_view>

namespace lanshare {

// Sink for subsystem counters. Every method returns false if the sink
// dropped the sample.
class IMetrics {
public:
  virtual ~IMetrics() = default;

  virtual bool increment_messages(std::string_view kind, bool is_send) = 0;
  virtual bool record_bytes_received(size_t bytes) = 0;
  virtual bool record_bytes_sent(size_t bytes) = 0;

  virtual bool increment_active_peers() = 0;
  virtual bool decrement_active_peers() = 0;

  // outcome: "acked", "timeout", "cancelled"
  virtual bool increment_ack_outcome(std::string_view outcome) = 0;
  virtual bool record_ack_latency(double seconds) = 0;

  virtual bool increment_frames_dropped(std::string_view reason) = 0;
  virtual bool increment_discovery(std::string_view verdict) = 0;
  // op: "queued", "delivered", "discarded", "evicted"
  virtual bool increment_pending_shares(std::string_view op,
                                        size_t count) = 0;
};

// Null when metrics are disabled.
extern std::atomic<IMetrics *> g_metrics;

inline void set_metrics(IMetrics *m) {
  g_metrics.store(m, std::memory_order_release);
}

inline IMetrics *metrics() {
  return g_metrics.load(std::memory_order_relaxed);
}

} // namespace lanshare

#endif
