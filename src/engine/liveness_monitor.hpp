#ifndef LANSHARE_ENGINE_LIVENESS_MONITOR_HPP
#define LANSHARE_ENGINE_LIVENESS_MONITOR_HPP

#include "net/strand.hpp"
#include "types.hpp"
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <map>
#include <vector>

namespace lanshare {

struct LivenessSweep {
  std::vector<PeerId> expired; // silent longer than the dead window
  std::vector<PeerId> ping;    // still alive; send a heartbeat
};

LivenessSweep sweep_liveness(const std::map<PeerId, Clock::time_point> &last_seen,
                             Clock::time_point now,
                             std::chrono::milliseconds dead_window);

// Fires the owner's tick every interval until stopped.
class LivenessMonitor {
public:
  using Tick = std::function<void()>;

  LivenessMonitor(Strand strand, std::chrono::milliseconds interval, Tick tick);
  ~LivenessMonitor() { stop(); }

  LivenessMonitor(const LivenessMonitor &) = delete;
  LivenessMonitor &operator=(const LivenessMonitor &) = delete;

  void start();
  void stop();
  bool timer_armed() const { return armed_; }

private:
  Strand strand_;
  std::chrono::milliseconds interval_;
  Tick tick_;
  boost::asio::steady_timer timer_;
  bool armed_{false};
  uint64_t generation_{0};

  void schedule();
};

} // namespace lanshare

#endif
