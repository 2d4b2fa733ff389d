#include "liveness_monitor.hpp"
#include <boost/asio/bind_executor.hpp>

namespace lanshare {

LivenessSweep sweep_liveness(const std::map<PeerId, Clock::time_point> &last_seen,
                             Clock::time_point now,
                             std::chrono::milliseconds dead_window) {
  LivenessSweep out;
  for (const auto &[peer, seen] : last_seen) {
    if (now - seen > dead_window)
      out.expired.push_back(peer);
    else
      out.ping.push_back(peer);
  }
  return out;
}

LivenessMonitor::LivenessMonitor(Strand strand,
                                 std::chrono::milliseconds interval, Tick tick)
    : strand_(std::move(strand)), interval_(interval), tick_(std::move(tick)),
      timer_(strand_) {}

void LivenessMonitor::start() {
  stop();
  ++generation_;
  schedule();
}

void LivenessMonitor::stop() {
  ++generation_;
  if (armed_) {
    timer_.cancel();
    armed_ = false;
  }
}

void LivenessMonitor::schedule() {
  armed_ = true;
  timer_.expires_after(interval_);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [this, gen = generation_](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted || gen != generation_)
          return;
        armed_ = false;
        tick_();
        if (gen == generation_)
          schedule();
      }));
}

} // namespace lanshare
