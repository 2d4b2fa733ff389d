#include "ack_tracker.hpp"
#include "observability/metrics.hpp"
#include <boost/asio/bind_executor.hpp>
#include <cstdio>
#include <iostream>
#include <random>

namespace lanshare {

const char *to_string(AckOutcome outcome) {
  switch (outcome) {
  case AckOutcome::Acknowledged:
    return "acked";
  case AckOutcome::TimedOut:
    return "timeout";
  case AckOutcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

AckTracker::AckTracker(Strand strand, std::chrono::milliseconds timeout)
    : strand_(std::move(strand)), timeout_(timeout) {}

AckTracker::~AckTracker() {
  for (auto &[id, entry] : pending_)
    entry.timer->cancel();
}

std::string AckTracker::next_message_id() {
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<uint32_t> dist(0, 0xffffff);
  char suffix[8];
  std::snprintf(suffix, sizeof(suffix), "%06x", dist(gen));
  return std::to_string(now_ms()) + "-" + std::to_string(++seq_) + "-" +
         suffix;
}

void AckTracker::track(const std::string &message_id, const PeerId &peer,
                       Completion done) {
  Entry entry;
  entry.peer = peer;
  entry.sent_at = std::chrono::steady_clock::now();
  entry.timer = std::make_unique<boost::asio::steady_timer>(strand_);
  entry.done = std::move(done);
  entry.timer->expires_after(timeout_);
  entry.timer->async_wait(boost::asio::bind_executor(
      strand_, [this, message_id](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        auto it = pending_.find(message_id);
        if (it == pending_.end())
          return;
        std::cerr << "[Ack] No ack for " << message_id << " from "
                  << it->second.peer << " within " << timeout_.count()
                  << "ms\n";
        Completion cb = std::move(it->second.done);
        pending_.erase(it);
        if (auto *m = metrics())
          m->increment_ack_outcome(to_string(AckOutcome::TimedOut));
        if (cb)
          cb(AckOutcome::TimedOut);
      }));
  pending_[message_id] = std::move(entry);
}

bool AckTracker::acknowledge(const std::string &message_id) {
  auto it = pending_.find(message_id);
  if (it == pending_.end())
    return false;

  auto elapsed = std::chrono::steady_clock::now() - it->second.sent_at;
  it->second.timer->cancel();
  Completion cb = std::move(it->second.done);
  pending_.erase(it);

  if (auto *m = metrics()) {
    m->increment_ack_outcome(to_string(AckOutcome::Acknowledged));
    m->record_ack_latency(std::chrono::duration<double>(elapsed).count());
  }
  if (cb)
    cb(AckOutcome::Acknowledged);
  return true;
}

void AckTracker::fail_all() {
  auto entries = std::move(pending_);
  pending_.clear();
  for (auto &[id, entry] : entries) {
    entry.timer->cancel();
    if (auto *m = metrics())
      m->increment_ack_outcome(to_string(AckOutcome::Cancelled));
    if (entry.done)
      entry.done(AckOutcome::Cancelled);
  }
}

} // namespace lanshare
