#ifndef LANSHARE_PROTOCOL_ACK_TRACKER_HPP
#define LANSHARE_PROTOCOL_ACK_TRACKER_HPP

#include "message.hpp"
#include "net/strand.hpp"
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace lanshare {

enum class AckOutcome { Acknowledged, TimedOut, Cancelled };

const char *to_string(AckOutcome outcome);

// Outstanding article-share batches waiting for their ack. Each entry owns a
// deadline timer; exactly one of acknowledge(), the timeout or fail_all()
// completes it. Must only be used on the strand it was built with.
class AckTracker {
public:
  using Completion = std::function<void(AckOutcome)>;

  AckTracker(Strand strand, std::chrono::milliseconds timeout);
  ~AckTracker();

  AckTracker(const AckTracker &) = delete;
  AckTracker &operator=(const AckTracker &) = delete;

  std::string next_message_id();

  void track(const std::string &message_id, const PeerId &peer,
             Completion done);

  // False for unknown or already completed ids.
  bool acknowledge(const std::string &message_id);

  // Completes every entry with Cancelled.
  void fail_all();

  size_t size() const { return pending_.size(); }
  size_t armed_timers() const { return pending_.size(); }

private:
  struct Entry {
    PeerId peer;
    std::chrono::steady_clock::time_point sent_at;
    std::unique_ptr<boost::asio::steady_timer> timer;
    Completion done;
  };

  Strand strand_;
  std::chrono::milliseconds timeout_;
  std::map<std::string, Entry> pending_;
  uint64_t seq_{0};
};

} // namespace lanshare

#endif
