#ifndef LANSHARE_HTTP_EVENT_FEED_HPP
#define LANSHARE_HTTP_EVENT_FEED_HPP

#include "engine/events.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace lanshare {

// Keeps the most recent room events, numbered from 1, for polling clients.
class EventFeed {
public:
  explicit EventFeed(size_t capacity = 256) : capacity_(capacity) {}
  ~EventFeed() { detach(); }

  EventFeed(const EventFeed &) = delete;
  EventFeed &operator=(const EventFeed &) = delete;

  void attach(RoomEvents &events);
  void detach();

  void push(std::string type, nlohmann::json data);

  // {"last": N, "events": [{"seq", "type", "data"}...]} for seq > since.
  nlohmann::json since(uint64_t since) const;
  uint64_t last_sequence() const;

private:
  struct Entry {
    uint64_t seq;
    std::string type;
    nlohmann::json data;
  };

  size_t capacity_;
  mutable std::mutex mx_;
  std::deque<Entry> entries_;
  uint64_t seq_{0};

  RoomEvents *events_{nullptr};
  uint64_t tokens_[6]{};
};

} // namespace lanshare

#endif
