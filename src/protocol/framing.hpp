#ifndef LANSHARE_PROTOCOL_FRAMING_HPP
#define LANSHARE_PROTOCOL_FRAMING_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lanshare {

constexpr size_t kDefaultMaxFrameBytes = 1024 * 1024;

// Splits a byte stream into newline-terminated frames. Partial frames are
// kept until the rest arrives. Unterminated data beyond max_pending bytes is
// dropped and the framer reports overflow.
class LineFramer {
public:
  explicit LineFramer(size_t max_pending = kDefaultMaxFrameBytes)
      : max_pending_(max_pending) {}

  // Returns complete, non-blank frames without the terminator (and without a
  // trailing '\r').
  std::vector<std::string> feed(std::string_view chunk);

  bool overflowed() const { return overflowed_; }
  size_t buffered() const { return buffer_.size(); }
  void reset();

private:
  std::string buffer_;
  size_t max_pending_;
  bool overflowed_{false};
};

} // namespace lanshare

#endif
