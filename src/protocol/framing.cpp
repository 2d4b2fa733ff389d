#include "framing.hpp"
#include <algorithm>
#include <cctype>

namespace lanshare {

std::vector<std::string> LineFramer::feed(std::string_view chunk) {
  std::vector<std::string> frames;
  buffer_.append(chunk.data(), chunk.size());

  size_t start = 0;
  while (true) {
    size_t nl = buffer_.find('\n', start);
    if (nl == std::string::npos)
      break;
    size_t end = nl;
    if (end > start && buffer_[end - 1] == '\r')
      --end;
    bool blank = std::all_of(buffer_.begin() + start, buffer_.begin() + end,
                             [](unsigned char c) { return std::isspace(c); });
    if (!blank)
      frames.emplace_back(buffer_, start, end - start);
    start = nl + 1;
  }
  buffer_.erase(0, start);

  if (buffer_.size() > max_pending_) {
    buffer_.clear();
    overflowed_ = true;
  }
  return frames;
}

void LineFramer::reset() {
  buffer_.clear();
  overflowed_ = false;
}

} // namespace lanshare
