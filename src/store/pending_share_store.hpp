#ifndef LANSHARE_STORE_PENDING_SHARE_STORE_HPP
#define LANSHARE_STORE_PENDING_SHARE_STORE_HPP

#include "protocol/message.hpp"
#include "settings_store.hpp"
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

// An article waiting for a peer that was offline or did not acknowledge.
struct PendingShare {
  int64_t id{0};
  PeerId peer_id;
  std::string peer_name;
  Article article;
  int64_t created_at{0}; // epoch millis
  int attempts{0};
  std::optional<int64_t> last_attempt;
};

struct PendingShareCount {
  std::string peer_name;
  size_t count{0};
};

using PendingShareCounts = std::map<PeerId, PendingShareCount>;

// Durable per-peer FIFO of article shares. All methods throw StoreError when
// the backing storage fails; the in-memory view is unchanged in that case.
class IPendingShareStore {
public:
  virtual ~IPendingShareStore() = default;

  virtual int64_t add(const PeerId &peer_id, const std::string &peer_name,
                      const Article &article) = 0;
  // Oldest first.
  virtual std::vector<PendingShare> list_for_peer(const PeerId &peer_id) = 0;
  virtual std::vector<PendingShare> list_all() = 0;
  virtual PendingShareCounts counts() = 0;
  virtual bool remove(int64_t id) = 0;
  virtual size_t remove_for_peer(const PeerId &peer_id) = 0;
  // Returns the new attempt count, or 0 if the id is unknown.
  virtual int increment_attempts(int64_t id) = 0;
  virtual size_t remove_older_than(int max_age_days) = 0;
};

enum class PendingOp : uint8_t { ADD = 1, REMOVE = 2, ATTEMPT = 3 };

#pragma pack(push, 1)
struct PendingLogHeader {
  uint32_t crc; // CRC-32 over op and payload
  uint8_t op;
  uint32_t payload_len;
};
#pragma pack(pop)

// Pending shares kept in memory and journaled to an append-only log of
// CRC-checked JSON records. The log is replayed on open; a torn or corrupt
// tail is truncated. The log is rewritten as a snapshot once it holds more
// than compact_threshold records and twice as many records as live rows.
class WalPendingShareStore : public IPendingShareStore {
public:
  using NowFn = std::function<int64_t()>;

  explicit WalPendingShareStore(std::string path,
                                size_t compact_threshold = 1024,
                                NowFn now = now_ms);
  ~WalPendingShareStore() override;

  int64_t add(const PeerId &peer_id, const std::string &peer_name,
              const Article &article) override;
  std::vector<PendingShare> list_for_peer(const PeerId &peer_id) override;
  std::vector<PendingShare> list_all() override;
  PendingShareCounts counts() override;
  bool remove(int64_t id) override;
  size_t remove_for_peer(const PeerId &peer_id) override;
  int increment_attempts(int64_t id) override;
  size_t remove_older_than(int max_age_days) override;

  size_t log_records() const;
  // Discarded bytes at the end of the log found by the last recovery.
  uint64_t truncated_bytes() const { return truncated_bytes_; }

private:
  std::string path_;
  size_t compact_threshold_;
  NowFn now_;
  std::ofstream file_;
  mutable std::mutex mx_;
  std::map<int64_t, PendingShare> rows_;
  int64_t next_id_{1};
  size_t records_{0};
  uint64_t truncated_bytes_{0};

  void recover();
  bool apply(PendingOp op, const nlohmann::json &payload);
  void append(PendingOp op, const nlohmann::json &payload);
  static void write_record(std::ofstream &out, PendingOp op,
                           const std::string &payload);
  void maybe_compact();
  void compact();
};

} // namespace lanshare

#endif
