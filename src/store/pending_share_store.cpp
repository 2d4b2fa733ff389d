#include "pending_share_store.hpp"
#include <algorithm>
#include <boost/crc.hpp>
#include <filesystem>
#include <iostream>

namespace lanshare {

namespace {

constexpr uint32_t kMaxRecordBytes = 1024 * 1024;
constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

uint32_t record_crc(uint8_t op, const std::string &payload) {
  boost::crc_32_type crc;
  crc.process_byte(op);
  crc.process_bytes(payload.data(), payload.size());
  return crc.checksum();
}

nlohmann::json row_to_json(const PendingShare &row) {
  nlohmann::json j = {{"id", row.id},
                      {"peerId", row.peer_id},
                      {"peerName", row.peer_name},
                      {"article", article_to_json(row.article)},
                      {"createdAt", row.created_at},
                      {"attempts", row.attempts}};
  if (row.last_attempt)
    j["lastAttempt"] = *row.last_attempt;
  return j;
}

PendingShare row_from_json(const nlohmann::json &j) {
  PendingShare row;
  row.id = j.at("id").get<int64_t>();
  row.peer_id = j.at("peerId").get<std::string>();
  row.peer_name = j.at("peerName").get<std::string>();
  row.article = article_from_json(j.at("article"));
  row.created_at = j.at("createdAt").get<int64_t>();
  row.attempts = j.value("attempts", 0);
  if (auto it = j.find("lastAttempt"); it != j.end() && !it->is_null())
    row.last_attempt = it->get<int64_t>();
  return row;
}

std::vector<PendingShare> oldest_first(std::vector<PendingShare> rows) {
  std::sort(rows.begin(), rows.end(),
            [](const PendingShare &a, const PendingShare &b) {
              if (a.created_at != b.created_at)
                return a.created_at < b.created_at;
              return a.id < b.id;
            });
  return rows;
}

} // namespace

WalPendingShareStore::WalPendingShareStore(std::string path,
                                           size_t compact_threshold, NowFn now)
    : path_(std::move(path)), compact_threshold_(compact_threshold),
      now_(std::move(now)) {
  recover();
  file_.open(path_, std::ios::binary | std::ios::app);
  if (!file_)
    throw StoreError("cannot open pending share log " + path_);
  std::cout << "[PendingShares] Loaded " << rows_.size()
            << " pending shares from " << path_ << std::endl;
}

WalPendingShareStore::~WalPendingShareStore() {
  if (file_.is_open())
    file_.flush();
}

void WalPendingShareStore::recover() {
  std::ifstream in(path_, std::ios::binary);
  if (!in)
    return;

  uint64_t good = 0;
  while (true) {
    PendingLogHeader h{};
    in.read(reinterpret_cast<char *>(&h), sizeof(h));
    if (in.gcount() == 0)
      break;
    if (in.gcount() != static_cast<std::streamsize>(sizeof(h)))
      break; // Torn header
    if (h.payload_len > kMaxRecordBytes)
      break;

    std::string payload(h.payload_len, '\0');
    in.read(payload.data(), h.payload_len);
    if (in.gcount() != static_cast<std::streamsize>(h.payload_len))
      break; // Torn payload
    if (record_crc(h.op, payload) != h.crc)
      break;

    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !apply(static_cast<PendingOp>(h.op), j))
      break;

    good += sizeof(h) + h.payload_len;
    ++records_;
  }
  in.close();

  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (!ec && size > good) {
    truncated_bytes_ = size - good;
    std::cerr << "[PendingShares] Truncating " << truncated_bytes_
              << " bytes of damaged log tail in " << path_ << "\n";
    std::filesystem::resize_file(path_, good, ec);
    if (ec)
      throw StoreError("cannot truncate pending share log: " + ec.message());
  }
}

bool WalPendingShareStore::apply(PendingOp op, const nlohmann::json &payload) {
  try {
    switch (op) {
    case PendingOp::ADD: {
      PendingShare row = row_from_json(payload);
      next_id_ = std::max(next_id_, row.id + 1);
      rows_[row.id] = std::move(row);
      return true;
    }
    case PendingOp::REMOVE:
      rows_.erase(payload.at("id").get<int64_t>());
      return true;
    case PendingOp::ATTEMPT: {
      auto it = rows_.find(payload.at("id").get<int64_t>());
      if (it != rows_.end()) {
        it->second.attempts = payload.at("attempts").get<int>();
        it->second.last_attempt = payload.at("at").get<int64_t>();
      }
      return true;
    }
    }
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[PendingShares] Bad log record: " << e.what() << "\n";
  }
  return false;
}

void WalPendingShareStore::write_record(std::ofstream &out, PendingOp op,
                                        const std::string &payload) {
  PendingLogHeader h{record_crc(static_cast<uint8_t>(op), payload),
                     static_cast<uint8_t>(op),
                     static_cast<uint32_t>(payload.size())};
  out.write(reinterpret_cast<const char *>(&h), sizeof(h));
  out.write(payload.data(), payload.size());
}

void WalPendingShareStore::append(PendingOp op, const nlohmann::json &payload) {
  std::string body = payload.dump();
  if (body.size() > kMaxRecordBytes)
    throw StoreError("pending share record too large");

  write_record(file_, op, body);
  file_.flush(); // In prod: fsync()
  if (!file_) {
    file_.clear();
    throw StoreError("write to pending share log failed: " + path_);
  }
  ++records_;
}

int64_t WalPendingShareStore::add(const PeerId &peer_id,
                                  const std::string &peer_name,
                                  const Article &article) {
  std::lock_guard<std::mutex> lock(mx_);
  PendingShare row;
  row.id = next_id_;
  row.peer_id = peer_id;
  row.peer_name = peer_name;
  row.article = article;
  row.created_at = now_();

  append(PendingOp::ADD, row_to_json(row));
  ++next_id_;
  rows_[row.id] = row;
  std::cout << "[PendingShares] Queued \"" << article.title << "\" for "
            << peer_name << std::endl;
  return row.id;
}

std::vector<PendingShare>
WalPendingShareStore::list_for_peer(const PeerId &peer_id) {
  std::lock_guard<std::mutex> lock(mx_);
  std::vector<PendingShare> out;
  for (const auto &[id, row] : rows_) {
    if (row.peer_id == peer_id)
      out.push_back(row);
  }
  return oldest_first(std::move(out));
}

std::vector<PendingShare> WalPendingShareStore::list_all() {
  std::lock_guard<std::mutex> lock(mx_);
  std::vector<PendingShare> out;
  out.reserve(rows_.size());
  for (const auto &[id, row] : rows_)
    out.push_back(row);
  return oldest_first(std::move(out));
}

PendingShareCounts WalPendingShareStore::counts() {
  std::lock_guard<std::mutex> lock(mx_);
  PendingShareCounts counts;
  for (const auto &[id, row] : rows_) {
    auto &c = counts[row.peer_id];
    c.peer_name = row.peer_name;
    c.count++;
  }
  return counts;
}

bool WalPendingShareStore::remove(int64_t id) {
  std::lock_guard<std::mutex> lock(mx_);
  if (!rows_.contains(id))
    return false;
  append(PendingOp::REMOVE, {{"id", id}});
  rows_.erase(id);
  maybe_compact();
  return true;
}

size_t WalPendingShareStore::remove_for_peer(const PeerId &peer_id) {
  std::lock_guard<std::mutex> lock(mx_);
  size_t removed = 0;
  for (auto it = rows_.begin(); it != rows_.end();) {
    if (it->second.peer_id == peer_id) {
      append(PendingOp::REMOVE, {{"id", it->first}});
      it = rows_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    std::cout << "[PendingShares] Removed " << removed
              << " pending shares for peer " << peer_id << std::endl;
    maybe_compact();
  }
  return removed;
}

int WalPendingShareStore::increment_attempts(int64_t id) {
  std::lock_guard<std::mutex> lock(mx_);
  auto it = rows_.find(id);
  if (it == rows_.end())
    return 0;
  int attempts = it->second.attempts + 1;
  int64_t at = now_();
  append(PendingOp::ATTEMPT, {{"id", id}, {"attempts", attempts}, {"at", at}});
  it->second.attempts = attempts;
  it->second.last_attempt = at;
  maybe_compact();
  return attempts;
}

size_t WalPendingShareStore::remove_older_than(int max_age_days) {
  std::lock_guard<std::mutex> lock(mx_);
  int64_t cutoff = now_() - static_cast<int64_t>(max_age_days) * kMillisPerDay;
  size_t removed = 0;
  for (auto it = rows_.begin(); it != rows_.end();) {
    if (it->second.created_at < cutoff) {
      append(PendingOp::REMOVE, {{"id", it->first}});
      it = rows_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    std::cout << "[PendingShares] Removed " << removed
              << " pending shares older than " << max_age_days << " days"
              << std::endl;
    maybe_compact();
  }
  return removed;
}

size_t WalPendingShareStore::log_records() const {
  std::lock_guard<std::mutex> lock(mx_);
  return records_;
}

// Runs after a change is journaled, so a failed rewrite leaves the
// uncompacted log in place and is only logged.
void WalPendingShareStore::maybe_compact() {
  if (records_ <= compact_threshold_ || records_ <= 2 * rows_.size())
    return;
  try {
    compact();
  } catch (const StoreError &e) {
    std::cerr << "[PendingShares] Compaction failed: " << e.what() << "\n";
  }
}

void WalPendingShareStore::compact() {
  std::string tmp = path_ + ".compact";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw StoreError("cannot create " + tmp);
    for (const auto &[id, row] : rows_)
      write_record(out, PendingOp::ADD, row_to_json(row).dump());
    out.flush();
    if (!out)
      throw StoreError("short write while compacting " + tmp);
  }

  file_.close();
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  file_.open(path_, std::ios::binary | std::ios::app);
  if (ec)
    throw StoreError("cannot replace pending share log: " + ec.message());
  if (!file_)
    throw StoreError("cannot reopen pending share log " + path_);
  records_ = rows_.size();
}

} // namespace lanshare
