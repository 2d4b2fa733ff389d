#include "../store/pending_share_store.hpp"
#include "test_support.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace lanshare;

namespace {

constexpr int64_t kDay = 24LL * 60 * 60 * 1000;

Article article(int n) {
  return Article{"https://example.com/post/" + std::to_string(n),
                 "Post " + std::to_string(n), "Example", std::nullopt,
                 std::nullopt};
}

} // namespace

void test_add_and_list() {
  test::TempDir dir("lanshare-pending");
  int64_t clock = 1000;
  WalPendingShareStore store(dir.file("p.wal"), 1024, [&] { return clock; });

  int64_t a1 = store.add("peer-a", "Alice", article(1));
  clock += 10;
  int64_t b1 = store.add("peer-b", "Bob", article(2));
  clock += 10;
  int64_t a2 = store.add("peer-a", "Alice", article(3));
  assert(a1 < b1 && b1 < a2);

  auto for_a = store.list_for_peer("peer-a");
  assert(for_a.size() == 2);
  assert(for_a[0].id == a1 && for_a[1].id == a2);
  assert(for_a[0].article == article(1));
  assert(for_a[0].created_at == 1000);
  assert(for_a[0].attempts == 0 && !for_a[0].last_attempt);

  auto all = store.list_all();
  assert(all.size() == 3);
  assert(all[0].id == a1 && all[1].id == b1 && all[2].id == a2);

  auto counts = store.counts();
  assert(counts.size() == 2);
  assert(counts["peer-a"].count == 2 && counts["peer-a"].peer_name == "Alice");
  assert(counts["peer-b"].count == 1);

  assert(store.list_for_peer("nobody").empty());
  std::cout << "[PASS] Add and list pending shares" << std::endl;
}

void test_remove_and_attempts() {
  test::TempDir dir("lanshare-pending-rm");
  int64_t clock = 5000;
  WalPendingShareStore store(dir.file("p.wal"), 1024, [&] { return clock; });

  int64_t a1 = store.add("peer-a", "Alice", article(1));
  store.add("peer-a", "Alice", article(2));
  int64_t b1 = store.add("peer-b", "Bob", article(3));

  clock = 6000;
  assert(store.increment_attempts(b1) == 1);
  assert(store.increment_attempts(b1) == 2);
  assert(store.increment_attempts(9999) == 0);
  auto b = store.list_for_peer("peer-b");
  assert(b[0].attempts == 2 && b[0].last_attempt == 6000);

  assert(store.remove(a1));
  assert(!store.remove(a1));
  assert(store.remove_for_peer("peer-a") == 1);
  assert(store.remove_for_peer("peer-a") == 0);
  assert(store.counts().size() == 1);
  std::cout << "[PASS] Remove and attempt counting" << std::endl;
}

void test_reopen_recovers() {
  test::TempDir dir("lanshare-pending-reopen");
  std::string path = dir.file("p.wal");
  int64_t kept = 0;
  {
    WalPendingShareStore store(path);
    int64_t gone = store.add("peer-a", "Alice", article(1));
    kept = store.add("peer-a", "Alice", article(2));
    store.increment_attempts(kept);
    store.remove(gone);
  }
  WalPendingShareStore store(path);
  assert(store.truncated_bytes() == 0);
  auto rows = store.list_all();
  assert(rows.size() == 1);
  assert(rows[0].id == kept);
  assert(rows[0].attempts == 1 && rows[0].last_attempt.has_value());
  assert(rows[0].article == article(2));

  // Ids keep growing after reopen
  assert(store.add("peer-a", "Alice", article(3)) > kept);
  std::cout << "[PASS] Reopen replays the log" << std::endl;
}

void test_torn_tail_truncated() {
  test::TempDir dir("lanshare-pending-torn");
  std::string path = dir.file("p.wal");
  {
    WalPendingShareStore store(path);
    store.add("peer-a", "Alice", article(1));
    store.add("peer-a", "Alice", article(2));
  }
  auto good_size = std::filesystem::file_size(path);
  {
    // Half a header left behind by a crash
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out.write("\x01\x02\x03\x04\x01", 5);
  }
  {
    WalPendingShareStore store(path);
    assert(store.truncated_bytes() == 5);
    assert(store.list_all().size() == 2);
  }
  assert(std::filesystem::file_size(path) == good_size);

  {
    // Corrupt the last byte of the last payload
    std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
    f.seekp(static_cast<std::streamoff>(good_size) - 1);
    f.put('#');
  }
  WalPendingShareStore store(path);
  assert(store.truncated_bytes() > 0);
  auto rows = store.list_all();
  assert(rows.size() == 1);
  assert(rows[0].article == article(1));

  // Appends after a truncation survive the next reopen
  store.add("peer-b", "Bob", article(9));
  WalPendingShareStore again(path);
  assert(again.truncated_bytes() == 0);
  assert(again.list_all().size() == 2);
  std::cout << "[PASS] Damaged log tail truncated" << std::endl;
}

void test_remove_older_than() {
  test::TempDir dir("lanshare-pending-age");
  int64_t clock = 100 * kDay;
  WalPendingShareStore store(dir.file("p.wal"), 1024, [&] { return clock; });

  store.add("peer-a", "Alice", article(1)); // day 100
  clock = 120 * kDay;
  store.add("peer-a", "Alice", article(2)); // day 120
  clock = 131 * kDay;
  store.add("peer-b", "Bob", article(3)); // day 131

  assert(store.remove_older_than(30) == 1);
  assert(store.list_all().size() == 2);
  assert(store.remove_older_than(30) == 0);
  assert(store.remove_older_than(0) == 1);
  assert(store.list_all().size() == 1);
  std::cout << "[PASS] Age based cleanup" << std::endl;
}

void test_compaction() {
  test::TempDir dir("lanshare-pending-compact");
  std::string path = dir.file("p.wal");
  {
    WalPendingShareStore store(path, 4);
    int64_t first = store.add("peer-a", "Alice", article(1));
    int64_t second = store.add("peer-a", "Alice", article(2));
    store.add("peer-b", "Bob", article(3));
    assert(store.log_records() == 3);
    store.remove(first);
    assert(store.log_records() == 4);
    store.remove(second); // 5 records, 1 live row
    assert(store.log_records() == 1);
  }
  assert(!std::filesystem::exists(path + ".compact"));
  WalPendingShareStore store(path, 4);
  assert(store.log_records() == 1);
  auto rows = store.list_all();
  assert(rows.size() == 1 && rows[0].peer_id == "peer-b");
  std::cout << "[PASS] Log compaction" << std::endl;
}

void test_failed_compaction_keeps_change() {
  test::TempDir dir("lanshare-pending-compact-fail");
  std::string path = dir.file("p.wal");
  // A directory where the snapshot file goes makes every rewrite fail.
  std::filesystem::create_directories(path + ".compact");
  {
    WalPendingShareStore store(path, 2);
    int64_t first = store.add("peer-a", "Alice", article(1));
    int64_t second = store.add("peer-a", "Alice", article(2));
    store.add("peer-b", "Bob", article(3));

    assert(store.remove(first));
    assert(store.increment_attempts(second) == 1);
    assert(store.remove_for_peer("peer-a") == 1);
    assert(store.log_records() == 6);
    auto rows = store.list_all();
    assert(rows.size() == 1 && rows[0].peer_id == "peer-b");
  }

  std::filesystem::remove(path + ".compact");
  WalPendingShareStore store(path, 2);
  assert(store.log_records() == 6);
  auto rows = store.list_all();
  assert(rows.size() == 1 && rows[0].peer_id == "peer-b");

  assert(store.increment_attempts(rows[0].id) == 1);
  assert(store.log_records() == 1);
  std::cout << "[PASS] Failed compaction keeps the change" << std::endl;
}

int main() {
  try {
    test_add_and_list();
    test_remove_and_attempts();
    test_reopen_recovers();
    test_torn_tail_truncated();
    test_remove_older_than();
    test_compaction();
    test_failed_compaction_keeps_change();
    std::cout << "All pending share store tests passed!" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Test Failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
