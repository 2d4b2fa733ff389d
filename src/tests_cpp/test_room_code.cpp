#include "../engine/identity.hpp"
#include "../net/discovery.hpp"
#include "../store/settings_store.hpp"
#include <cassert>
#include <iostream>
#include <set>

using namespace lanshare;

void test_generated_codes() {
  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i) {
    std::string code = generate_room_code();
    assert(code.size() == kRoomCodeLength);
    for (char c : code)
      assert(kRoomCodeAlphabet.find(c) != std::string_view::npos);
    // Ambiguous glyphs never appear
    assert(code.find_first_of("01IO") == std::string::npos);
    seen.insert(code);
    assert(normalize_room_code(code) == code);
  }
  assert(seen.size() > 150);
  std::cout << "[PASS] Generated room codes" << std::endl;
}

void test_normalize() {
  assert(normalize_room_code("river1") == "RIVER1");
  assert(normalize_room_code("  River1 \n") == "RIVER1");
  assert(!normalize_room_code(""));
  assert(!normalize_room_code("   "));
  assert(!normalize_room_code("RIVER 1"));
  assert(!normalize_room_code("room-1"));
  assert(!normalize_room_code(std::string(33, 'A')));
  assert(normalize_room_code(std::string(32, 'a')) == std::string(32, 'A'));
  std::cout << "[PASS] Room code normalization" << std::endl;
}

void test_peer_ids() {
  PeerId a = generate_peer_id();
  PeerId b = generate_peer_id();
  assert(a.size() == 32 && b.size() == 32);
  assert(a != b);
  assert(a.find_first_not_of("0123456789abcdef") == std::string::npos);

  MemorySettingsStore settings;
  PeerId first = load_or_create_peer_id(settings);
  PeerId again = load_or_create_peer_id(settings);
  assert(first == again);
  assert(settings.load_peer_id() == first);
  std::cout << "[PASS] Peer identifiers" << std::endl;
}

void test_tie_break() {
  assert(should_initiate("AAA", "ZZZ"));
  assert(!should_initiate("ZZZ", "AAA"));
  assert(!should_initiate("AAA", "AAA"));
  // Byte order, not case-insensitive
  assert(should_initiate("Z", "a"));
  assert(should_initiate("0abc", "9abc"));
  std::cout << "[PASS] Dial tie-break" << std::endl;
}

void test_share_urls() {
  assert(is_valid_share_url("https://example.com/post/1"));
  assert(is_valid_share_url("http://news.example.org"));
  assert(is_valid_share_url("HTTPS://Example.com:8443/a?b=c"));

  assert(!is_valid_share_url("ftp://example.com/file"));
  assert(!is_valid_share_url("javascript:alert(1)"));
  assert(!is_valid_share_url("example.com"));
  assert(!is_valid_share_url("http://localhost:3000/"));
  assert(!is_valid_share_url("http://127.0.0.1/"));
  assert(!is_valid_share_url("http://10.0.0.5/feed"));
  assert(!is_valid_share_url("http://172.16.1.1/"));
  assert(!is_valid_share_url("http://192.168.1.20/"));
  assert(!is_valid_share_url("http://printer.local/status"));
  assert(!is_valid_share_url("http://user@localhost/"));
  assert(!is_valid_share_url("http:///nohost"));
  std::cout << "[PASS] Share URL validation" << std::endl;
}

int main() {
  try {
    test_generated_codes();
    test_normalize();
    test_peer_ids();
    test_tie_break();
    test_share_urls();
    std::cout << "All room code tests passed!" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Test Failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
