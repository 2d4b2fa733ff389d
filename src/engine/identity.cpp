#include "identity.hpp"
#include "store/settings_store.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <random>

namespace lanshare {

namespace {

std::mt19937 &rng() {
  thread_local std::mt19937 gen(std::random_device{}());
  return gen;
}

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace

std::string generate_room_code() {
  std::uniform_int_distribution<size_t> dist(0, kRoomCodeAlphabet.size() - 1);
  std::string code;
  code.reserve(kRoomCodeLength);
  for (size_t i = 0; i < kRoomCodeLength; ++i)
    code.push_back(kRoomCodeAlphabet[dist(rng())]);
  return code;
}

std::optional<std::string> normalize_room_code(std::string_view code) {
  while (!code.empty() && std::isspace(static_cast<unsigned char>(code.front())))
    code.remove_prefix(1);
  while (!code.empty() && std::isspace(static_cast<unsigned char>(code.back())))
    code.remove_suffix(1);
  if (code.empty() || code.size() > kMaxRoomCodeLength)
    return std::nullopt;

  std::string out;
  out.reserve(code.size());
  for (char c : code) {
    auto uc = static_cast<unsigned char>(c);
    if (uc > 0x7f || !std::isalnum(uc))
      return std::nullopt;
    out.push_back(static_cast<char>(std::toupper(uc)));
  }
  return out;
}

PeerId generate_peer_id() {
  static constexpr char kHex[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 255);
  PeerId id;
  id.reserve(32);
  for (int i = 0; i < 16; ++i) {
    int b = dist(rng());
    id.push_back(kHex[b >> 4]);
    id.push_back(kHex[b & 0x0f]);
  }
  return id;
}

PeerId load_or_create_peer_id(ISettingsStore &settings) {
  if (auto stored = settings.load_peer_id(); stored && !stored->empty())
    return *stored;

  PeerId id = generate_peer_id();
  try {
    settings.save_peer_id(id);
  } catch (const std::exception &e) {
    // Not fatal: the id is regenerated on the next start.
    std::cerr << "[Identity] Failed to persist peer id: " << e.what() << "\n";
  }
  std::cout << "[Identity] Generated peer id " << id << std::endl;
  return id;
}

bool is_valid_share_url(std::string_view url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos)
    return false;
  std::string scheme = lower(url.substr(0, scheme_end));
  if (scheme != "http" && scheme != "https")
    return false;

  std::string_view rest = url.substr(scheme_end + 3);
  size_t host_end = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, host_end);
  if (auto at = authority.rfind('@'); at != std::string_view::npos)
    authority.remove_prefix(at + 1);

  std::string_view host = authority;
  if (!host.empty() && host.front() == '[') {
    auto close = host.find(']');
    if (close == std::string_view::npos)
      return false;
    host = host.substr(0, close + 1);
  } else if (auto colon = host.find(':'); colon != std::string_view::npos) {
    host = host.substr(0, colon);
  }
  if (host.empty())
    return false;

  std::string h = lower(host);
  if (h == "localhost" || h == "127.0.0.1" || h == "[::1]")
    return false;
  if (h.starts_with("192.168.") || h.starts_with("10.") ||
      h.starts_with("172."))
    return false;
  if (h.ends_with(".local"))
    return false;
  return true;
}

} // namespace lanshare
