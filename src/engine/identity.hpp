#ifndef LANSHARE_ENGINE_IDENTITY_HPP
#define LANSHARE_ENGINE_IDENTITY_HPP

#include "protocol/message.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace lanshare {

class ISettingsStore;

// Alphabet for generated room codes; no 0/O or 1/I.
constexpr std::string_view kRoomCodeAlphabet =
    "23456789ABCDEFGHJKLMNPQRSTUVWXYZ";
constexpr size_t kRoomCodeLength = 6;
constexpr size_t kMaxRoomCodeLength = 32;

std::string generate_room_code();

// Trims and uppercases; nullopt unless 1..32 ASCII alphanumerics remain.
std::optional<std::string> normalize_room_code(std::string_view code);

// 16 random bytes as lowercase hex.
PeerId generate_peer_id();

// Loads the persisted identifier, creating and saving one on first use.
PeerId load_or_create_peer_id(ISettingsStore &settings);

// Only http(s) links to non-local hosts may be shared.
bool is_valid_share_url(std::string_view url);

} // namespace lanshare

#endif
