#include "settings_store.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace lanshare {

namespace {

constexpr const char *kRoomCodeKey = "p2pRoomCode";
constexpr const char *kDisplayNameKey = "p2pDisplayName";
constexpr const char *kPeerIdKey = "p2pPeerId";

std::optional<std::string> string_field(const nlohmann::json &doc,
                                        const char *key) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

std::optional<StoredRoom> room_from(const nlohmann::json &doc) {
  auto code = string_field(doc, kRoomCodeKey);
  if (!code || code->empty())
    return std::nullopt;
  return StoredRoom{*code, string_field(doc, kDisplayNameKey).value_or("")};
}

} // namespace

std::optional<StoredRoom> MemorySettingsStore::load_room() {
  std::lock_guard<std::mutex> lock(mx_);
  return room_from(doc_);
}

void MemorySettingsStore::save_room(const StoredRoom &room) {
  std::lock_guard<std::mutex> lock(mx_);
  doc_[kRoomCodeKey] = room.room_code;
  doc_[kDisplayNameKey] = room.display_name;
}

void MemorySettingsStore::clear_room() {
  std::lock_guard<std::mutex> lock(mx_);
  doc_.erase(kRoomCodeKey);
}

std::string MemorySettingsStore::load_display_name() {
  std::lock_guard<std::mutex> lock(mx_);
  return string_field(doc_, kDisplayNameKey).value_or("");
}

std::optional<std::string> MemorySettingsStore::load_peer_id() {
  std::lock_guard<std::mutex> lock(mx_);
  return string_field(doc_, kPeerIdKey);
}

void MemorySettingsStore::save_peer_id(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(mx_);
  doc_[kPeerIdKey] = peer_id;
}

JsonFileSettingsStore::JsonFileSettingsStore(std::string path)
    : path_(std::move(path)) {
  std::ifstream in(path_);
  if (!in)
    return; // First start

  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    std::cerr << "[Settings] Ignoring unreadable settings file " << path_
              << "\n";
    return;
  }
  doc_ = std::move(doc);
}

std::optional<StoredRoom> JsonFileSettingsStore::load_room() {
  std::lock_guard<std::mutex> lock(mx_);
  return room_from(doc_);
}

void JsonFileSettingsStore::save_room(const StoredRoom &room) {
  std::lock_guard<std::mutex> lock(mx_);
  doc_[kRoomCodeKey] = room.room_code;
  doc_[kDisplayNameKey] = room.display_name;
  persist();
}

void JsonFileSettingsStore::clear_room() {
  std::lock_guard<std::mutex> lock(mx_);
  if (doc_.erase(kRoomCodeKey) > 0)
    persist();
}

std::string JsonFileSettingsStore::load_display_name() {
  std::lock_guard<std::mutex> lock(mx_);
  return string_field(doc_, kDisplayNameKey).value_or("");
}

std::optional<std::string> JsonFileSettingsStore::load_peer_id() {
  std::lock_guard<std::mutex> lock(mx_);
  return string_field(doc_, kPeerIdKey);
}

void JsonFileSettingsStore::save_peer_id(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(mx_);
  doc_[kPeerIdKey] = peer_id;
  persist();
}

void JsonFileSettingsStore::persist() {
  std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw StoreError("cannot write settings file " + tmp);
    out << doc_.dump(2);
    out.flush();
    if (!out)
      throw StoreError("short write to settings file " + tmp);
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec)
    throw StoreError("cannot replace settings file " + path_ + ": " +
                     ec.message());
}

} // namespace lanshare
