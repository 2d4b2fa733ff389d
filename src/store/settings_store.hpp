#ifndef LANSHARE_STORE_SETTINGS_STORE_HPP
#define LANSHARE_STORE_SETTINGS_STORE_HPP

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace lanshare {

class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct StoredRoom {
  std::string room_code;
  std::string display_name;
};

// Durable room membership and identity. Implementations throw StoreError on
// I/O failure.
class ISettingsStore {
public:
  virtual ~ISettingsStore() = default;

  virtual std::optional<StoredRoom> load_room() = 0;
  virtual void save_room(const StoredRoom &room) = 0;
  // Forgets the room code; the display name is kept.
  virtual void clear_room() = 0;
  virtual std::string load_display_name() = 0;

  virtual std::optional<std::string> load_peer_id() = 0;
  virtual void save_peer_id(const std::string &peer_id) = 0;
};

class MemorySettingsStore : public ISettingsStore {
public:
  std::optional<StoredRoom> load_room() override;
  void save_room(const StoredRoom &room) override;
  void clear_room() override;
  std::string load_display_name() override;
  std::optional<std::string> load_peer_id() override;
  void save_peer_id(const std::string &peer_id) override;

private:
  std::mutex mx_;
  nlohmann::json doc_ = nlohmann::json::object();
};

// Settings kept as one JSON document; every change rewrites the file via a
// temporary and a rename.
class JsonFileSettingsStore : public ISettingsStore {
public:
  explicit JsonFileSettingsStore(std::string path);

  std::optional<StoredRoom> load_room() override;
  void save_room(const StoredRoom &room) override;
  void clear_room() override;
  std::string load_display_name() override;
  std::optional<std::string> load_peer_id() override;
  void save_peer_id(const std::string &peer_id) override;

private:
  std::string path_;
  std::mutex mx_;
  nlohmann::json doc_ = nlohmann::json::object();

  void persist();
};

} // namespace lanshare

#endif
