#include "config/config.hpp"
#include "engine/room_controller.hpp"
#include "http/control_api.hpp"
#include "http/control_server.hpp"
#include "http/event_feed.hpp"
#include "net/io_thread.hpp"
#include "observability/simple_metrics.hpp"
#include "store/pending_share_store.hpp"
#include "store/settings_store.hpp"
#include <boost/asio/steady_timer.hpp>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace lanshare;

int main(int argc, char **argv) {
  DaemonConfig config;
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!parse_command_line(args, config)) {
      std::cout << usage();
      return 0;
    }
  } catch (const ConfigError &e) {
    std::cerr << "[Config] " << e.what() << "\n" << usage();
    return 2;
  }

  std::error_code fs_ec;
  std::filesystem::create_directories(config.data_dir, fs_ec);
  if (fs_ec) {
    std::cerr << "[Daemon] Cannot create data directory " << config.data_dir
              << ": " << fs_ec.message() << "\n";
    return 1;
  }
  std::filesystem::path data_dir(config.data_dir);

  SimpleMetrics simple_metrics;
  set_metrics(&simple_metrics);

  int rc = 0;
  try {
    JsonFileSettingsStore settings((data_dir / "settings.json").string());
    WalPendingShareStore pending((data_dir / "pending_shares.wal").string());

    boost::asio::io_context io;
    IoThread io_thread(io);

    RoomController room(io, settings, pending, config.room);
    // The room strand must be idle before the controller goes away.
    try {
      room.clear_pending_shares_older_than(config.pending_max_age_days);

      EventFeed feed;
      feed.attach(room.events());
      ControlApi api(room, feed);
      ControlServer server(api, config.http_address, config.http_port);

      // Runs on the control thread; the join itself waits for the room
      // strand.
      boost::asio::steady_timer rejoin(server.io_context());
      if (config.auto_rejoin) {
        rejoin.expires_after(config.rejoin_delay);
        rejoin.async_wait([&room](const boost::system::error_code &ec) {
          if (ec)
            return;
          if (!room.rejoin_saved_room())
            std::cout << "[Daemon] No saved room to rejoin" << std::endl;
        });
      }

      std::cout << "[Daemon] Peer " << room.local_peer_id() << ", data in "
                << config.data_dir << std::endl;
      server.run();

      // Keep the saved room so the next start rejoins it.
      room.leave_room(true, false);
      feed.detach();
      io_thread.stop();
      simple_metrics.dump_metrics();
    } catch (...) {
      io_thread.stop();
      throw;
    }
  } catch (const StoreError &e) {
    std::cerr << "[Daemon] Storage error: " << e.what() << "\n";
    rc = 1;
  } catch (const boost::system::system_error &e) {
    std::cerr << "[Daemon] " << e.what() << "\n";
    rc = 1;
  }

  set_metrics(nullptr);
  return rc;
}
