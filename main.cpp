// -----------------------------------------------------------------------------
// starlane_server: single executable entry point.
//
//   1) Load the EngineConfig (argv[1], optional; defaults otherwise).
//   2) Create the TurnEngine and restore the snapshot, if one is configured.
//   3) Subscribe a logging callback to the notification bus.
//   4) Start the engine: notification loop, AI loop and IPC server.
//   5) Idle on the main thread until Ctrl-C.
//   6) Stop the engine and write the snapshot.
//
// Thread layout:
//   main thread     -> waits for SIGINT
//   notify thread   -> turn notifications -> IPC PUB socket and the logger
//   ai thread       -> AI turns when a turn opens
//   ipc thread      -> JSON commands on the REP socket
// -----------------------------------------------------------------------------

#include "starlane/config/engine_config.hpp"
#include "starlane/engine/turn_engine.hpp"
#include "starlane/events/event_types.hpp"
#include "starlane/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag, set from the SIGINT handler and polled by main().
// -----------------------------------------------------------------------------
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  starlane::EngineConfig config;
  try {
    if (argc > 1) {
      config = starlane::loadConfig(argv[1]);
      std::cout << "[main] config loaded from " << argv[1] << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  starlane::LiveTimeProvider clock;
  starlane::TurnEngine engine(config, clock);

  try {
    if (!engine.loadSnapshot() && !config.snapshot_path.empty()) {
      std::cout << "[main] no snapshot at " << config.snapshot_path
                << ", starting empty.\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  engine.notificationBus().subscribe<starlane::TurnAdvancedEvent>(
      [](const starlane::TurnAdvancedEvent& e) {
        std::cout << "[Notify] game " << e.game_id << ": turn "
                  << e.previous_turn_number << " -> " << e.new_turn_number
                  << "\n";
      });

  engine.start();

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();

  try {
    engine.saveSnapshot();
  } catch (const std::exception& e) {
    std::cerr << "[main] snapshot not saved: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
