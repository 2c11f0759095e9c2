#pragma once

#include "starlane/domain/star.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Runtime settings of the turn engine, read from one JSON file.
//
// @details
// Every key is optional; a missing key keeps the default below. A key with
// the wrong JSON type is a ValidationError naming the key.
//
//   {
//     "ipc":       { "cmd_endpoint": "...", "pub_endpoint": "..." },
//     "ai":        { "auto_run": true, "delay_ms": 100 },
//     "snapshot_path": "starlane.snapshot.json",
//     "new_game":  { "home_economy":    { "available": .., ... },
//                    "neutral_economy": { ... },
//                    "starting_ships": 1, "ship_hp": 100,
//                    "ship_power": 10 },
//     "events":    { "default_limit": 100 }
//   }
//
// Empty IPC endpoints disable the IpcServer (tests run that way).
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  bool auto_run_ai{true};
  std::int64_t ai_delay_ms{100};

  // Empty: no snapshot is loaded or saved.
  std::string snapshot_path;

  domain::Economy home_economy{10.0, 1.0, 1.0};
  domain::Economy neutral_economy{0.0, 0.0, 1.0};
  std::uint32_t starting_ships{1};
  double ship_hp{100.0};
  double ship_power{10.0};

  std::size_t default_event_limit{100};
};

void from_json(const nlohmann::json& j, EngineConfig& config);
void to_json(nlohmann::json& j, const EngineConfig& config);

// Reads and parses the file. Throws ValidationError when the file cannot
// be opened, is not JSON or has a mistyped key.
EngineConfig loadConfig(const std::string& path);

}  // namespace starlane
