#pragma once

#include "starlane/domain/ids.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace starlane {
namespace domain {

enum class GameStatus {
  Lobby,
  Running,
  Paused,
  Frozen,
  Finished,
};

// -----------------------------------------------------------------------------
// Game
// -----------------------------------------------------------------------------
// A game owns its players, turns, star states, ships and events. The map
// parameters describe the galaxy that the external generator produced; the
// topology itself is stored separately (GalaxyTopology).
// -----------------------------------------------------------------------------
struct Game {
  GameId id{0};
  std::optional<UserId> owner_user_id;
  std::string name;
  std::int64_t map_seed{0};
  int map_size{0};
  double density{0.0};
  GameStatus status{GameStatus::Lobby};
  nlohmann::json params = nlohmann::json::object();
  TimestampMs created_at_ms{0};
};

const char* toString(GameStatus s);
std::optional<GameStatus> parseGameStatus(std::string_view s);

}  // namespace domain
}  // namespace starlane
