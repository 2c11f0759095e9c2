#pragma once

#include "starlane/domain/ids.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace starlane {
namespace domain {

// -----------------------------------------------------------------------------
// PlayerStatus
// -----------------------------------------------------------------------------
// Readiness is tracked per player, not per turn: Active -> Waiting when the
// player ends the turn, Waiting -> Active when the next turn opens.
// Suspended and Ejected players are not waited on.
// -----------------------------------------------------------------------------
enum class PlayerStatus {
  Active,
  Waiting,
  Suspended,
  Ejected,
};

enum class PlayerType {
  Human,
  Ai,
};

// -----------------------------------------------------------------------------
// Player
// -----------------------------------------------------------------------------
// meta may carry "main_ai" (name of a registered AI strategy) and
// "ai_config" (object passed to the strategy's factory).
// -----------------------------------------------------------------------------
struct Player {
  PlayerId id{0};
  GameId game_id{0};
  std::optional<UserId> user_id;
  std::string name;
  std::string color;
  std::string country_name;
  PlayerStatus status{PlayerStatus::Active};
  PlayerType type{PlayerType::Human};
  nlohmann::json meta = nlohmann::json::object();
};

// True for players whose readiness gates turn resolution.
inline bool isEligibleForReadiness(PlayerStatus s) {
  return s == PlayerStatus::Active || s == PlayerStatus::Waiting;
}

const char* toString(PlayerStatus s);
const char* toString(PlayerType t);
std::optional<PlayerStatus> parsePlayerStatus(std::string_view s);
std::optional<PlayerType> parsePlayerType(std::string_view s);

}  // namespace domain
}  // namespace starlane
