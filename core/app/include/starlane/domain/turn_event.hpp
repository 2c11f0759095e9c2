#pragma once

#include "starlane/domain/ids.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace starlane {
namespace domain {

// Event kinds written by the core. Clients may see other kinds appended by
// collaborators; kind is an open string.
namespace event_kind {
inline constexpr const char* kGameStarted = "game_started";
inline constexpr const char* kShipsBuilt = "ships_built";
inline constexpr const char* kIndustryExpanded = "industry_expanded";
inline constexpr const char* kShipsMoved = "ships_moved";
inline constexpr const char* kTurnResolved = "turn_resolved";
}  // namespace event_kind

// -----------------------------------------------------------------------------
// TurnEvent
// -----------------------------------------------------------------------------
// One row of the append-only event log. seq is strictly increasing per
// (game_id, turn_id) and starts at 1. player_id is unset for events that
// concern every player.
// -----------------------------------------------------------------------------
struct TurnEvent {
  EventId id{0};
  GameId game_id{0};
  TurnId turn_id{0};
  std::optional<PlayerId> player_id;
  std::uint64_t seq{0};
  std::string kind;
  nlohmann::json details = nlohmann::json::object();
  TimestampMs created_at_ms{0};
};

}  // namespace domain
}  // namespace starlane
