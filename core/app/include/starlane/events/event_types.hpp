#pragma once

#include "starlane/domain/ids.hpp"

#include <cstddef>
#include <cstdint>

namespace starlane {

// -----------------------------------------------------------------------------
// TurnOpenedEvent
// -----------------------------------------------------------------------------
// Published when a game's turn opens, both for turn 1 at game start and for
// every turn opened by the TurnAdvancer. The AI loop reacts to it by running
// the AI players of that game.
// -----------------------------------------------------------------------------
struct TurnOpenedEvent {
  GameId game_id{0};
  TurnId turn_id{0};
  std::uint32_t turn_number{0};
  TimestampMs timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PlayerReadyEvent
// -----------------------------------------------------------------------------
// A player ended their turn. completed_set is true only for the end-turn call
// that made every eligible player waiting.
// -----------------------------------------------------------------------------
struct PlayerReadyEvent {
  GameId game_id{0};
  TurnId turn_id{0};
  PlayerId player_id{0};
  bool completed_set{false};
  TimestampMs timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// TurnResolvedEvent
// -----------------------------------------------------------------------------
// Summary of one resolution run. Counts are of applied orders; error_count
// covers all three phases.
// -----------------------------------------------------------------------------
struct TurnResolvedEvent {
  GameId game_id{0};
  TurnId turn_id{0};
  std::uint32_t turn_number{0};
  std::size_t ships_built{0};
  std::size_t stars_expanded{0};
  std::size_t ships_moved{0};
  std::size_t error_count{0};
  TimestampMs timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// TurnAdvancedEvent
// -----------------------------------------------------------------------------
// The notification payload handed to the notification sink after a turn
// closes and the next one opens. Listeners fetch the event slice of
// previous_turn_id to replay what happened.
// -----------------------------------------------------------------------------
struct TurnAdvancedEvent {
  GameId game_id{0};
  TurnId previous_turn_id{0};
  std::uint32_t previous_turn_number{0};
  TurnId new_turn_id{0};
  std::uint32_t new_turn_number{0};
  TimestampMs timestamp_ms{0};
};

}  // namespace starlane
