#pragma once

#include "starlane/domain/ids.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace starlane {
namespace domain {

// Lifecycle: Open -> Resolving -> Closed. At most one Open turn per game.
enum class TurnStatus {
  Open,
  Resolving,
  Closed,
};

struct Turn {
  TurnId id{0};
  GameId game_id{0};
  std::uint32_t number{0};
  TurnStatus status{TurnStatus::Open};
  TimestampMs opened_at_ms{0};
  std::optional<TimestampMs> closed_at_ms;
};

const char* toString(TurnStatus s);
std::optional<TurnStatus> parseTurnStatus(std::string_view s);

}  // namespace domain
}  // namespace starlane
