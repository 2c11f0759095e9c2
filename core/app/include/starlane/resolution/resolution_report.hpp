#pragma once

#include "starlane/domain/ids.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace starlane {

// One order that could not be applied.
struct OrderFailure {
  OrderRowId row_id{0};
  ClientOrderId client_order_id{0};
  PlayerId player_id{0};
  StarId star;
  std::string error;
};

// -----------------------------------------------------------------------------
// PhaseReport
// -----------------------------------------------------------------------------
//   considered  final orders the phase looked at
//   applied     orders that changed state (and wrote an event)
//   skipped     orders with nothing to do (unaffordable, zero spend, no ships)
//   failures    orders rejected by a per-order error
// -----------------------------------------------------------------------------
struct PhaseReport {
  std::size_t considered{0};
  std::size_t applied{0};
  std::size_t skipped{0};
  std::vector<OrderFailure> failures;
};

// -----------------------------------------------------------------------------
// ResolutionReport
// -----------------------------------------------------------------------------
// Result of resolving one turn. Failures never abort the batch; they are
// collected here per phase.
// -----------------------------------------------------------------------------
struct ResolutionReport {
  GameId game_id{0};
  TurnId turn_id{0};
  std::uint32_t turn_number{0};

  PhaseReport build;
  PhaseReport expansion;
  PhaseReport movement;

  std::size_t ships_built{0};
  double build_points_spent{0.0};
  std::size_t stars_expanded{0};
  double expansion_points_spent{0.0};
  std::size_t ships_moved{0};

  std::size_t failureCount() const {
    return build.failures.size() + expansion.failures.size() +
           movement.failures.size();
  }
};

}  // namespace starlane
