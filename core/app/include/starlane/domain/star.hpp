#pragma once

#include "starlane/domain/ids.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace starlane {
namespace domain {

// Point pools of one star. available is spent by build and expand orders
// and never goes negative.
struct Economy {
  double available{0.0};
  double industry{0.0};
  double technology{1.0};
};

// Percentages of `available`, each >= 0, summing to at most 100.
struct IndustryTemplate {
  double expand{0.0};
  double research{0.0};
  double build{0.0};

  double total() const { return expand + research + build; }
};

struct MoveTemplate {
  StarId destination_star;
};

// -----------------------------------------------------------------------------
// StandingOrders
// -----------------------------------------------------------------------------
// Per-star defaults re-materialized into auto_build / auto_move drafts at the
// start of every turn until cleared. Both halves are independent.
// -----------------------------------------------------------------------------
struct StandingOrders {
  std::optional<IndustryTemplate> industry;
  std::optional<MoveTemplate> move;

  bool empty() const { return !industry && !move; }
};

// -----------------------------------------------------------------------------
// StarState
// -----------------------------------------------------------------------------
// Mutable per-game state of one topology star. details is an open bag;
// details["standingOrders"] is owned by the StandingOrderStore.
// -----------------------------------------------------------------------------
struct StarState {
  GameId game_id{0};
  StarId star_id;
  std::optional<PlayerId> owner;
  Economy economy;
  double damage{0.0};
  nlohmann::json details = nlohmann::json::object();
};

enum class ShipStatus {
  Active,
  Destroyed,
};

struct Ship {
  ShipId id{0};
  GameId game_id{0};
  PlayerId owner{0};
  StarId location;
  double hp{0.0};
  double power{0.0};
  ShipStatus status{ShipStatus::Active};
  nlohmann::json details = nlohmann::json::object();
};

const char* toString(ShipStatus s);
std::optional<ShipStatus> parseShipStatus(std::string_view s);

}  // namespace domain
}  // namespace starlane
