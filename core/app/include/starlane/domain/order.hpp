#pragma once

#include "starlane/domain/ids.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace starlane {
namespace domain {

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Closed set of order kinds. The Auto* kinds are produced by the
// StandingOrderMaterializer; they resolve exactly like their manual
// counterparts.
// -----------------------------------------------------------------------------
enum class OrderType {
  Build,
  AutoBuild,
  Move,
  AutoMove,
};

// -----------------------------------------------------------------------------
// BuildPayload
// -----------------------------------------------------------------------------
// Spend allocation for one star. expand/research/build are point amounts
// drawn from the star's `available` pool. ships, when set, is the explicit
// number of ships requested; otherwise the build amount decides.
// -----------------------------------------------------------------------------
struct BuildPayload {
  StarId source_star;
  std::optional<std::uint32_t> ships;
  double expand{0.0};
  double research{0.0};
  double build{0.0};
  bool from_standing_order{false};
};

// -----------------------------------------------------------------------------
// MovePayload
// -----------------------------------------------------------------------------
// Relocates ships from source_star to an adjacent destination_star. An empty
// ship_ids selection means "every active ship of the player at the source
// when the turn resolves".
// -----------------------------------------------------------------------------
struct MovePayload {
  StarId source_star;
  StarId destination_star;
  std::vector<ShipId> ship_ids;
  bool from_standing_order{false};
};

using OrderPayload = std::variant<BuildPayload, MovePayload>;

// -----------------------------------------------------------------------------
// OrderRecord
// -----------------------------------------------------------------------------
//
// @brief  One append-only revision row of a logical order.
//
// @details
// (game_id, turn_id, player_id, client_order_id) identifies the logical
// order. Every edit or delete appends a row with revision + 1. A finalize
// appends an is_final copy of the latest live revision; finals are never
// edited afterwards, only superseded by a later finalize (which clears
// is_final on the older copies).
// -----------------------------------------------------------------------------
struct OrderRecord {
  OrderRowId row_id{0};
  GameId game_id{0};
  TurnId turn_id{0};
  PlayerId player_id{0};
  ClientOrderId client_order_id{0};
  std::uint32_t revision{0};
  OrderType type{OrderType::Build};
  OrderPayload payload;
  bool is_deleted{false};
  bool is_final{false};
  std::optional<TimestampMs> finalized_at_ms;
  TimestampMs created_at_ms{0};
};

inline bool isBuildType(OrderType t) {
  return t == OrderType::Build || t == OrderType::AutoBuild;
}

inline bool isMoveType(OrderType t) {
  return t == OrderType::Move || t == OrderType::AutoMove;
}

// Build kinds carry a BuildPayload, move kinds a MovePayload.
inline bool payloadMatchesType(OrderType t, const OrderPayload& p) {
  return isBuildType(t) ? std::holds_alternative<BuildPayload>(p)
                        : std::holds_alternative<MovePayload>(p);
}

const StarId& sourceStar(const OrderPayload& p);

const char* toString(OrderType t);
std::optional<OrderType> parseOrderType(std::string_view s);

}  // namespace domain
}  // namespace starlane
