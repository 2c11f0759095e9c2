#pragma once

#include "starlane/domain/order.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/orders/order_store.hpp"
#include "starlane/orders/standing_order_store.hpp"
#include "starlane/store/world_repository.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace starlane {

struct MaterializeFailure {
  StarId star;
  std::string error;
};

struct MaterializeReport {
  std::size_t stars_scanned{0};
  std::size_t auto_build_orders{0};
  std::size_t auto_move_orders{0};
  std::size_t skipped_unowned{0};
  std::vector<MaterializeFailure> failures;
};

// -----------------------------------------------------------------------------
// StandingOrderMaterializer - standing templates -> concrete drafts
// -----------------------------------------------------------------------------
//
// @brief  At the start of a turn, writes one auto_build and/or one auto_move
//         draft per star carrying standing orders, on behalf of the star's
//         owner.
//
// @details
// Industry: each amount is floor(available * pct / 100). If rounding leaves
// the sum above `available`, all three are scaled by available / total and
// floored again. An auto_build is written only when some amount is > 0.
//
// Move: an auto_move with an empty ship selection, so the ResolutionEngine
// moves whatever ships the owner has at the star when the turn resolves.
//
// Stars without an owner are skipped with a warning. Any error for one star
// (including OrderStore validation) is logged, recorded in the report and
// does not stop the remaining stars.
//
// Thread model: call once per new turn, before the turn is announced; each
// draft is written by the OrderStore in its own transaction.
// -----------------------------------------------------------------------------
class StandingOrderMaterializer {
 public:
  StandingOrderMaterializer(StandingOrderStore& standing_orders,
                            WorldRepository& world, OrderStore& orders);

  StandingOrderMaterializer(const StandingOrderMaterializer&) = delete;
  StandingOrderMaterializer& operator=(const StandingOrderMaterializer&) =
      delete;

  MaterializeReport materialize(GameId game, TurnId turn);

  // Amounts for one star; std::nullopt when every amount floors to zero.
  static std::optional<domain::BuildPayload> industryAllocation(
      const StarId& star, const domain::Economy& economy,
      const domain::IndustryTemplate& pct);

 private:
  StandingOrderStore& standing_orders_;
  WorldRepository& world_;
  OrderStore& orders_;
};

}  // namespace starlane
