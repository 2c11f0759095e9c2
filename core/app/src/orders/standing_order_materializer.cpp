#include "starlane/orders/standing_order_materializer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
StandingOrderMaterializer::StandingOrderMaterializer(
    StandingOrderStore& standing_orders, WorldRepository& world,
    OrderStore& orders)
    : standing_orders_(standing_orders), world_(world), orders_(orders) {}

// -----------------------------------------------------------------------------
// industryAllocation()
// -----------------------------------------------------------------------------
std::optional<domain::BuildPayload>
StandingOrderMaterializer::industryAllocation(
    const StarId& star, const domain::Economy& economy,
    const domain::IndustryTemplate& pct) {
  const double available = std::max(0.0, economy.available);

  double expand = std::floor(available * pct.expand / 100.0);
  double research = std::floor(available * pct.research / 100.0);
  double build = std::floor(available * pct.build / 100.0);

  const double total = expand + research + build;
  if (total > available && total > 0.0) {
    const double scale = available / total;
    expand = std::floor(expand * scale);
    research = std::floor(research * scale);
    build = std::floor(build * scale);
  }

  if (expand <= 0.0 && research <= 0.0 && build <= 0.0) {
    return std::nullopt;
  }

  domain::BuildPayload payload;
  payload.source_star = star;
  payload.expand = expand;
  payload.research = research;
  payload.build = build;
  payload.from_standing_order = true;
  return payload;
}

// -----------------------------------------------------------------------------
// materialize()
// -----------------------------------------------------------------------------
MaterializeReport StandingOrderMaterializer::materialize(GameId game,
                                                         TurnId turn) {
  MaterializeReport report;

  for (const auto& star : standing_orders_.listStarsWithStandingOrders(game)) {
    ++report.stars_scanned;
    try {
      auto state = world_.getStarState(game, star);
      auto templates = standing_orders_.getStandingOrders(game, star);
      if (!state || !templates) {
        continue;
      }
      if (!state->owner) {
        std::cerr << "[StandingOrderMaterializer] star " << star
                  << " has standing orders but no owner; skipped\n";
        ++report.skipped_unowned;
        continue;
      }
      const PlayerId owner = *state->owner;

      if (templates->industry) {
        auto payload =
            industryAllocation(star, state->economy, *templates->industry);
        if (payload) {
          orders_.createDraft(game, turn, owner, domain::OrderType::AutoBuild,
                              *payload);
          ++report.auto_build_orders;
        }
      }

      if (templates->move) {
        domain::MovePayload payload;
        payload.source_star = star;
        payload.destination_star = templates->move->destination_star;
        payload.from_standing_order = true;
        orders_.createDraft(game, turn, owner, domain::OrderType::AutoMove,
                            payload);
        ++report.auto_move_orders;
      }
    } catch (const std::exception& e) {
      std::cerr << "[StandingOrderMaterializer] star " << star
                << " failed: " << e.what() << "\n";
      report.failures.push_back({star, e.what()});
    }
  }

  std::cout << "[StandingOrderMaterializer] game " << game << " turn " << turn
            << ": " << report.auto_build_orders << " auto_build, "
            << report.auto_move_orders << " auto_move, "
            << report.failures.size() << " failure(s).\n";
  return report;
}

}  // namespace starlane
