#pragma once

#include "starlane/domain/order.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/orders/order_store.hpp"
#include "starlane/resolution/resolution_report.hpp"
#include "starlane/store/database.hpp"
#include "starlane/store/event_log.hpp"

#include <cstdint>
#include <set>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// ResolutionEngine - applies a turn's final orders to the world
// -----------------------------------------------------------------------------
//
// @brief  Consumes every final order of a turn in three ordered phases and
//         records each applied order in the EventLog.
//
// @details
// Phases (each over the finals in (player, client order id) order):
//
//   1. Build     (build, auto_build)
//        cost      = technology (at least 1)
//        affordable= floor(available / cost)
//        requested = payload.ships if set, else floor(build / cost) if a
//                    build amount is set, else 1 when the order carries no
//                    amounts at all, else 0
//        built     = min(requested, affordable)
//      Inserts `built` ships at the star (hp = power = technology) owned by
//      the ordering player and deducts built * cost. built == 0 is a silent
//      skip. Event: ships_built.
//
//   2. Expansion (any build-kind order with expand > 0; reads the economy
//      left over by phase 1)
//        spend    = min(expand, available)
//        industry = round2(industry + sqrt(1 + spend) - 1)
//        available -= spend
//      Zero spend is a silent skip. Event: industry_expanded.
//
//   3. Movement  (move, auto_move) - relocation only, no combat
//      The destination must be wormhole-adjacent to the source. An empty
//      ship selection moves every active ship of the player at the source
//      at this moment; an explicit selection must consist of the player's
//      active ships at the source, otherwise the order fails as a whole.
//      A ship makes at most one jump per turn: an empty selection leaves
//      out ships an earlier order already moved, and an explicit selection
//      naming one fails.
//      Event: ships_moved.
//
// Build and expansion orders also fail when the source star is not owned
// by the ordering player.
//
// Every order is applied in its own Database transaction together with its
// event, so an order is either fully applied or not at all. A failure is
// caught, logged and added to the report; the remaining orders still run.
// A final turn_resolved event (addressed to every player) carries the
// totals.
//
// Thread model: resolve() is called by the one caller that won the
// Open -> Resolving transition for the turn.
// -----------------------------------------------------------------------------
class ResolutionEngine {
 public:
  ResolutionEngine(Database& db, OrderStore& orders, EventLog& events);

  ResolutionEngine(const ResolutionEngine&) = delete;
  ResolutionEngine& operator=(const ResolutionEngine&) = delete;

  ResolutionReport resolve(GameId game, const domain::Turn& turn);

  // Diminishing-returns industry growth, rounded to two decimals.
  static double expandedIndustry(double industry, double spend);

  static double shipCost(const domain::Economy& economy);

  // Ships an order asks for at the given ship cost.
  static std::uint32_t requestedShips(const domain::BuildPayload& payload,
                                      double ship_cost);

 private:
  enum class Outcome { Applied, Skipped };

  void runBuildPhase(const std::vector<domain::OrderRecord>& finals,
                     ResolutionReport& report);
  void runExpansionPhase(const std::vector<domain::OrderRecord>& finals,
                         ResolutionReport& report);
  void runMovementPhase(const std::vector<domain::OrderRecord>& finals,
                        ResolutionReport& report);

  Outcome applyBuild(const domain::OrderRecord& order,
                     const domain::BuildPayload& payload,
                     ResolutionReport& report);
  Outcome applyExpansion(const domain::OrderRecord& order,
                         const domain::BuildPayload& payload,
                         ResolutionReport& report);
  Outcome applyMove(const domain::OrderRecord& order,
                    const domain::MovePayload& payload,
                    std::set<ShipId>& moved_this_turn,
                    ResolutionReport& report);

  static void recordFailure(PhaseReport& phase,
                            const domain::OrderRecord& order,
                            const char* phase_name, const std::string& error);

  Database& db_;
  OrderStore& orders_;
  EventLog& events_;
};

}  // namespace starlane
