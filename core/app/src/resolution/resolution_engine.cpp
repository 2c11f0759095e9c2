#include "starlane/resolution/resolution_engine.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/domain/turn_event.hpp"
#include "starlane/serialization/json_codec.hpp"
#include "starlane/store/lookups.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <set>
#include <string>

namespace starlane {

namespace {

constexpr double kMaxShipsPerOrder =
    static_cast<double>(std::numeric_limits<std::uint32_t>::max());

void requireOwnedBy(const domain::StarState& state, PlayerId player) {
  if (!state.owner || *state.owner != player) {
    throw ValidationError("star '" + state.star_id +
                          "' is not owned by player " +
                          std::to_string(player));
  }
}

// Fields every per-order event carries.
nlohmann::json orderDetails(const domain::OrderRecord& order) {
  return nlohmann::json{{"client_order_id", order.client_order_id},
                        {"order_type", domain::toString(order.type)}};
}

nlohmann::json failuresToJson(const char* phase, const PhaseReport& report) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& f : report.failures) {
    out.push_back({{"phase", phase},
                   {"client_order_id", f.client_order_id},
                   {"player_id", f.player_id},
                   {"star_id", f.star},
                   {"error", f.error}});
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ResolutionEngine::ResolutionEngine(Database& db, OrderStore& orders,
                                   EventLog& events)
    : db_(db), orders_(orders), events_(events) {}

// -----------------------------------------------------------------------------
// expandedIndustry()
// -----------------------------------------------------------------------------
double ResolutionEngine::expandedIndustry(double industry, double spend) {
  const double raw = industry + std::sqrt(1.0 + spend) - 1.0;
  return std::round(raw * 100.0) / 100.0;
}

// -----------------------------------------------------------------------------
// shipCost()
// -----------------------------------------------------------------------------
double ResolutionEngine::shipCost(const domain::Economy& economy) {
  return economy.technology >= 1.0 ? economy.technology : 1.0;
}

// -----------------------------------------------------------------------------
// requestedShips()
// -----------------------------------------------------------------------------
std::uint32_t ResolutionEngine::requestedShips(
    const domain::BuildPayload& payload, double ship_cost) {
  if (payload.ships) {
    return *payload.ships;
  }
  if (payload.build > 0.0) {
    return static_cast<std::uint32_t>(
        std::min(std::floor(payload.build / ship_cost), kMaxShipsPerOrder));
  }
  if (payload.expand <= 0.0 && payload.research <= 0.0) {
    return 1;
  }
  return 0;
}

// -----------------------------------------------------------------------------
// resolve()
// -----------------------------------------------------------------------------
ResolutionReport ResolutionEngine::resolve(GameId game,
                                           const domain::Turn& turn) {
  ResolutionReport report;
  report.game_id = game;
  report.turn_id = turn.id;
  report.turn_number = turn.number;

  const auto finals = orders_.listFinalOrdersForTurn(game, turn.id);
  std::cout << "[ResolutionEngine] game " << game << " turn " << turn.number
            << ": resolving " << finals.size() << " final order(s).\n";

  runBuildPhase(finals, report);
  runExpansionPhase(finals, report);
  runMovementPhase(finals, report);

  nlohmann::json failures = failuresToJson("build", report.build);
  for (auto& f : failuresToJson("expansion", report.expansion)) {
    failures.push_back(std::move(f));
  }
  for (auto& f : failuresToJson("movement", report.movement)) {
    failures.push_back(std::move(f));
  }

  try {
    events_.append(game, turn.id, std::nullopt,
                   domain::event_kind::kTurnResolved,
                   {{"turn_number", turn.number},
                    {"orders", finals.size()},
                    {"ships_built", report.ships_built},
                    {"build_points_spent", report.build_points_spent},
                    {"stars_expanded", report.stars_expanded},
                    {"expansion_points_spent", report.expansion_points_spent},
                    {"ships_moved", report.ships_moved},
                    {"failures", std::move(failures)}});
  } catch (const std::exception& e) {
    std::cerr << "[ResolutionEngine] could not record turn summary: "
              << e.what() << "\n";
  }

  std::cout << "[ResolutionEngine] game " << game << " turn " << turn.number
            << " resolved: " << report.ships_built << " ship(s) built, "
            << report.stars_expanded << " star(s) expanded, "
            << report.ships_moved << " ship(s) moved, "
            << report.failureCount() << " failure(s).\n";
  return report;
}

// -----------------------------------------------------------------------------
// recordFailure()
// -----------------------------------------------------------------------------
void ResolutionEngine::recordFailure(PhaseReport& phase,
                                     const domain::OrderRecord& order,
                                     const char* phase_name,
                                     const std::string& error) {
  std::cerr << "[ResolutionEngine] " << phase_name << " order "
            << order.client_order_id << " of player " << order.player_id
            << " failed: " << error << "\n";
  phase.failures.push_back({order.row_id, order.client_order_id,
                            order.player_id, domain::sourceStar(order.payload),
                            error});
}

// -----------------------------------------------------------------------------
// runBuildPhase()
// -----------------------------------------------------------------------------
void ResolutionEngine::runBuildPhase(
    const std::vector<domain::OrderRecord>& finals, ResolutionReport& report) {
  for (const auto& order : finals) {
    switch (order.type) {
      case domain::OrderType::Build:
      case domain::OrderType::AutoBuild:
        break;
      case domain::OrderType::Move:
      case domain::OrderType::AutoMove:
        continue;
    }

    ++report.build.considered;
    try {
      const auto& payload = std::get<domain::BuildPayload>(order.payload);
      if (applyBuild(order, payload, report) == Outcome::Applied) {
        ++report.build.applied;
      } else {
        ++report.build.skipped;
      }
    } catch (const std::exception& e) {
      recordFailure(report.build, order, "build", e.what());
    }
  }
}

// -----------------------------------------------------------------------------
// runExpansionPhase()
// -----------------------------------------------------------------------------
void ResolutionEngine::runExpansionPhase(
    const std::vector<domain::OrderRecord>& finals, ResolutionReport& report) {
  for (const auto& order : finals) {
    const domain::BuildPayload* payload = nullptr;
    switch (order.type) {
      case domain::OrderType::Build:
      case domain::OrderType::AutoBuild:
        payload = std::get_if<domain::BuildPayload>(&order.payload);
        break;
      case domain::OrderType::Move:
      case domain::OrderType::AutoMove:
        continue;
    }
    if (payload == nullptr || payload->expand <= 0.0) {
      continue;
    }

    ++report.expansion.considered;
    try {
      if (applyExpansion(order, *payload, report) == Outcome::Applied) {
        ++report.expansion.applied;
      } else {
        ++report.expansion.skipped;
      }
    } catch (const std::exception& e) {
      recordFailure(report.expansion, order, "expansion", e.what());
    }
  }
}

// -----------------------------------------------------------------------------
// runMovementPhase()
// -----------------------------------------------------------------------------
void ResolutionEngine::runMovementPhase(
    const std::vector<domain::OrderRecord>& finals, ResolutionReport& report) {
  std::set<ShipId> moved_this_turn;
  for (const auto& order : finals) {
    switch (order.type) {
      case domain::OrderType::Move:
      case domain::OrderType::AutoMove:
        break;
      case domain::OrderType::Build:
      case domain::OrderType::AutoBuild:
        continue;
    }

    ++report.movement.considered;
    try {
      const auto& payload = std::get<domain::MovePayload>(order.payload);
      if (applyMove(order, payload, moved_this_turn, report) ==
          Outcome::Applied) {
        ++report.movement.applied;
      } else {
        ++report.movement.skipped;
      }
    } catch (const std::exception& e) {
      recordFailure(report.movement, order, "movement", e.what());
    }
  }
}

// -----------------------------------------------------------------------------
// applyBuild(): ships + economy + event in one transaction
// -----------------------------------------------------------------------------
ResolutionEngine::Outcome ResolutionEngine::applyBuild(
    const domain::OrderRecord& order, const domain::BuildPayload& payload,
    ResolutionReport& report) {
  auto tx = db_.begin();
  lookup::requirePlayer(tx.tables(), order.game_id, order.player_id);
  auto& state = lookup::requireStarState(tx.tables(), order.game_id,
                                         payload.source_star);
  requireOwnedBy(state, order.player_id);

  const double cost = shipCost(state.economy);
  const double affordable = std::floor(std::max(0.0, state.economy.available) /
                                       cost);
  const std::uint32_t requested = requestedShips(payload, cost);
  const auto built = static_cast<std::uint32_t>(
      std::min(static_cast<double>(requested), affordable));
  if (built == 0) {
    return Outcome::Skipped;
  }

  const double technology = state.economy.technology;
  nlohmann::json ship_ids = nlohmann::json::array();
  for (std::uint32_t i = 0; i < built; ++i) {
    domain::Ship ship;
    ship.id = tx.nextId();
    ship.game_id = order.game_id;
    ship.owner = order.player_id;
    ship.location = payload.source_star;
    ship.hp = technology;
    ship.power = technology;
    ship.status = domain::ShipStatus::Active;
    tx->ships.emplace(ship.id, ship);
    ship_ids.push_back(ship.id);
  }

  const double total_cost = built * cost;
  state.economy.available =
      std::max(0.0, state.economy.available - total_cost);

  auto details = orderDetails(order);
  details["star_id"] = payload.source_star;
  details["ships_requested"] = requested;
  details["ships_built"] = built;
  details["ship_cost"] = cost;
  details["total_cost"] = total_cost;
  details["ship_ids"] = std::move(ship_ids);
  details["economy"] = state.economy;
  details["from_standing_order"] = payload.from_standing_order;
  events_.append(tx, order.game_id, order.turn_id, order.player_id,
                 domain::event_kind::kShipsBuilt, std::move(details));

  report.ships_built += built;
  report.build_points_spent += total_cost;
  return Outcome::Applied;
}

// -----------------------------------------------------------------------------
// applyExpansion(): industry + economy + event in one transaction
// -----------------------------------------------------------------------------
ResolutionEngine::Outcome ResolutionEngine::applyExpansion(
    const domain::OrderRecord& order, const domain::BuildPayload& payload,
    ResolutionReport& report) {
  auto tx = db_.begin();
  lookup::requirePlayer(tx.tables(), order.game_id, order.player_id);
  auto& state = lookup::requireStarState(tx.tables(), order.game_id,
                                         payload.source_star);
  requireOwnedBy(state, order.player_id);

  const double spend =
      std::min(payload.expand, std::max(0.0, state.economy.available));
  if (spend <= 0.0) {
    return Outcome::Skipped;
  }

  const double previous_industry = state.economy.industry;
  state.economy.industry = expandedIndustry(previous_industry, spend);
  state.economy.available = std::max(0.0, state.economy.available - spend);

  auto details = orderDetails(order);
  details["star_id"] = payload.source_star;
  details["expansion_requested"] = payload.expand;
  details["expansion_spent"] = spend;
  details["previous_industry"] = previous_industry;
  details["new_industry"] = state.economy.industry;
  details["economy"] = state.economy;
  details["from_standing_order"] = payload.from_standing_order;
  events_.append(tx, order.game_id, order.turn_id, order.player_id,
                 domain::event_kind::kIndustryExpanded, std::move(details));

  ++report.stars_expanded;
  report.expansion_points_spent += spend;
  return Outcome::Applied;
}

// -----------------------------------------------------------------------------
// applyMove(): relocation + event in one transaction
// -----------------------------------------------------------------------------
ResolutionEngine::Outcome ResolutionEngine::applyMove(
    const domain::OrderRecord& order, const domain::MovePayload& payload,
    std::set<ShipId>& moved_this_turn, ResolutionReport& report) {
  auto tx = db_.begin();
  lookup::requirePlayer(tx.tables(), order.game_id, order.player_id);
  const auto& galaxy = lookup::requireGalaxy(tx.tables(), order.game_id);
  if (!galaxy.hasStar(payload.destination_star)) {
    throw NotFoundError("destination star '" + payload.destination_star +
                        "' does not exist");
  }
  if (!galaxy.adjacent(payload.source_star, payload.destination_star)) {
    throw ValidationError("no wormhole between '" + payload.source_star +
                          "' and '" + payload.destination_star + "'");
  }

  std::vector<domain::Ship*> ships;
  if (payload.ship_ids.empty()) {
    for (auto* ship : lookup::activeShipsAt(tx.tables(), order.game_id,
                                            payload.source_star,
                                            order.player_id)) {
      if (moved_this_turn.count(ship->id) == 0) {
        ships.push_back(ship);
      }
    }
  } else {
    std::set<ShipId> unique(payload.ship_ids.begin(), payload.ship_ids.end());
    for (ShipId id : unique) {
      auto it = tx->ships.find(id);
      if (it == tx->ships.end() || it->second.game_id != order.game_id) {
        throw NotFoundError("ship " + std::to_string(id) + " does not exist");
      }
      auto& ship = it->second;
      if (ship.owner != order.player_id) {
        throw ValidationError("ship " + std::to_string(id) +
                              " is not owned by player " +
                              std::to_string(order.player_id));
      }
      if (ship.status != domain::ShipStatus::Active) {
        throw ValidationError("ship " + std::to_string(id) + " is not active");
      }
      if (ship.location != payload.source_star) {
        throw ValidationError("ship " + std::to_string(id) + " is at '" +
                              ship.location + "', not at '" +
                              payload.source_star + "'");
      }
      if (moved_this_turn.count(id) != 0) {
        throw ValidationError("ship " + std::to_string(id) +
                              " has already moved this turn");
      }
      ships.push_back(&ship);
    }
  }

  if (ships.empty()) {
    return Outcome::Skipped;
  }

  nlohmann::json moved = nlohmann::json::array();
  for (auto* ship : ships) {
    ship->location = payload.destination_star;
    moved_this_turn.insert(ship->id);
    moved.push_back(ship->id);
  }

  auto details = orderDetails(order);
  details["source_star"] = payload.source_star;
  details["destination_star"] = payload.destination_star;
  details["ship_ids"] = std::move(moved);
  details["ship_count"] = ships.size();
  details["from_standing_order"] = payload.from_standing_order;
  events_.append(tx, order.game_id, order.turn_id, order.player_id,
                 domain::event_kind::kShipsMoved, std::move(details));

  report.ships_moved += ships.size();
  return Outcome::Applied;
}

}  // namespace starlane
