#include "starlane/ai/randy_strategy.hpp"

#include "starlane/ai/map_analysis.hpp"
#include "starlane/domain/errors.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <optional>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor: deterministic weights
// -----------------------------------------------------------------------------
RandyStrategy::RandyStrategy(GameId game, PlayerId player,
                             const nlohmann::json& config)
    : game_(game),
      player_(player),
      random_(SeededRandom::hashSeed(std::to_string(game) + ":" +
                                     std::to_string(player))) {
  const double build = random_.nextFloat(0.1, 0.5);
  const double expand = random_.nextFloat(0.1, 0.5);
  const double research = random_.nextFloat(0.1, 0.5);
  const double sum = build + expand + research;
  build_weight_ = build / sum;
  expand_weight_ = expand / sum;
  research_weight_ = research / sum;

  if (config.is_object() && config.contains("aggression")) {
    const auto& value = config.at("aggression");
    if (!value.is_number()) {
      throw ValidationError("randy: aggression must be a number");
    }
    aggression_ = value.get<double>();
  }
}

// -----------------------------------------------------------------------------
// takeTurn()
// -----------------------------------------------------------------------------
void RandyStrategy::takeTurn(const WorldView& view, AiOrderGateway& orders) {
  const auto owned = map_analysis::ownedStars(view, player_);
  if (owned.empty()) {
    std::cout << "[RandyStrategy:" << player_
              << "] no owned stars, skipping turn.\n";
    return;
  }

  for (const auto* star : owned) {
    issueIndustryOrder(*star, orders);
  }
  for (const auto* star : owned) {
    issueMoveOrder(view, *star, orders);
  }

  std::cout << "[RandyStrategy:" << player_ << "] game " << game_ << " turn "
            << view.turn.number << ": " << orders.submitted()
            << " order(s) across " << owned.size() << " star(s).\n";
}

// -----------------------------------------------------------------------------
// issueIndustryOrder()
// -----------------------------------------------------------------------------
void RandyStrategy::issueIndustryOrder(const domain::StarState& star,
                                       AiOrderGateway& orders) {
  const double available = star.economy.available;
  if (available <= 0.0) {
    return;
  }

  domain::BuildPayload payload;
  payload.source_star = star.star_id;
  payload.build = available * build_weight_;
  payload.expand = available * expand_weight_;
  payload.research = available * research_weight_;

  try {
    orders.createDraft(domain::OrderType::Build, payload);
  } catch (const std::exception& e) {
    std::cerr << "[RandyStrategy:" << player_ << "] build order at '"
              << star.star_id << "' rejected: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// issueMoveOrder()
// -----------------------------------------------------------------------------
void RandyStrategy::issueMoveOrder(const WorldView& view,
                                   const domain::StarState& star,
                                   AiOrderGateway& orders) {
  std::vector<ShipId> ships;
  for (const auto* ship : map_analysis::shipsAtStar(view, star.star_id)) {
    if (ship->owner == player_) {
      ships.push_back(ship->id);
    }
  }
  if (ships.empty()) {
    return;
  }

  std::optional<StarId> target;
  double best_ratio = 0.0;
  for (const auto& next : map_analysis::adjacentStars(view, star.star_id)) {
    const double ratio = map_analysis::shipRatio(view, next, player_);
    if (ratio == 0.0) {
      target = next;
      break;
    }
    if (ratio >= aggression_ && ratio > best_ratio) {
      target = next;
      best_ratio = ratio;
    }
  }
  if (!target) {
    return;
  }

  domain::MovePayload payload;
  payload.source_star = star.star_id;
  payload.destination_star = *target;
  payload.ship_ids = std::move(ships);

  try {
    orders.createDraft(domain::OrderType::Move, payload);
  } catch (const std::exception& e) {
    std::cerr << "[RandyStrategy:" << player_ << "] move order from '"
              << star.star_id << "' rejected: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// registerBuiltinStrategies()
// -----------------------------------------------------------------------------
void registerBuiltinStrategies(AiRegistry& registry) {
  registry.registerStrategy(
      RandyStrategy::kName,
      [](GameId game, PlayerId player, const nlohmann::json& config) {
        return std::make_unique<RandyStrategy>(game, player, config);
      });
}

}  // namespace starlane
