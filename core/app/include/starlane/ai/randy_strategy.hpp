#pragma once

#include "starlane/ai/ai_registry.hpp"
#include "starlane/ai/i_ai_strategy.hpp"
#include "starlane/ai/seeded_random.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// RandyStrategy - weighted random economy, opportunistic movement
// -----------------------------------------------------------------------------
//
// @brief  The built-in AI registered as "randy".
//
// @details
// Weights: three draws in [0.1, 0.5] from a SeededRandom seeded with the
// hash of "<game id><player id>", normalized to sum to 1. They are fixed
// for the lifetime of the (game, player).
//
// Economy: for every owned star with available > 0, one build order that
// splits the whole of `available` across build, expand and research by the
// weights.
//
// Movement: for every owned star holding active ships of the player, one
// move order taking all of them to the first adjacent star without enemy
// ships; failing that, to the adjacent star with the best friendly/enemy
// ratio at or above `aggression` (config key "aggression", default 1.0).
// No move when neither exists.
//
// An order rejected by the OrderStore is logged and the next star is
// processed.
// -----------------------------------------------------------------------------
class RandyStrategy final : public IAiStrategy {
 public:
  static constexpr const char* kName = "randy";
  static constexpr double kDefaultAggression = 1.0;

  RandyStrategy(GameId game, PlayerId player,
                const nlohmann::json& config = nlohmann::json::object());

  std::string name() const override { return kName; }

  void takeTurn(const WorldView& view, AiOrderGateway& orders) override;

  double buildWeight() const { return build_weight_; }
  double expandWeight() const { return expand_weight_; }
  double researchWeight() const { return research_weight_; }
  double aggression() const { return aggression_; }

 private:
  void issueIndustryOrder(const domain::StarState& star,
                          AiOrderGateway& orders);
  void issueMoveOrder(const WorldView& view, const domain::StarState& star,
                      AiOrderGateway& orders);

  GameId game_;
  PlayerId player_;
  SeededRandom random_;
  double build_weight_{0.0};
  double expand_weight_{0.0};
  double research_weight_{0.0};
  double aggression_{kDefaultAggression};
};

// Registers every strategy that ships with the engine.
void registerBuiltinStrategies(AiRegistry& registry);

}  // namespace starlane
