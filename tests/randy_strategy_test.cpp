// =============================================================================
// randy_strategy_test.cpp
// =============================================================================
// Unit tests for starlane::RandyStrategy, SeededRandom and map_analysis.
//
// Validates:
//   - SeededRandom is reproducible and stays inside its bounds
//   - Randy's weights depend only on (game, player) and sum to 1
//   - The aggression setting is read from the strategy config
//   - takeTurn drafts one industry order per owned star with points and a
//     move toward an adjacent star
//   - Stars with nowhere to go or nothing to spend produce no orders
//   - map_analysis helpers over a WorldView
// =============================================================================

#include "starlane/ai/ai_order_gateway.hpp"
#include "starlane/ai/ai_registry.hpp"
#include "starlane/ai/map_analysis.hpp"
#include "starlane/ai/randy_strategy.hpp"
#include "starlane/ai/seeded_random.hpp"
#include "starlane/ai/world_view.hpp"
#include "starlane/domain/errors.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using starlane::AiOrderGateway;
using starlane::RandyStrategy;
using starlane::SeededRandom;
using starlane::WorldViewBuilder;
using starlane::domain::BuildPayload;
using starlane::domain::MovePayload;
using starlane::domain::OrderType;
using starlane::domain::PlayerType;
using starlane::test_support::TestWorld;
using json = nlohmann::json;

namespace map_analysis = starlane::map_analysis;

// =============================================================================
// Test fixture: TestWorld with one AI seat owning star B.
// =============================================================================
class RandyStrategyTest : public ::testing::Test {
 protected:
  TestWorld w;
  WorldViewBuilder views{w.db};
  starlane::PlayerId randy{0};

  void SetUp() override {
    randy = w.addPlayer("randy", PlayerType::Ai, json{{"main_ai", "randy"}});
    w.setOwner("B", randy);
  }

  std::vector<starlane::domain::OrderRecord> play(RandyStrategy& strategy) {
    AiOrderGateway gateway(w.orders, w.game, w.turn.id, randy);
    strategy.takeTurn(views.build(w.game, randy), gateway);
    return gateway.drafts();
  }
};

// -----------------------------------------------------------------------------
// 1. Same seed, same sequence; values stay in range.
// -----------------------------------------------------------------------------
TEST(SeededRandomTest, ReproducibleAndBounded) {
  SeededRandom a(SeededRandom::hashSeed("12"));
  SeededRandom b(SeededRandom::hashSeed("12"));
  for (int i = 0; i < 100; ++i) {
    const double x = a.nextFloat(0.1, 0.5);
    EXPECT_DOUBLE_EQ(x, b.nextFloat(0.1, 0.5));
    EXPECT_GE(x, 0.1);
    EXPECT_LE(x, 0.5);
  }

  SeededRandom c(7);
  const double reversed = c.nextFloat(2.0, 1.0);
  EXPECT_GE(reversed, 1.0);
  EXPECT_LE(reversed, 2.0);
}

// -----------------------------------------------------------------------------
// 2. The string hash is the classic h * 31 + c.
// -----------------------------------------------------------------------------
TEST(SeededRandomTest, HashSeed) {
  EXPECT_EQ(SeededRandom::hashSeed(""), 0u);
  EXPECT_EQ(SeededRandom::hashSeed("a"), 97u);
  EXPECT_EQ(SeededRandom::hashSeed("ab"), 97u * 31u + 98u);
}

// -----------------------------------------------------------------------------
// 3. Weights are a deterministic function of (game, player) and sum to 1.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, WeightsAreDeterministic) {
  RandyStrategy first(w.game, randy);
  RandyStrategy second(w.game, randy);

  EXPECT_DOUBLE_EQ(first.buildWeight(), second.buildWeight());
  EXPECT_DOUBLE_EQ(first.expandWeight(), second.expandWeight());
  EXPECT_DOUBLE_EQ(first.researchWeight(), second.researchWeight());
  EXPECT_NEAR(first.buildWeight() + first.expandWeight() +
                  first.researchWeight(),
              1.0, 1e-12);

  // Each raw draw lies in [0.1, 0.5], so no share can exceed 0.5 / 0.7.
  for (double weight :
       {first.buildWeight(), first.expandWeight(), first.researchWeight()}) {
    EXPECT_GT(weight, 0.0);
    EXPECT_LE(weight, 0.5 / 0.7 + 1e-12);
  }
}

// -----------------------------------------------------------------------------
// 4. Aggression defaults to 1 and can be configured; a non-number is
//    rejected.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, AggressionFromConfig) {
  EXPECT_DOUBLE_EQ(RandyStrategy(w.game, randy).aggression(),
                   RandyStrategy::kDefaultAggression);
  EXPECT_DOUBLE_EQ(
      RandyStrategy(w.game, randy, json{{"aggression", 2.5}}).aggression(),
      2.5);
  EXPECT_THROW(RandyStrategy(w.game, randy, json{{"aggression", "high"}}),
               starlane::ValidationError);
}

// -----------------------------------------------------------------------------
// 5. A star with points gets a build order splitting them by weight, and a
//    star with ships gets a move to a neighbour.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, DraftsIndustryAndMove) {
  w.setEconomy("B", 10.0, 0.0, 1.0);
  auto ship = w.addShip("B", randy);
  RandyStrategy strategy(w.game, randy);

  auto drafts = play(strategy);
  ASSERT_EQ(drafts.size(), 2u);

  auto build = std::find_if(drafts.begin(), drafts.end(), [](const auto& d) {
    return d.type == OrderType::Build;
  });
  ASSERT_NE(build, drafts.end());
  const auto& industry = std::get<BuildPayload>(build->payload);
  EXPECT_EQ(industry.source_star, "B");
  EXPECT_NEAR(industry.build + industry.expand + industry.research, 10.0,
              1e-9);
  EXPECT_NEAR(industry.build, 10.0 * strategy.buildWeight(), 1e-9);

  auto move = std::find_if(drafts.begin(), drafts.end(), [](const auto& d) {
    return d.type == OrderType::Move;
  });
  ASSERT_NE(move, drafts.end());
  const auto& hop = std::get<MovePayload>(move->payload);
  EXPECT_EQ(hop.source_star, "B");
  EXPECT_TRUE(hop.destination_star == "A" || hop.destination_star == "C");
  ASSERT_EQ(hop.ship_ids.size(), 1u);
  EXPECT_EQ(hop.ship_ids[0], ship);
}

// -----------------------------------------------------------------------------
// 6. An isolated star with no points yields nothing.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, IsolatedEmptyStarDraftsNothing) {
  w.setOwner("B", std::nullopt);
  w.setOwner("E", randy);
  w.addShip("E", randy);
  RandyStrategy strategy(w.game, randy);

  EXPECT_TRUE(play(strategy).empty());
}

// -----------------------------------------------------------------------------
// 7. A player without stars skips the turn.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, NoStarsNoOrders) {
  w.setOwner("B", std::nullopt);
  RandyStrategy strategy(w.game, randy);

  EXPECT_TRUE(play(strategy).empty());
}

// -----------------------------------------------------------------------------
// 8. The builtin registration exposes randy through the registry.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, RegisteredAsBuiltin) {
  starlane::AiRegistry registry;
  starlane::registerBuiltinStrategies(registry);

  ASSERT_TRUE(registry.has("randy"));
  auto strategy = registry.create("randy", w.game, randy, json::object());
  ASSERT_NE(strategy, nullptr);
  EXPECT_EQ(strategy->name(), "randy");
  EXPECT_THROW(registry.create("nobody", w.game, randy, json::object()),
               starlane::NotFoundError);
}

// -----------------------------------------------------------------------------
// 9. map_analysis over a built view.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, MapAnalysis) {
  w.setEconomy("B", 4.0, 0.0, 1.0);
  w.addShip("B", randy);
  w.addShip("C", randy);
  w.addShip("C", w.bob);
  w.addShip("C", w.bob);

  auto view = views.build(w.game, randy);
  EXPECT_EQ(view.viewer, randy);
  EXPECT_EQ(view.turn.id, w.turn.id);

  auto owned = map_analysis::ownedStars(view, randy);
  ASSERT_EQ(owned.size(), 1u);
  EXPECT_EQ(owned[0]->star_id, "B");

  EXPECT_DOUBLE_EQ(map_analysis::shipRatio(view, "C", randy), 0.5);
  EXPECT_DOUBLE_EQ(map_analysis::shipRatio(view, "A", randy), 0.0);
  EXPECT_DOUBLE_EQ(map_analysis::totalAvailableIndustry(view, randy), 4.0);
  EXPECT_EQ(map_analysis::shipsAtStar(view, "C").size(), 3u);
  EXPECT_DOUBLE_EQ(map_analysis::shipStrength(
                       map_analysis::shipsAtStar(view, "C"), w.bob),
                   2.0);

  auto frontier = map_analysis::unownedAdjacentStars(view, randy);
  std::sort(frontier.begin(), frontier.end());
  ASSERT_EQ(frontier.size(), 2u);
  EXPECT_EQ(frontier[0], "A");
  EXPECT_EQ(frontier[1], "C");
}

// -----------------------------------------------------------------------------
// 10. The seed keeps game and player apart: (1, 23) and (12, 3) would
//     concatenate to the same digits.
// -----------------------------------------------------------------------------
TEST_F(RandyStrategyTest, SeedSeparatesGameAndPlayer) {
  EXPECT_NE(SeededRandom::hashSeed("1:23"), SeededRandom::hashSeed("12:3"));

  RandyStrategy left(1, 23);
  RandyStrategy right(12, 3);
  EXPECT_NE(left.buildWeight(), right.buildWeight());
}
