// =============================================================================
// ai_turn_executor_test.cpp
// =============================================================================
// Unit tests for starlane::AiTurnExecutor and starlane::AiRegistry.
//
// Validates:
//   - Every active AI seat runs its strategy once and ends its turn
//   - Orders drafted through the gateway are counted per player
//   - A throwing strategy or an unknown strategy fails only its own seat
//   - Strategy config comes from meta.ai_config
//   - Registry: sorted listing, overwrite, bad registrations
// =============================================================================

#include "starlane/ai/ai_registry.hpp"
#include "starlane/ai/ai_turn_executor.hpp"
#include "starlane/ai/world_view.hpp"
#include "starlane/domain/errors.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using starlane::AiOrderGateway;
using starlane::AiRegistry;
using starlane::AiTurnExecutor;
using starlane::GameId;
using starlane::IAiStrategy;
using starlane::PlayerId;
using starlane::WorldView;
using starlane::WorldViewBuilder;
using starlane::domain::OrderType;
using starlane::domain::PlayerType;
using starlane::test_support::TestWorld;
using json = nlohmann::json;

namespace {

// Drafts one build order at each owned star and remembers its config.
class BuilderStrategy final : public IAiStrategy {
 public:
  explicit BuilderStrategy(json config) : config_(std::move(config)) {}

  std::string name() const override { return "builder"; }

  void takeTurn(const WorldView& view, AiOrderGateway& orders) override {
    for (const auto& star : view.stars) {
      if (star.owner && *star.owner == view.viewer) {
        starlane::domain::BuildPayload payload;
        payload.source_star = star.star_id;
        payload.ships = 1;
        orders.createDraft(OrderType::Build, payload);
      }
    }
    last_config = config_;
  }

  static inline json last_config;

 private:
  json config_;
};

class FailingStrategy final : public IAiStrategy {
 public:
  std::string name() const override { return "failing"; }

  void takeTurn(const WorldView&, AiOrderGateway&) override {
    throw std::runtime_error("strategy crashed");
  }
};

}  // namespace

// =============================================================================
// Test fixture: two AI seats next to the two human players of TestWorld.
// =============================================================================
class AiTurnExecutorTest : public ::testing::Test {
 protected:
  TestWorld w;
  WorldViewBuilder views{w.db};
  AiRegistry registry;
  std::vector<std::pair<GameId, PlayerId>> completed;

  AiTurnExecutor executor{
      w.players, views, w.orders, registry,
      [this](GameId game, PlayerId player) {
        completed.emplace_back(game, player);
      }};

  void SetUp() override {
    registry.registerStrategy(
        "builder", [](GameId, PlayerId, const json& config) {
          return std::make_unique<BuilderStrategy>(config);
        });
    registry.registerStrategy("failing", [](GameId, PlayerId, const json&) {
      return std::make_unique<FailingStrategy>();
    });
  }

  PlayerId addAi(const std::string& name, const std::string& strategy,
                 json extra = json::object()) {
    json meta = std::move(extra);
    meta["main_ai"] = strategy;
    return w.addPlayer(name, PlayerType::Ai, meta);
  }
};

// -----------------------------------------------------------------------------
// 1. A working strategy drafts orders and ends its turn.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, RunsStrategyAndCompletesTurn) {
  auto bot = addAi("bot", "builder");
  w.setOwner("B", bot);
  w.setOwner("C", bot);

  auto batch = executor.executeAll(w.game);

  EXPECT_EQ(batch.processed, 1u);
  EXPECT_EQ(batch.successful, 1u);
  EXPECT_EQ(batch.failed, 0u);
  ASSERT_EQ(batch.results.size(), 1u);
  EXPECT_EQ(batch.results[0].player_id, bot);
  EXPECT_EQ(batch.results[0].strategy, "builder");
  EXPECT_EQ(batch.results[0].orders_submitted, 2u);

  EXPECT_EQ(w.orders.listLatestDrafts(w.game, w.turn.id, bot).size(), 2u);
  ASSERT_EQ(completed.size(), 1u);
  EXPECT_EQ(completed[0].second, bot);
}

// -----------------------------------------------------------------------------
// 2. Human seats are never driven by the executor.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, SkipsHumanPlayers) {
  auto batch = executor.executeAll(w.game);

  EXPECT_EQ(batch.processed, 0u);
  EXPECT_TRUE(completed.empty());
}

// -----------------------------------------------------------------------------
// 3. One crashing seat does not stop the others and does not end its turn.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, FailureIsIsolated) {
  auto broken = addAi("broken", "failing");
  auto good = addAi("good", "builder");
  w.setOwner("C", good);

  auto batch = executor.executeAll(w.game);

  EXPECT_EQ(batch.processed, 2u);
  EXPECT_EQ(batch.successful, 1u);
  EXPECT_EQ(batch.failed, 1u);
  for (const auto& r : batch.results) {
    if (r.player_id == broken) {
      EXPECT_FALSE(r.success);
      EXPECT_EQ(r.error, "strategy crashed");
    } else {
      EXPECT_TRUE(r.success);
    }
  }
  ASSERT_EQ(completed.size(), 1u);
  EXPECT_EQ(completed[0].second, good);
}

// -----------------------------------------------------------------------------
// 4. An unregistered strategy name is a failed result, not an exception.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, UnknownStrategyFails) {
  addAi("ghost", "does-not-exist");

  auto batch = executor.executeAll(w.game);

  ASSERT_EQ(batch.results.size(), 1u);
  EXPECT_FALSE(batch.results[0].success);
  EXPECT_NE(batch.results[0].error.find("does-not-exist"), std::string::npos);
  EXPECT_TRUE(completed.empty());
}

// -----------------------------------------------------------------------------
// 5. executeOne on a seat with no strategy reports a failure.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, MissingStrategyFails) {
  auto player = *w.players.getPlayer(w.alice);

  auto result = executor.executeOne(w.game, player);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.strategy.empty());
  EXPECT_FALSE(result.error.empty());
}

// -----------------------------------------------------------------------------
// 6. meta.ai_config is handed to the strategy factory.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, PassesAiConfig) {
  addAi("tuned", "builder", json{{"ai_config", {{"aggression", 3}}}});

  executor.executeAll(w.game);

  EXPECT_EQ(BuilderStrategy::last_config.value("aggression", 0), 3);
}

// -----------------------------------------------------------------------------
// 7. Without an open turn every seat fails cleanly.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, NoOpenTurnFails) {
  addAi("bot", "builder");
  w.ledger.closeTurn(w.game, 1);

  auto batch = executor.executeAll(w.game);

  EXPECT_EQ(batch.failed, 1u);
  EXPECT_TRUE(completed.empty());
}

// -----------------------------------------------------------------------------
// 8. Registry listing is sorted; re-registering replaces the factory.
// -----------------------------------------------------------------------------
TEST_F(AiTurnExecutorTest, RegistryBookkeeping) {
  auto names = registry.list();
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "builder");
  EXPECT_EQ(names[1], "failing");

  registry.registerStrategy("builder", [](GameId, PlayerId, const json&) {
    return std::make_unique<FailingStrategy>();
  });
  EXPECT_EQ(registry.create("builder", w.game, w.alice, json::object())
                ->name(),
            "failing");

  EXPECT_THROW(registry.registerStrategy("", nullptr),
               starlane::ValidationError);
  registry.registerStrategy("empty", [](GameId, PlayerId, const json&) {
    return std::unique_ptr<IAiStrategy>();
  });
  EXPECT_THROW(registry.create("empty", w.game, w.alice, json::object()),
               starlane::EngineError);
}
