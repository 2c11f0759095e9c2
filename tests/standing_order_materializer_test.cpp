// =============================================================================
// standing_order_materializer_test.cpp
// =============================================================================
// Unit tests for starlane::StandingOrderMaterializer.
//
// Validates:
//   - industryAllocation floors each share of `available`
//   - Industry templates become one auto_build draft flagged
//     from_standing_order, owned by the star's owner
//   - Move templates become an auto_move draft with an empty ship selection
//   - Unowned stars are skipped and counted, not failed
//   - Zero allocations produce no draft
//   - A failing star is collected and the batch continues
// =============================================================================

#include "starlane/orders/standing_order_materializer.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using starlane::StandingOrderMaterializer;
using starlane::domain::BuildPayload;
using starlane::domain::IndustryTemplate;
using starlane::domain::MovePayload;
using starlane::domain::MoveTemplate;
using starlane::domain::OrderType;
using starlane::domain::StandingOrders;
using starlane::test_support::TestWorld;

class StandingOrderMaterializerTest : public ::testing::Test {
 protected:
  TestWorld w;
  StandingOrderMaterializer materializer{w.standing, w.world, w.orders};

  void setIndustry(const starlane::StarId& star, double expand,
                   double research, double build) {
    StandingOrders s;
    s.industry = IndustryTemplate{expand, research, build};
    w.standing.setStandingOrders(w.game, star, s);
  }

  void setMove(const starlane::StarId& star, const starlane::StarId& to) {
    StandingOrders s;
    s.move = MoveTemplate{to};
    w.standing.setStandingOrders(w.game, star, s);
  }
};

// -----------------------------------------------------------------------------
// 1. Allocation math: 100 available at 50/0/50 gives expand 50 and build 50.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, AllocationSplitsAvailable) {
  auto payload = StandingOrderMaterializer::industryAllocation(
      "A", {100.0, 0.0, 1.0}, IndustryTemplate{50.0, 0.0, 50.0});

  ASSERT_TRUE(payload.has_value());
  EXPECT_DOUBLE_EQ(payload->expand, 50.0);
  EXPECT_DOUBLE_EQ(payload->research, 0.0);
  EXPECT_DOUBLE_EQ(payload->build, 50.0);
  EXPECT_FALSE(payload->ships.has_value());
  EXPECT_TRUE(payload->from_standing_order);
}

// -----------------------------------------------------------------------------
// 2. Shares are floored; nothing left to spend yields no payload.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, AllocationFloorsShares) {
  auto payload = StandingOrderMaterializer::industryAllocation(
      "A", {7.0, 0.0, 1.0}, IndustryTemplate{50.0, 0.0, 50.0});
  ASSERT_TRUE(payload.has_value());
  EXPECT_DOUBLE_EQ(payload->expand, 3.0);
  EXPECT_DOUBLE_EQ(payload->build, 3.0);

  EXPECT_FALSE(StandingOrderMaterializer::industryAllocation(
                   "A", {0.0, 0.0, 1.0}, IndustryTemplate{50.0, 0.0, 50.0})
                   .has_value());
  EXPECT_FALSE(StandingOrderMaterializer::industryAllocation(
                   "A", {1.0, 0.0, 1.0}, IndustryTemplate{10.0, 10.0, 10.0})
                   .has_value());
}

// -----------------------------------------------------------------------------
// 3. An industry template turns into one auto_build draft for the owner.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, IndustryTemplateCreatesAutoBuild) {
  w.setEconomy("A", 100.0, 0.0, 1.0);
  setIndustry("A", 50.0, 0.0, 50.0);

  auto report = materializer.materialize(w.game, w.turn.id);
  EXPECT_EQ(report.stars_scanned, 1u);
  EXPECT_EQ(report.auto_build_orders, 1u);
  EXPECT_EQ(report.auto_move_orders, 0u);
  EXPECT_TRUE(report.failures.empty());

  auto drafts = w.orders.listLatestDrafts(w.game, w.turn.id, w.alice);
  ASSERT_EQ(drafts.size(), 1u);
  EXPECT_EQ(drafts[0].type, OrderType::AutoBuild);
  const auto& payload = std::get<BuildPayload>(drafts[0].payload);
  EXPECT_EQ(payload.source_star, "A");
  EXPECT_DOUBLE_EQ(payload.expand, 50.0);
  EXPECT_DOUBLE_EQ(payload.build, 50.0);
  EXPECT_TRUE(payload.from_standing_order);
}

// -----------------------------------------------------------------------------
// 4. A move template turns into an auto_move draft that selects every ship
//    at resolution time.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, MoveTemplateCreatesAutoMove) {
  setMove("D", "C");

  auto report = materializer.materialize(w.game, w.turn.id);
  EXPECT_EQ(report.auto_move_orders, 1u);

  auto drafts = w.orders.listLatestDrafts(w.game, w.turn.id, w.bob);
  ASSERT_EQ(drafts.size(), 1u);
  EXPECT_EQ(drafts[0].type, OrderType::AutoMove);
  const auto& payload = std::get<MovePayload>(drafts[0].payload);
  EXPECT_EQ(payload.source_star, "D");
  EXPECT_EQ(payload.destination_star, "C");
  EXPECT_TRUE(payload.ship_ids.empty());
  EXPECT_TRUE(payload.from_standing_order);
}

// -----------------------------------------------------------------------------
// 5. Standing orders on a star that lost its owner are skipped.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, UnownedStarIsSkipped) {
  setMove("B", "C");

  auto report = materializer.materialize(w.game, w.turn.id);
  EXPECT_EQ(report.stars_scanned, 1u);
  EXPECT_EQ(report.skipped_unowned, 1u);
  EXPECT_EQ(report.auto_move_orders, 0u);
  EXPECT_TRUE(report.failures.empty());
  EXPECT_TRUE(w.orders.listLatestDrafts(w.game, w.turn.id, w.alice).empty());
  EXPECT_TRUE(w.orders.listLatestDrafts(w.game, w.turn.id, w.bob).empty());
}

// -----------------------------------------------------------------------------
// 6. A star with nothing to spend produces no auto_build.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, NothingAvailableNoDraft) {
  setIndustry("A", 0.0, 0.0, 100.0);

  auto report = materializer.materialize(w.game, w.turn.id);
  EXPECT_EQ(report.auto_build_orders, 0u);
  EXPECT_TRUE(w.orders.listLatestDrafts(w.game, w.turn.id, w.alice).empty());
}

// -----------------------------------------------------------------------------
// 7. A star whose draft cannot be written is reported; other stars still
//    materialize.
// -----------------------------------------------------------------------------
TEST_F(StandingOrderMaterializerTest, FailureIsCollectedPerStar) {
  w.setEconomy("A", 10.0, 0.0, 1.0);
  setIndustry("A", 0.0, 0.0, 100.0);
  setMove("D", "C");

  // Drafts can only be written against an open turn; a closed one makes
  // every createDraft fail.
  w.ledger.closeTurn(w.game, w.turn.number);
  auto report = materializer.materialize(w.game, w.turn.id);
  EXPECT_EQ(report.failures.size(), 2u);
  EXPECT_EQ(report.auto_build_orders, 0u);

  auto next = w.ledger.openTurn(w.game, 2);
  report = materializer.materialize(w.game, next.id);
  EXPECT_TRUE(report.failures.empty());
  EXPECT_EQ(report.auto_build_orders, 1u);
  EXPECT_EQ(report.auto_move_orders, 1u);
}
