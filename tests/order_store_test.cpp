// =============================================================================
// order_store_test.cpp
// =============================================================================
// Unit tests for starlane::OrderStore.
//
// Validates:
//   - createDraft assigns a fresh client order id at revision 1
//   - editDraft appends revision + 1 and keeps the history
//   - deleteDraft tombstones the order; unknown orders are NotFound
//   - finalizePlayerTurn snapshots the live drafts; a second finalize
//     supersedes the first instead of duplicating it
//   - Payload validation: mismatched type, unknown stars, negative amounts
//   - Writes against a non-open turn are rejected with ConflictError
//   - listOrdersForStar filters by source star, player and type
// =============================================================================

#include "starlane/domain/errors.hpp"
#include "starlane/orders/order_store.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using starlane::ConflictError;
using starlane::NotFoundError;
using starlane::ValidationError;
using starlane::domain::OrderType;
using starlane::test_support::TestWorld;

class OrderStoreTest : public ::testing::Test {
 protected:
  TestWorld w;

  starlane::domain::OrderRecord draftBuild(starlane::PlayerId player,
                                           const starlane::StarId& star,
                                           double amount) {
    return w.orders.createDraft(w.game, w.turn.id, player, OrderType::Build,
                                TestWorld::build(star, std::nullopt, 0.0, 0.0,
                                                 amount));
  }
};

// -----------------------------------------------------------------------------
// 1. A new draft starts at revision 1, live and not final.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, CreateDraftStartsAtRevisionOne) {
  auto row = draftBuild(w.alice, "A", 10.0);

  EXPECT_EQ(row.revision, 1u);
  EXPECT_FALSE(row.is_deleted);
  EXPECT_FALSE(row.is_final);
  EXPECT_GT(row.client_order_id, 0u);

  auto drafts = w.orders.listLatestDrafts(w.game, w.turn.id, w.alice);
  ASSERT_EQ(drafts.size(), 1u);
  EXPECT_EQ(drafts[0].client_order_id, row.client_order_id);
}

// -----------------------------------------------------------------------------
// 2. Two drafts of the same player get distinct client order ids.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, DistinctDraftsGetDistinctIds) {
  auto first = draftBuild(w.alice, "A", 1.0);
  auto second = draftBuild(w.alice, "A", 2.0);

  EXPECT_NE(first.client_order_id, second.client_order_id);
  EXPECT_EQ(w.orders.listLatestDrafts(w.game, w.turn.id, w.alice).size(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Editing appends a new revision; only the latest is listed but every
//    revision stays in the history.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, EditAppendsRevision) {
  auto row = draftBuild(w.alice, "A", 10.0);

  auto edited = w.orders.editDraft(
      w.game, w.turn.id, w.alice, row.client_order_id, OrderType::Build,
      TestWorld::build("A", 3u));
  EXPECT_EQ(edited.revision, 2u);
  EXPECT_EQ(edited.client_order_id, row.client_order_id);

  auto drafts = w.orders.listLatestDrafts(w.game, w.turn.id, w.alice);
  ASSERT_EQ(drafts.size(), 1u);
  const auto& payload =
      std::get<starlane::domain::BuildPayload>(drafts[0].payload);
  ASSERT_TRUE(payload.ships.has_value());
  EXPECT_EQ(*payload.ships, 3u);

  auto history = w.orders.orderHistory(w.game, w.turn.id, w.alice,
                                       row.client_order_id);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].revision, 1u);
  EXPECT_EQ(history[1].revision, 2u);
}

// -----------------------------------------------------------------------------
// 4. Editing an order that does not exist (or belongs to someone else) is
//    NotFound.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, EditUnknownOrderIsNotFound) {
  auto row = draftBuild(w.alice, "A", 10.0);

  EXPECT_THROW(w.orders.editDraft(w.game, w.turn.id, w.alice, 999'999,
                                  OrderType::Build, TestWorld::build("A", 1u)),
               NotFoundError);
  EXPECT_THROW(w.orders.editDraft(w.game, w.turn.id, w.bob,
                                  row.client_order_id, OrderType::Build,
                                  TestWorld::build("A", 1u)),
               NotFoundError);
}

// -----------------------------------------------------------------------------
// 5. Deleting hides the order from listings; deleting twice is NotFound.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, DeleteTombstonesOrder) {
  auto row = draftBuild(w.alice, "A", 10.0);

  auto tomb = w.orders.deleteDraft(w.game, w.turn.id, w.alice,
                                   row.client_order_id);
  EXPECT_TRUE(tomb.is_deleted);
  EXPECT_EQ(tomb.revision, 2u);
  EXPECT_TRUE(w.orders.listLatestDrafts(w.game, w.turn.id, w.alice).empty());

  EXPECT_THROW(w.orders.deleteDraft(w.game, w.turn.id, w.alice,
                                    row.client_order_id),
               NotFoundError);
}

// -----------------------------------------------------------------------------
// 6. Finalize copies the live drafts and skips deleted ones.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, FinalizeSnapshotsLiveDrafts) {
  auto kept = draftBuild(w.alice, "A", 10.0);
  auto dropped = draftBuild(w.alice, "A", 5.0);
  w.orders.deleteDraft(w.game, w.turn.id, w.alice, dropped.client_order_id);

  auto finals = w.orders.finalizePlayerTurn(w.game, w.turn.id, w.alice);
  ASSERT_EQ(finals.size(), 1u);
  EXPECT_TRUE(finals[0].is_final);
  EXPECT_TRUE(finals[0].finalized_at_ms.has_value());
  EXPECT_EQ(finals[0].client_order_id, kept.client_order_id);
  EXPECT_EQ(finals[0].revision, kept.revision);

  // Drafts stay editable views; finals are separate rows.
  EXPECT_EQ(w.orders.listLatestDrafts(w.game, w.turn.id, w.alice).size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. Finalizing again supersedes the previous set of finals.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, RefinalizeReplacesPreviousFinals) {
  auto row = draftBuild(w.alice, "A", 10.0);
  w.orders.finalizePlayerTurn(w.game, w.turn.id, w.alice);

  w.orders.editDraft(w.game, w.turn.id, w.alice, row.client_order_id,
                     OrderType::Build, TestWorld::build("A", 2u));
  draftBuild(w.alice, "A", 1.0);
  w.orders.finalizePlayerTurn(w.game, w.turn.id, w.alice);

  auto finals = w.orders.listFinalOrdersForTurn(w.game, w.turn.id, w.alice);
  ASSERT_EQ(finals.size(), 2u);
  EXPECT_EQ(finals[0].client_order_id, row.client_order_id);
  EXPECT_EQ(finals[0].revision, 2u);
}

// -----------------------------------------------------------------------------
// 8. Finalizing with no drafts is legal and yields nothing.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, FinalizeWithoutDraftsIsEmpty) {
  EXPECT_TRUE(w.orders.finalizePlayerTurn(w.game, w.turn.id, w.bob).empty());
  EXPECT_TRUE(w.orders.listFinalOrdersForTurn(w.game, w.turn.id).empty());
}

// -----------------------------------------------------------------------------
// 9. Finals are ordered by player, then client order id, and can be
//    filtered by type.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, FinalsOrderedAndFilterable) {
  w.orders.createDraft(w.game, w.turn.id, w.bob, OrderType::Move,
                       TestWorld::move("D", "C"));
  draftBuild(w.alice, "A", 3.0);
  draftBuild(w.bob, "D", 4.0);
  w.orders.finalizePlayerTurn(w.game, w.turn.id, w.bob);
  w.orders.finalizePlayerTurn(w.game, w.turn.id, w.alice);

  auto finals = w.orders.listFinalOrdersForTurn(w.game, w.turn.id);
  ASSERT_EQ(finals.size(), 3u);
  EXPECT_EQ(finals[0].player_id, w.alice);
  EXPECT_EQ(finals[1].player_id, w.bob);
  EXPECT_EQ(finals[1].type, OrderType::Move);
  EXPECT_LT(finals[1].client_order_id, finals[2].client_order_id);

  auto moves =
      w.orders.listFinalOrdersByType(w.game, w.turn.id, OrderType::Move);
  ASSERT_EQ(moves.size(), 1u);
  EXPECT_EQ(moves[0].player_id, w.bob);
}

// -----------------------------------------------------------------------------
// 10. Payload / type mismatch and bad amounts are ValidationError.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, RejectsMalformedPayloads) {
  EXPECT_THROW(w.orders.createDraft(w.game, w.turn.id, w.alice,
                                    OrderType::Move, TestWorld::build("A", 1u)),
               ValidationError);
  EXPECT_THROW(w.orders.createDraft(w.game, w.turn.id, w.alice,
                                    OrderType::Build,
                                    TestWorld::build("A", std::nullopt, -1.0)),
               ValidationError);
  EXPECT_THROW(
      w.orders.createDraft(
          w.game, w.turn.id, w.alice, OrderType::Build,
          TestWorld::build("A", std::nullopt, 0.0, 0.0,
                           std::numeric_limits<double>::infinity())),
      ValidationError);
  EXPECT_THROW(w.orders.createDraft(w.game, w.turn.id, w.alice,
                                    OrderType::Move, TestWorld::move("A", "A")),
               ValidationError);
}

// -----------------------------------------------------------------------------
// 11. Unknown stars and unknown players are NotFound.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, UnknownReferencesAreNotFound) {
  EXPECT_THROW(draftBuild(w.alice, "Z", 1.0), NotFoundError);
  EXPECT_THROW(w.orders.createDraft(w.game, w.turn.id, w.alice,
                                    OrderType::Move, TestWorld::move("A", "Z")),
               NotFoundError);
  EXPECT_THROW(draftBuild(424'242, "A", 1.0), NotFoundError);
}

// -----------------------------------------------------------------------------
// 12. Once the turn leaves Open, drafts and finalize are refused.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, ClosedTurnRejectsWrites) {
  auto row = draftBuild(w.alice, "A", 1.0);
  ASSERT_TRUE(w.ledger.markTurnResolving(w.game, w.turn.number).has_value());

  EXPECT_THROW(draftBuild(w.alice, "A", 1.0), ConflictError);
  EXPECT_THROW(w.orders.deleteDraft(w.game, w.turn.id, w.alice,
                                    row.client_order_id),
               ConflictError);
  EXPECT_THROW(w.orders.finalizePlayerTurn(w.game, w.turn.id, w.alice),
               ConflictError);
}

// -----------------------------------------------------------------------------
// 13. listOrdersForStar filters by source star, player and type, over either
//     drafts or finals.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, ListOrdersForStarFilters) {
  draftBuild(w.alice, "A", 1.0);
  w.orders.createDraft(w.game, w.turn.id, w.alice, OrderType::Move,
                       TestWorld::move("A", "B"));
  draftBuild(w.bob, "D", 1.0);

  EXPECT_EQ(w.orders.listOrdersForStar(w.game, w.turn.id, "A").size(), 2u);
  EXPECT_EQ(w.orders
                .listOrdersForStar(w.game, w.turn.id, "A", std::nullopt,
                                   OrderType::Move)
                .size(),
            1u);
  EXPECT_TRUE(
      w.orders.listOrdersForStar(w.game, w.turn.id, "A", w.bob).empty());
  EXPECT_TRUE(w.orders
                  .listOrdersForStar(w.game, w.turn.id, "A", std::nullopt,
                                     std::nullopt, true)
                  .empty());

  w.orders.finalizePlayerTurn(w.game, w.turn.id, w.alice);
  EXPECT_EQ(w.orders
                .listOrdersForStar(w.game, w.turn.id, "A", std::nullopt,
                                   std::nullopt, true)
                .size(),
            2u);
}
