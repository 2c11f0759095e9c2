// =============================================================================
// turn_ledger_test.cpp
// =============================================================================
// Unit tests for starlane::TurnLedger.
//
// Validates:
//   - openTurn is idempotent per number and refuses a second open turn
//   - markTurnResolving / closeTurn are guarded transitions
//   - markPlayerWaiting reports completed_set exactly for the last player
//   - Suspended and ejected players neither count nor may end the turn
//   - resetPlayersForNewTurn moves Waiting back to Active
//   - openNextTurn opens and resets readiness together
//   - end-turn is refused once the turn has left Open
// =============================================================================

#include "starlane/domain/errors.hpp"
#include "starlane/turn/turn_ledger.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using starlane::ConflictError;
using starlane::NotFoundError;
using starlane::ValidationError;
using starlane::domain::PlayerStatus;
using starlane::domain::TurnStatus;
using starlane::test_support::TestWorld;

class TurnLedgerTest : public ::testing::Test {
 protected:
  TestWorld w;
};

// -----------------------------------------------------------------------------
// 1. Opening the same number twice returns the existing row.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, OpenTurnIsIdempotent) {
  auto again = w.ledger.openTurn(w.game, 1);
  EXPECT_EQ(again.id, w.turn.id);
  EXPECT_EQ(again.status, TurnStatus::Open);
  EXPECT_EQ(w.ledger.listTurns(w.game).size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. A game has at most one open turn.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, SecondOpenTurnConflicts) {
  EXPECT_THROW(w.ledger.openTurn(w.game, 2), ConflictError);
  EXPECT_THROW(w.ledger.openTurn(w.game, 0), ValidationError);
  EXPECT_THROW(w.ledger.openTurn(9'999, 1), NotFoundError);
}

// -----------------------------------------------------------------------------
// 3. Open -> Resolving -> Closed, each step succeeding once.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, GuardedTransitions) {
  auto resolving = w.ledger.markTurnResolving(w.game, 1);
  ASSERT_TRUE(resolving.has_value());
  EXPECT_EQ(resolving->status, TurnStatus::Resolving);
  EXPECT_FALSE(w.ledger.markTurnResolving(w.game, 1).has_value());
  EXPECT_FALSE(w.ledger.getOpenTurn(w.game).has_value());

  w.clock.advance_by(500);
  auto closed = w.ledger.closeTurn(w.game, 1);
  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(closed->status, TurnStatus::Closed);
  ASSERT_TRUE(closed->closed_at_ms.has_value());
  EXPECT_EQ(*closed->closed_at_ms, 1'500);
  EXPECT_FALSE(w.ledger.closeTurn(w.game, 1).has_value());

  auto next = w.ledger.openTurn(w.game, 2);
  EXPECT_EQ(next.number, 2u);
  auto listed = w.ledger.listTurns(w.game);
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].number, 1u);
  EXPECT_EQ(listed[1].number, 2u);
}

// -----------------------------------------------------------------------------
// 4. Readiness: only the last eligible player completes the set, and a
//    repeated end-turn does not complete it again.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, LastPlayerCompletesSet) {
  auto first = w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice);
  EXPECT_TRUE(first.transitioned);
  EXPECT_FALSE(first.completed_set);
  EXPECT_EQ(first.waiting, 1u);
  EXPECT_EQ(first.eligible, 2u);
  EXPECT_FALSE(w.ledger.allEligibleWaiting(w.game));

  auto repeat = w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice);
  EXPECT_FALSE(repeat.transitioned);
  EXPECT_FALSE(repeat.completed_set);
  EXPECT_EQ(repeat.previous, PlayerStatus::Waiting);

  auto last = w.ledger.markPlayerWaiting(w.game, w.turn.id, w.bob);
  EXPECT_TRUE(last.completed_set);
  EXPECT_TRUE(w.ledger.allEligibleWaiting(w.game));

  auto again = w.ledger.markPlayerWaiting(w.game, w.turn.id, w.bob);
  EXPECT_FALSE(again.completed_set);
}

// -----------------------------------------------------------------------------
// 5. Suspended players are left out of the eligible count and cannot end
//    the turn themselves.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, SuspendedPlayersAreNotEligible) {
  w.players.setStatus(w.game, w.bob, PlayerStatus::Suspended);

  EXPECT_THROW(w.ledger.markPlayerWaiting(w.game, w.turn.id, w.bob),
               ConflictError);

  auto only = w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice);
  EXPECT_EQ(only.eligible, 1u);
  EXPECT_TRUE(only.completed_set);
}

// -----------------------------------------------------------------------------
// 6. Reset returns every Waiting player to Active and leaves others alone.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, ResetPlayersForNewTurn) {
  auto carol = w.addPlayer("carol");
  w.players.setStatus(w.game, carol, PlayerStatus::Ejected);
  w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice);
  w.ledger.markPlayerWaiting(w.game, w.turn.id, w.bob);

  EXPECT_EQ(w.ledger.resetPlayersForNewTurn(w.game), 2u);

  for (const auto& p : w.ledger.listPlayerStatuses(w.game)) {
    if (p.player_id == carol) {
      EXPECT_EQ(p.status, PlayerStatus::Ejected);
    } else {
      EXPECT_EQ(p.status, PlayerStatus::Active);
    }
  }
  EXPECT_FALSE(w.ledger.allEligibleWaiting(w.game));
}

// -----------------------------------------------------------------------------
// 7. Unknown players are NotFound.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, UnknownPlayerIsNotFound) {
  EXPECT_THROW(w.ledger.markPlayerWaiting(w.game, w.turn.id, 77'777),
               NotFoundError);
}

// -----------------------------------------------------------------------------
// 8. openNextTurn: the new turn is Open with every waiting player already
//    Active, so nobody can see it "complete" before anyone has played it.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, OpenNextTurnResetsReadinessWithTheOpen) {
  w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice);
  w.ledger.markPlayerWaiting(w.game, w.turn.id, w.bob);
  ASSERT_TRUE(w.ledger.markTurnResolving(w.game, 1).has_value());
  ASSERT_TRUE(w.ledger.closeTurn(w.game, 1).has_value());

  auto next = w.ledger.openNextTurn(w.game, 2);
  EXPECT_EQ(next.turn.number, 2u);
  EXPECT_EQ(next.turn.status, TurnStatus::Open);
  EXPECT_EQ(next.players_reset, 2u);
  EXPECT_FALSE(w.ledger.allEligibleWaiting(w.game));

  auto open = w.ledger.getOpenTurn(w.game);
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->id, next.turn.id);

  // Same conflict rule as openTurn.
  EXPECT_THROW(w.ledger.openNextTurn(w.game, 3), ConflictError);
}

// -----------------------------------------------------------------------------
// 9. A player cannot be marked waiting on a turn that is Resolving or Closed.
// -----------------------------------------------------------------------------
TEST_F(TurnLedgerTest, WaitingRequiresTheTurnToBeOpen) {
  ASSERT_TRUE(w.ledger.markTurnResolving(w.game, 1).has_value());
  EXPECT_THROW(w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice),
               ConflictError);

  ASSERT_TRUE(w.ledger.closeTurn(w.game, 1).has_value());
  EXPECT_THROW(w.ledger.markPlayerWaiting(w.game, w.turn.id, w.alice),
               ConflictError);

  for (const auto& p : w.ledger.listPlayerStatuses(w.game)) {
    EXPECT_EQ(p.status, PlayerStatus::Active);
  }
  EXPECT_THROW(w.ledger.markPlayerWaiting(w.game, 88'888, w.alice),
               NotFoundError);
}
