// =============================================================================
// event_log_test.cpp
// =============================================================================
// Unit tests for starlane::EventLog.
//
// Validates:
//   - seq is dense and increasing per (game, turn)
//   - forPlayerTurn returns the player's own events plus public ones
//   - byKind orders newest turn first, then seq, and honours the limit
//   - Appends are validated (kind, turn, player)
//   - append(tx, ...) joins a caller's transaction
// =============================================================================

#include "starlane/domain/errors.hpp"
#include "starlane/store/event_log.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using starlane::NotFoundError;
using starlane::ValidationError;
using starlane::test_support::TestWorld;
using json = nlohmann::json;

class EventLogTest : public ::testing::Test {
 protected:
  TestWorld w;
};

// -----------------------------------------------------------------------------
// 1. seq starts at 1 and increases per turn.
// -----------------------------------------------------------------------------
TEST_F(EventLogTest, SeqIncreasesWithinTurn) {
  auto a = w.events.append(w.game, w.turn.id, w.alice, "ships_built",
                           json{{"n", 1}});
  auto b = w.events.append(w.game, w.turn.id, std::nullopt, "turn_resolved",
                           json::object());
  auto c = w.events.append(w.game, w.turn.id, w.bob, "ships_moved",
                           json::object());

  EXPECT_EQ(a.seq, 1u);
  EXPECT_EQ(b.seq, 2u);
  EXPECT_EQ(c.seq, 3u);
  EXPECT_EQ(a.created_at_ms, 1'000);

  auto all = w.events.forTurn(w.game, w.turn.id);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].kind, "ships_built");
  EXPECT_EQ(all[0].details.at("n"), 1);
  EXPECT_EQ(all[2].kind, "ships_moved");
}

// -----------------------------------------------------------------------------
// 2. A new turn restarts the sequence.
// -----------------------------------------------------------------------------
TEST_F(EventLogTest, SeqRestartsPerTurn) {
  w.events.append(w.game, w.turn.id, std::nullopt, "turn_resolved",
                  json::object());
  w.ledger.closeTurn(w.game, 1);
  auto next = w.ledger.openTurn(w.game, 2);

  auto first = w.events.append(w.game, next.id, std::nullopt, "turn_resolved",
                               json::object());
  EXPECT_EQ(first.seq, 1u);
}

// -----------------------------------------------------------------------------
// 3. A player sees their own events and public ones, never another
//    player's.
// -----------------------------------------------------------------------------
TEST_F(EventLogTest, PlayerScopedQuery) {
  w.events.append(w.game, w.turn.id, w.alice, "ships_built", json::object());
  w.events.append(w.game, w.turn.id, w.bob, "ships_built", json::object());
  w.events.append(w.game, w.turn.id, std::nullopt, "turn_resolved",
                  json::object());

  auto mine = w.events.forPlayerTurn(w.game, w.turn.id, w.alice);
  ASSERT_EQ(mine.size(), 2u);
  ASSERT_TRUE(mine[0].player_id.has_value());
  EXPECT_EQ(*mine[0].player_id, w.alice);
  EXPECT_FALSE(mine[1].player_id.has_value());
}

// -----------------------------------------------------------------------------
// 4. byKind lists the newest turn first and is capped by the limit.
// -----------------------------------------------------------------------------
TEST_F(EventLogTest, ByKindNewestTurnFirst) {
  w.events.append(w.game, w.turn.id, w.alice, "ships_built",
                  json{{"turn", 1}});
  w.events.append(w.game, w.turn.id, w.alice, "ships_moved", json::object());
  w.ledger.closeTurn(w.game, 1);
  auto next = w.ledger.openTurn(w.game, 2);
  w.events.append(w.game, next.id, w.alice, "ships_built", json{{"turn", 2}});
  w.events.append(w.game, next.id, w.bob, "ships_built", json{{"turn", 2}});

  auto built = w.events.byKind(w.game, "ships_built");
  ASSERT_EQ(built.size(), 3u);
  EXPECT_EQ(built[0].details.at("turn"), 2);
  EXPECT_LT(built[0].seq, built[1].seq);
  EXPECT_EQ(built[2].details.at("turn"), 1);

  EXPECT_EQ(w.events.byKind(w.game, "ships_built", 1).size(), 1u);
  EXPECT_TRUE(w.events.byKind(w.game, "industry_expanded").empty());
}

// -----------------------------------------------------------------------------
// 5. Bad appends are rejected without writing anything.
// -----------------------------------------------------------------------------
TEST_F(EventLogTest, RejectsInvalidAppend) {
  EXPECT_THROW(w.events.append(w.game, w.turn.id, w.alice, "", json::object()),
               ValidationError);
  EXPECT_THROW(w.events.append(w.game, 9'999, w.alice, "x", json::object()),
               NotFoundError);
  EXPECT_THROW(w.events.append(w.game, w.turn.id, 9'999, "x", json::object()),
               NotFoundError);
  EXPECT_TRUE(w.events.forTurn(w.game, w.turn.id).empty());
}

// -----------------------------------------------------------------------------
// 6. The transaction overload writes inside the caller's transaction.
// -----------------------------------------------------------------------------
TEST_F(EventLogTest, AppendJoinsTransaction) {
  {
    auto tx = w.db.begin();
    w.events.append(tx, w.game, w.turn.id, std::nullopt, "turn_resolved",
                    json::object());
    w.events.append(tx, w.game, w.turn.id, std::nullopt, "turn_resolved",
                    json::object());
    EXPECT_EQ(tx->events.size(), 2u);
  }
  EXPECT_EQ(w.events.byKind(w.game, "turn_resolved").size(), 2u);
}
