#pragma once

#include "starlane/domain/player.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/store/database.hpp"
#include "starlane/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// ReadinessTransition - outcome of one markPlayerWaiting() call
// -----------------------------------------------------------------------------
//   transitioned   this call moved the player Active -> Waiting
//   completed_set  this call was the one that made every eligible player
//                  Waiting; at most one call per turn observes true
// -----------------------------------------------------------------------------
struct ReadinessTransition {
  PlayerId player_id{0};
  domain::PlayerStatus previous{domain::PlayerStatus::Active};
  bool transitioned{false};
  bool completed_set{false};
  std::size_t waiting{0};
  std::size_t eligible{0};
};

// Result of openNextTurn(): the opened turn and how many players went
// Waiting -> Active in the same transaction.
struct NextTurn {
  domain::Turn turn;
  std::size_t players_reset{0};
};

struct PlayerReadiness {
  PlayerId player_id{0};
  std::string name;
  domain::PlayerType type{domain::PlayerType::Human};
  domain::PlayerStatus status{domain::PlayerStatus::Active};
};

// -----------------------------------------------------------------------------
// TurnLedger - turn lifecycle and player readiness
// -----------------------------------------------------------------------------
//
// @brief  Owns the Open -> Resolving -> Closed lifecycle of turns and the
//         Active <-> Waiting readiness cycle of players.
//
// @details
// Turns:
//   openTurn(game, n)      returns turn n when it exists; otherwise inserts
//                          it Open. Inserting while a different turn is
//                          Open is a ConflictError, so a game never has two
//                          open turns.
//   openNextTurn(game, n)  openTurn() plus the Waiting -> Active reset, in
//                          one transaction. No caller can observe the new
//                          turn Open while last turn's players still wait.
//   markTurnResolving      Open -> Resolving; std::nullopt when the turn is
//                          not Open (a duplicate trigger is a no-op).
//   closeTurn              Open|Resolving -> Closed, stamps closed_at;
//                          std::nullopt when already Closed or missing.
//
// Readiness:
//   markPlayerWaiting() performs the transition and the "is everybody
//   waiting now?" check in one transaction, after checking that the given
//   turn is still Open (ConflictError otherwise). Only Active and Waiting
//   players are eligible; Suspended and Ejected players never hold up a
//   turn and cannot end one (ConflictError). The caller that receives
//   completed_set == true is the only one allowed to resolve the turn.
//
// Thread model: every call is one Database transaction.
// -----------------------------------------------------------------------------
class TurnLedger {
 public:
  TurnLedger(Database& db, const ITimeProvider& clock);

  TurnLedger(const TurnLedger&) = delete;
  TurnLedger& operator=(const TurnLedger&) = delete;

  domain::Turn openTurn(GameId game, std::uint32_t number);
  NextTurn openNextTurn(GameId game, std::uint32_t number);

  std::optional<domain::Turn> getOpenTurn(GameId game);
  std::optional<domain::Turn> getTurn(GameId game, TurnId turn);
  std::optional<domain::Turn> getTurnByNumber(GameId game,
                                              std::uint32_t number);

  // Every turn of the game, by number.
  std::vector<domain::Turn> listTurns(GameId game);

  std::optional<domain::Turn> markTurnResolving(GameId game,
                                                std::uint32_t number);
  std::optional<domain::Turn> closeTurn(GameId game, std::uint32_t number);

  ReadinessTransition markPlayerWaiting(GameId game, TurnId turn,
                                        PlayerId player);

  // -------------------------------------------------------------------------
  // allEligibleWaiting(game)
  // -------------------------------------------------------------------------
  // True when the game has at least one eligible player and all of them are
  // Waiting. Used after a suspend/eject, which can complete the set without
  // anybody ending a turn.
  // -------------------------------------------------------------------------
  bool allEligibleWaiting(GameId game);

  // Waiting -> Active for every player of the game; returns how many moved.
  std::size_t resetPlayersForNewTurn(GameId game);

  std::vector<PlayerReadiness> listPlayerStatuses(GameId game);

 private:
  domain::Turn openTurnInTx(Database::Transaction& tx, GameId game,
                            std::uint32_t number);
  std::size_t resetPlayersInTx(Database::Transaction& tx, GameId game);

  Database& db_;
  const ITimeProvider& clock_;
};

}  // namespace starlane
