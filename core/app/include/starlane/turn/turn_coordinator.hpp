#pragma once

#include "starlane/domain/order.hpp"
#include "starlane/orders/order_store.hpp"
#include "starlane/resolution/resolution_engine.hpp"
#include "starlane/time/i_time_provider.hpp"
#include "starlane/turn/i_notification_sink.hpp"
#include "starlane/turn/turn_advancer.hpp"
#include "starlane/turn/turn_ledger.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// EndTurnResult
// -----------------------------------------------------------------------------
//   finalized_orders  the final rows written for the player
//   transitioned      the player moved Active -> Waiting with this call
//   completed_set     this call completed the set and resolved the turn
//   resolution        present only when this call resolved the turn
//   advance           present only when this call resolved the turn
// -----------------------------------------------------------------------------
struct EndTurnResult {
  GameId game_id{0};
  PlayerId player_id{0};
  TurnId turn_id{0};
  std::uint32_t turn_number{0};
  std::vector<domain::OrderRecord> finalized_orders;
  bool transitioned{false};
  bool completed_set{false};
  std::optional<ResolutionReport> resolution;
  std::optional<TurnAdvance> advance;
};

// Outcome of a resolution triggered by this coordinator.
struct TurnCompletion {
  ResolutionReport resolution;
  std::optional<TurnAdvance> advance;
};

// -----------------------------------------------------------------------------
// TurnCoordinator - the end-turn path shared by humans and AI players
// -----------------------------------------------------------------------------
//
// @brief  Finalizes a player's orders, marks them waiting and, when that
//         completes the set of eligible players, resolves and advances the
//         turn on the calling thread.
//
// @details
// endPlayerTurn(game, player):
//   1. Look up the open turn (ConflictError when the game has none).
//   2. OrderStore::finalizePlayerTurn() for the player.
//   3. TurnLedger::markPlayerWaiting() against that turn (ConflictError if
//      it stopped being Open meanwhile); PlayerReadyEvent to the sink.
//   4. If this call completed the set: markTurnResolving() as a second
//      guard, ResolutionEngine::resolve(), TurnResolvedEvent to the sink,
//      TurnAdvancer::advance().
//
// A resolver that throws is logged and the turn still advances with an
// empty report. An advance that throws is logged, the turn is closed and
// every player is reset to Active, so the game is never left Resolving.
//
// Exactly-once resolution rests on two atomic steps: only one
// markPlayerWaiting() per turn reports completed_set, and only one
// markTurnResolving() per turn succeeds. resolveIfComplete() goes through
// the same guard, so it is safe to call after a suspend or eject even
// while end-turn calls are in flight.
//
// Thread model: safe to call from many threads; no lock is held across
// steps.
//
// Ownership: borrows every collaborator; owned by TurnEngine.
// -----------------------------------------------------------------------------
class TurnCoordinator {
 public:
  TurnCoordinator(OrderStore& orders, TurnLedger& ledger,
                  ResolutionEngine& resolver, TurnAdvancer& advancer,
                  INotificationSink& sink, const ITimeProvider& clock);

  TurnCoordinator(const TurnCoordinator&) = delete;
  TurnCoordinator& operator=(const TurnCoordinator&) = delete;

  EndTurnResult endPlayerTurn(GameId game, PlayerId player);

  // -------------------------------------------------------------------------
  // resolveIfComplete(game)
  // -------------------------------------------------------------------------
  // Resolves the open turn when every eligible player is already waiting.
  // Returns std::nullopt when there is nothing to do or another caller
  // resolved the turn first.
  // -------------------------------------------------------------------------
  std::optional<TurnCompletion> resolveIfComplete(GameId game);

 private:
  std::optional<TurnCompletion> resolveTurn(GameId game,
                                            std::uint32_t number);
  void recoverFailedAdvance(GameId game, std::uint32_t number);

  void notify(Event event);

  OrderStore& orders_;
  TurnLedger& ledger_;
  ResolutionEngine& resolver_;
  TurnAdvancer& advancer_;
  INotificationSink& sink_;
  const ITimeProvider& clock_;
};

}  // namespace starlane
