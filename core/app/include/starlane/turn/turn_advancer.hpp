#pragma once

#include "starlane/domain/turn.hpp"
#include "starlane/orders/standing_order_materializer.hpp"
#include "starlane/time/i_time_provider.hpp"
#include "starlane/turn/i_notification_sink.hpp"
#include "starlane/turn/turn_ledger.hpp"

#include <cstddef>
#include <optional>

namespace starlane {

// Result of moving a game from one turn to the next.
struct TurnAdvance {
  domain::Turn closed;
  domain::Turn opened;
  std::size_t players_reset{0};
  MaterializeReport standing_orders;
};

// -----------------------------------------------------------------------------
// TurnAdvancer - closes a resolved turn and opens the next one
// -----------------------------------------------------------------------------
//
// @brief  The tail of turn resolution: close, open number + 1 with
//         readiness reset, materialize standing orders, notify.
//
// @details
// Steps of advance(game, resolved):
//   1. closeTurn(resolved.number). When the turn is already Closed the
//      call is a duplicate trigger and advance() returns std::nullopt
//      without touching anything else.
//   2. TurnLedger::openNextTurn(resolved.number + 1): the new turn is
//      inserted Open and every Waiting player goes back to Active in the
//      same transaction
//   3. StandingOrderMaterializer::materialize() for the new turn
//   4. TurnAdvancedEvent followed by TurnOpenedEvent to the sink
//
// A sink that throws is logged; the turn has already advanced.
//
// Thread model: called by the single caller that resolved the turn.
// -----------------------------------------------------------------------------
class TurnAdvancer {
 public:
  TurnAdvancer(TurnLedger& ledger, StandingOrderMaterializer& materializer,
               INotificationSink& sink, const ITimeProvider& clock);

  TurnAdvancer(const TurnAdvancer&) = delete;
  TurnAdvancer& operator=(const TurnAdvancer&) = delete;

  std::optional<TurnAdvance> advance(GameId game,
                                     const domain::Turn& resolved);

 private:
  void notify(Event event);

  TurnLedger& ledger_;
  StandingOrderMaterializer& materializer_;
  INotificationSink& sink_;
  const ITimeProvider& clock_;
};

}  // namespace starlane
