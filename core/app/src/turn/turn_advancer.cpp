#include "starlane/turn/turn_advancer.hpp"

#include <exception>
#include <iostream>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TurnAdvancer::TurnAdvancer(TurnLedger& ledger,
                           StandingOrderMaterializer& materializer,
                           INotificationSink& sink, const ITimeProvider& clock)
    : ledger_(ledger),
      materializer_(materializer),
      sink_(sink),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// advance()
// -----------------------------------------------------------------------------
std::optional<TurnAdvance> TurnAdvancer::advance(
    GameId game, const domain::Turn& resolved) {
  auto closed = ledger_.closeTurn(game, resolved.number);
  if (!closed) {
    std::cerr << "[TurnAdvancer] game " << game << " turn " << resolved.number
              << " is not open or resolving; nothing to advance.\n";
    return std::nullopt;
  }

  TurnAdvance result;
  result.closed = *closed;
  const auto next = ledger_.openNextTurn(game, resolved.number + 1);
  result.opened = next.turn;
  result.players_reset = next.players_reset;
  result.standing_orders = materializer_.materialize(game, result.opened.id);

  std::cout << "[TurnAdvancer] game " << game << ": turn "
            << result.closed.number << " closed, turn "
            << result.opened.number << " open ("
            << result.standing_orders.auto_build_orders << " auto build, "
            << result.standing_orders.auto_move_orders << " auto move, "
            << result.players_reset << " player(s) reset).\n";

  const TimestampMs now = clock_.now_ms();
  notify(TurnAdvancedEvent{game, result.closed.id, result.closed.number,
                           result.opened.id, result.opened.number, now});
  notify(TurnOpenedEvent{game, result.opened.id, result.opened.number, now});
  return result;
}

// -----------------------------------------------------------------------------
// notify()
// -----------------------------------------------------------------------------
void TurnAdvancer::notify(Event event) {
  try {
    sink_.publish(std::move(event));
  } catch (const std::exception& e) {
    std::cerr << "[TurnAdvancer] notification sink failed: " << e.what()
              << "\n";
  }
}

}  // namespace starlane
