#include "starlane/turn/turn_coordinator.hpp"

#include "starlane/domain/errors.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TurnCoordinator::TurnCoordinator(OrderStore& orders, TurnLedger& ledger,
                                 ResolutionEngine& resolver,
                                 TurnAdvancer& advancer,
                                 INotificationSink& sink,
                                 const ITimeProvider& clock)
    : orders_(orders),
      ledger_(ledger),
      resolver_(resolver),
      advancer_(advancer),
      sink_(sink),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// endPlayerTurn()
// -----------------------------------------------------------------------------
EndTurnResult TurnCoordinator::endPlayerTurn(GameId game, PlayerId player) {
  const auto turn = ledger_.getOpenTurn(game);
  if (!turn) {
    throw ConflictError("game " + std::to_string(game) + " has no open turn");
  }

  EndTurnResult result;
  result.game_id = game;
  result.player_id = player;
  result.turn_id = turn->id;
  result.turn_number = turn->number;
  result.finalized_orders = orders_.finalizePlayerTurn(game, turn->id, player);

  const auto readiness = ledger_.markPlayerWaiting(game, turn->id, player);
  result.transitioned = readiness.transitioned;

  std::cout << "[TurnCoordinator] game " << game << " turn " << turn->number
            << ": player " << player << " ended turn with "
            << result.finalized_orders.size() << " order(s) ("
            << readiness.waiting << "/" << readiness.eligible
            << " waiting).\n";

  notify(PlayerReadyEvent{game, turn->id, player, readiness.completed_set,
                          clock_.now_ms()});

  if (readiness.completed_set) {
    if (auto completion = resolveTurn(game, turn->number)) {
      result.completed_set = true;
      result.resolution = std::move(completion->resolution);
      result.advance = std::move(completion->advance);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// resolveIfComplete()
// -----------------------------------------------------------------------------
std::optional<TurnCompletion> TurnCoordinator::resolveIfComplete(GameId game) {
  const auto turn = ledger_.getOpenTurn(game);
  if (!turn || !ledger_.allEligibleWaiting(game)) {
    return std::nullopt;
  }
  return resolveTurn(game, turn->number);
}

// -----------------------------------------------------------------------------
// resolveTurn(): Open -> Resolving guard, resolve, advance
// -----------------------------------------------------------------------------
std::optional<TurnCompletion> TurnCoordinator::resolveTurn(
    GameId game, std::uint32_t number) {
  const auto resolving = ledger_.markTurnResolving(game, number);
  if (!resolving) {
    std::cout << "[TurnCoordinator] game " << game << " turn " << number
              << " is already being resolved.\n";
    return std::nullopt;
  }

  TurnCompletion completion;
  try {
    completion.resolution = resolver_.resolve(game, *resolving);
  } catch (const std::exception& e) {
    std::cerr << "[TurnCoordinator] game " << game << " turn " << number
              << ": resolution failed, advancing without it: " << e.what()
              << "\n";
    completion.resolution = ResolutionReport{};
    completion.resolution.game_id = game;
    completion.resolution.turn_id = resolving->id;
    completion.resolution.turn_number = resolving->number;
  }

  const auto& report = completion.resolution;
  notify(TurnResolvedEvent{game, resolving->id, resolving->number,
                           report.ships_built, report.stars_expanded,
                           report.ships_moved, report.failureCount(),
                           clock_.now_ms()});

  try {
    completion.advance = advancer_.advance(game, *resolving);
  } catch (const std::exception& e) {
    std::cerr << "[TurnCoordinator] game " << game << " turn " << number
              << ": advance failed: " << e.what() << "\n";
    recoverFailedAdvance(game, number);
  }
  return completion;
}

// -----------------------------------------------------------------------------
// recoverFailedAdvance(): never leave a turn Resolving or players Waiting
// -----------------------------------------------------------------------------
void TurnCoordinator::recoverFailedAdvance(GameId game, std::uint32_t number) {
  try {
    ledger_.closeTurn(game, number);
    const auto reset = ledger_.resetPlayersForNewTurn(game);
    const auto open = ledger_.getOpenTurn(game);
    std::cerr << "[TurnCoordinator] game " << game << ": turn " << number
              << " closed, " << reset << " player(s) reset, "
              << (open ? "turn " + std::to_string(open->number) + " is open"
                       : std::string("no turn is open"))
              << ".\n";
  } catch (const std::exception& e) {
    std::cerr << "[TurnCoordinator] game " << game
              << ": recovery after failed advance also failed: " << e.what()
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// notify()
// -----------------------------------------------------------------------------
void TurnCoordinator::notify(Event event) {
  try {
    sink_.publish(std::move(event));
  } catch (const std::exception& e) {
    std::cerr << "[TurnCoordinator] notification sink failed: " << e.what()
              << "\n";
  }
}

}  // namespace starlane
