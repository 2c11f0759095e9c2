#include "starlane/turn/turn_ledger.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

#include <algorithm>

namespace starlane {

namespace {

// Eligible / waiting counts of a game's players.
std::pair<std::size_t, std::size_t> readinessCounts(Tables& t, GameId game) {
  std::size_t eligible = 0;
  std::size_t waiting = 0;
  for (const auto* p : lookup::playersOf(t, game)) {
    if (domain::isEligibleForReadiness(p->status)) {
      ++eligible;
      if (p->status == domain::PlayerStatus::Waiting) {
        ++waiting;
      }
    }
  }
  return {eligible, waiting};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TurnLedger::TurnLedger(Database& db, const ITimeProvider& clock)
    : db_(db), clock_(clock) {}

// -----------------------------------------------------------------------------
// openTurn(): idempotent insert-or-return
// -----------------------------------------------------------------------------
domain::Turn TurnLedger::openTurn(GameId game, std::uint32_t number) {
  auto tx = db_.begin();
  return openTurnInTx(tx, game, number);
}

// -----------------------------------------------------------------------------
// openNextTurn(): open + readiness reset in one transaction
// -----------------------------------------------------------------------------
NextTurn TurnLedger::openNextTurn(GameId game, std::uint32_t number) {
  auto tx = db_.begin();
  NextTurn result;
  result.turn = openTurnInTx(tx, game, number);
  result.players_reset = resetPlayersInTx(tx, game);
  return result;
}

domain::Turn TurnLedger::openTurnInTx(Database::Transaction& tx, GameId game,
                                      std::uint32_t number) {
  if (number == 0) {
    throw ValidationError("turn numbers start at 1");
  }
  lookup::requireGame(tx.tables(), game);

  if (auto* existing = lookup::findTurnByNumber(tx.tables(), game, number)) {
    return *existing;
  }
  if (auto* open = lookup::findOpenTurn(tx.tables(), game)) {
    throw ConflictError("game " + std::to_string(game) + " already has turn " +
                        std::to_string(open->number) + " open");
  }

  domain::Turn turn;
  turn.id = tx.nextId();
  turn.game_id = game;
  turn.number = number;
  turn.status = domain::TurnStatus::Open;
  turn.opened_at_ms = clock_.now_ms();
  tx->turns.emplace(turn.id, turn);
  return turn;
}

// -----------------------------------------------------------------------------
// getOpenTurn() / getTurn() / getTurnByNumber()
// -----------------------------------------------------------------------------
std::optional<domain::Turn> TurnLedger::getOpenTurn(GameId game) {
  auto tx = db_.begin();
  if (auto* open = lookup::findOpenTurn(tx.tables(), game)) {
    return *open;
  }
  return std::nullopt;
}

std::optional<domain::Turn> TurnLedger::getTurn(GameId game, TurnId turn) {
  auto tx = db_.begin();
  auto it = tx->turns.find(turn);
  if (it == tx->turns.end() || it->second.game_id != game) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Turn> TurnLedger::getTurnByNumber(GameId game,
                                                        std::uint32_t number) {
  auto tx = db_.begin();
  if (auto* turn = lookup::findTurnByNumber(tx.tables(), game, number)) {
    return *turn;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// listTurns()
// -----------------------------------------------------------------------------
std::vector<domain::Turn> TurnLedger::listTurns(GameId game) {
  auto tx = db_.begin();
  std::vector<domain::Turn> result;
  for (const auto& [id, turn] : tx->turns) {
    if (turn.game_id == game) {
      result.push_back(turn);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.number < b.number; });
  return result;
}

// -----------------------------------------------------------------------------
// markTurnResolving(): guarded Open -> Resolving
// -----------------------------------------------------------------------------
std::optional<domain::Turn> TurnLedger::markTurnResolving(
    GameId game, std::uint32_t number) {
  auto tx = db_.begin();
  auto* turn = lookup::findTurnByNumber(tx.tables(), game, number);
  if (turn == nullptr || turn->status != domain::TurnStatus::Open) {
    return std::nullopt;
  }
  turn->status = domain::TurnStatus::Resolving;
  return *turn;
}

// -----------------------------------------------------------------------------
// closeTurn(): guarded Open|Resolving -> Closed
// -----------------------------------------------------------------------------
std::optional<domain::Turn> TurnLedger::closeTurn(GameId game,
                                                  std::uint32_t number) {
  auto tx = db_.begin();
  auto* turn = lookup::findTurnByNumber(tx.tables(), game, number);
  if (turn == nullptr || turn->status == domain::TurnStatus::Closed) {
    return std::nullopt;
  }
  turn->status = domain::TurnStatus::Closed;
  turn->closed_at_ms = clock_.now_ms();
  return *turn;
}

// -----------------------------------------------------------------------------
// markPlayerWaiting(): atomic transition + completion check
// -----------------------------------------------------------------------------
ReadinessTransition TurnLedger::markPlayerWaiting(GameId game, TurnId turn,
                                                  PlayerId player) {
  auto tx = db_.begin();
  const auto& current = lookup::requireTurn(tx.tables(), game, turn);
  if (current.status != domain::TurnStatus::Open) {
    throw ConflictError("turn " + std::to_string(current.number) +
                        " of game " + std::to_string(game) + " is " +
                        domain::toString(current.status) +
                        " and no longer accepts end-turn");
  }
  auto& row = lookup::requirePlayer(tx.tables(), game, player);
  if (!domain::isEligibleForReadiness(row.status)) {
    throw ConflictError("player " + std::to_string(player) + " is " +
                        domain::toString(row.status) +
                        " and cannot end the turn");
  }

  ReadinessTransition result;
  result.player_id = player;
  result.previous = row.status;

  if (row.status == domain::PlayerStatus::Active) {
    row.status = domain::PlayerStatus::Waiting;
    result.transitioned = true;
  }

  auto [eligible, waiting] = readinessCounts(tx.tables(), game);
  result.eligible = eligible;
  result.waiting = waiting;
  result.completed_set = result.transitioned && waiting == eligible;
  return result;
}

// -----------------------------------------------------------------------------
// allEligibleWaiting()
// -----------------------------------------------------------------------------
bool TurnLedger::allEligibleWaiting(GameId game) {
  auto tx = db_.begin();
  auto [eligible, waiting] = readinessCounts(tx.tables(), game);
  return eligible > 0 && waiting == eligible;
}

// -----------------------------------------------------------------------------
// resetPlayersForNewTurn()
// -----------------------------------------------------------------------------
std::size_t TurnLedger::resetPlayersForNewTurn(GameId game) {
  auto tx = db_.begin();
  return resetPlayersInTx(tx, game);
}

std::size_t TurnLedger::resetPlayersInTx(Database::Transaction& tx,
                                         GameId game) {
  std::size_t reset = 0;
  for (auto* p : lookup::playersOf(tx.tables(), game)) {
    if (p->status == domain::PlayerStatus::Waiting) {
      p->status = domain::PlayerStatus::Active;
      ++reset;
    }
  }
  return reset;
}

// -----------------------------------------------------------------------------
// listPlayerStatuses()
// -----------------------------------------------------------------------------
std::vector<PlayerReadiness> TurnLedger::listPlayerStatuses(GameId game) {
  auto tx = db_.begin();
  std::vector<PlayerReadiness> result;
  for (const auto* p : lookup::playersOf(tx.tables(), game)) {
    result.push_back({p->id, p->name, p->type, p->status});
  }
  return result;
}

}  // namespace starlane
