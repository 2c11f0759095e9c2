#include "starlane/store/event_log.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

#include <algorithm>
#include <map>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EventLog::EventLog(Database& db, const ITimeProvider& clock)
    : db_(db), clock_(clock) {}

// -----------------------------------------------------------------------------
// append(): own transaction
// -----------------------------------------------------------------------------
domain::TurnEvent EventLog::append(GameId game, TurnId turn,
                                   std::optional<PlayerId> player,
                                   std::string kind, nlohmann::json details) {
  auto tx = db_.begin();
  return append(tx, game, turn, player, std::move(kind), std::move(details));
}

// -----------------------------------------------------------------------------
// append(): caller's transaction
// -----------------------------------------------------------------------------
domain::TurnEvent EventLog::append(Database::Transaction& tx, GameId game,
                                   TurnId turn, std::optional<PlayerId> player,
                                   std::string kind, nlohmann::json details) {
  if (kind.empty()) {
    throw ValidationError("event kind is required");
  }
  lookup::requireTurn(tx.tables(), game, turn);
  if (player) {
    lookup::requirePlayer(tx.tables(), game, *player);
  }

  std::uint64_t max_seq = 0;
  for (const auto& e : tx->events) {
    if (e.game_id == game && e.turn_id == turn) {
      max_seq = std::max(max_seq, e.seq);
    }
  }

  domain::TurnEvent event;
  event.id = tx.nextId();
  event.game_id = game;
  event.turn_id = turn;
  event.player_id = player;
  event.seq = max_seq + 1;
  event.kind = std::move(kind);
  event.details = std::move(details);
  event.created_at_ms = clock_.now_ms();

  tx->events.push_back(event);
  return event;
}

// -----------------------------------------------------------------------------
// forPlayerTurn()
// -----------------------------------------------------------------------------
std::vector<domain::TurnEvent> EventLog::forPlayerTurn(GameId game,
                                                       TurnId turn,
                                                       PlayerId player) {
  auto tx = db_.begin();
  std::vector<domain::TurnEvent> result;
  for (const auto& e : tx->events) {
    if (e.game_id == game && e.turn_id == turn &&
        (!e.player_id || *e.player_id == player)) {
      result.push_back(e);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.seq < b.seq; });
  return result;
}

// -----------------------------------------------------------------------------
// forTurn()
// -----------------------------------------------------------------------------
std::vector<domain::TurnEvent> EventLog::forTurn(GameId game, TurnId turn) {
  auto tx = db_.begin();
  std::vector<domain::TurnEvent> result;
  for (const auto& e : tx->events) {
    if (e.game_id == game && e.turn_id == turn) {
      result.push_back(e);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.seq < b.seq; });
  return result;
}

// -----------------------------------------------------------------------------
// byKind()
// -----------------------------------------------------------------------------
std::vector<domain::TurnEvent> EventLog::byKind(GameId game,
                                                const std::string& kind,
                                                std::size_t limit) {
  auto tx = db_.begin();

  std::map<TurnId, std::uint32_t> turn_numbers;
  for (const auto& [id, turn] : tx->turns) {
    if (turn.game_id == game) {
      turn_numbers.emplace(id, turn.number);
    }
  }

  std::vector<domain::TurnEvent> result;
  for (const auto& e : tx->events) {
    if (e.game_id == game && e.kind == kind) {
      result.push_back(e);
    }
  }

  std::sort(result.begin(), result.end(),
            [&turn_numbers](const auto& a, const auto& b) {
              auto na = turn_numbers[a.turn_id];
              auto nb = turn_numbers[b.turn_id];
              if (na != nb) {
                return na > nb;
              }
              return a.seq < b.seq;
            });

  if (result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

}  // namespace starlane
