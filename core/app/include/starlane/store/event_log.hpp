#pragma once

#include "starlane/domain/turn_event.hpp"
#include "starlane/store/database.hpp"
#include "starlane/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// EventLog - append-only, per-turn ordered game history
// -----------------------------------------------------------------------------
//
// @brief  Records what happened during a turn so that clients can replay it
//         without re-querying world state.
//
// @details
// seq is assigned as max(seq) + 1 over the events of the same (game, turn),
// inside the same transaction as the append, so it is gap-free and strictly
// increasing even under concurrent appends.
//
// The Transaction overload of append() lets a caller record the event in the
// same atomic step as the state change it describes (one resolved order).
//
// Queries:
//   forPlayerTurn  events of the turn addressed to the player, plus events
//                  addressed to nobody; ordered by seq.
//   forTurn        every event of the turn; ordered by seq.
//   byKind         events of one kind across turns; newest turn first, seq
//                  ascending within a turn; at most `limit` rows.
//
// Thread model: safe from any thread; each call is one transaction.
// -----------------------------------------------------------------------------
class EventLog {
 public:
  static constexpr std::size_t kDefaultKindLimit = 100;

  EventLog(Database& db, const ITimeProvider& clock);

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  domain::TurnEvent append(GameId game, TurnId turn,
                           std::optional<PlayerId> player, std::string kind,
                           nlohmann::json details);

  domain::TurnEvent append(Database::Transaction& tx, GameId game, TurnId turn,
                           std::optional<PlayerId> player, std::string kind,
                           nlohmann::json details);

  std::vector<domain::TurnEvent> forPlayerTurn(GameId game, TurnId turn,
                                               PlayerId player);
  std::vector<domain::TurnEvent> forTurn(GameId game, TurnId turn);
  std::vector<domain::TurnEvent> byKind(GameId game, const std::string& kind,
                                        std::size_t limit = kDefaultKindLimit);

 private:
  Database& db_;
  const ITimeProvider& clock_;
};

}  // namespace starlane
