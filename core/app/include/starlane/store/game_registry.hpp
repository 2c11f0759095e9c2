#pragma once

#include "starlane/domain/galaxy.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/store/database.hpp"
#include "starlane/time/i_time_provider.hpp"

#include <optional>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// GameRegistry - games and their galaxy topology
// -----------------------------------------------------------------------------
//
// @brief  Creates games, tracks their lifecycle status and stores the
//         read-only star/wormhole graph supplied by the galaxy generator.
//
// @details
// storeGalaxy() validates the graph (non-empty, unique star ids, wormhole
// endpoints known, no self loops) and rejects it with ValidationError.
// A game's galaxy is written once; storing a second one is a ConflictError.
//
// Thread model: every call runs in its own Database transaction.
// -----------------------------------------------------------------------------
class GameRegistry {
 public:
  GameRegistry(Database& db, const ITimeProvider& clock);

  GameRegistry(const GameRegistry&) = delete;
  GameRegistry& operator=(const GameRegistry&) = delete;

  // Assigns id and created_at; the rest of `game` is stored as given.
  domain::Game createGame(domain::Game game);

  std::optional<domain::Game> getGame(GameId game);
  std::vector<domain::Game> listGames();

  void setStatus(GameId game, domain::GameStatus status);

  void storeGalaxy(GameId game, domain::GalaxyTopology topology);
  domain::GalaxyTopology getGalaxy(GameId game);

  // Throws ValidationError for the graph problems listed above.
  static void validateTopology(const domain::GalaxyTopology& topology);

 private:
  Database& db_;
  const ITimeProvider& clock_;
};

}  // namespace starlane
