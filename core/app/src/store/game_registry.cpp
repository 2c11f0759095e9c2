#include "starlane/store/game_registry.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

#include <set>
#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
GameRegistry::GameRegistry(Database& db, const ITimeProvider& clock)
    : db_(db), clock_(clock) {}

// -----------------------------------------------------------------------------
// createGame()
// -----------------------------------------------------------------------------
domain::Game GameRegistry::createGame(domain::Game game) {
  if (!game.params.is_object()) {
    throw ValidationError("game params must be a JSON object");
  }
  auto tx = db_.begin();
  game.id = tx.nextId();
  game.created_at_ms = clock_.now_ms();
  tx->games.emplace(game.id, game);
  return game;
}

// -----------------------------------------------------------------------------
// getGame() / listGames()
// -----------------------------------------------------------------------------
std::optional<domain::Game> GameRegistry::getGame(GameId game) {
  auto tx = db_.begin();
  auto it = tx->games.find(game);
  if (it == tx->games.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Game> GameRegistry::listGames() {
  auto tx = db_.begin();
  std::vector<domain::Game> result;
  for (const auto& [id, g] : tx->games) {
    result.push_back(g);
  }
  return result;
}

// -----------------------------------------------------------------------------
// setStatus()
// -----------------------------------------------------------------------------
void GameRegistry::setStatus(GameId game, domain::GameStatus status) {
  auto tx = db_.begin();
  lookup::requireGame(tx.tables(), game).status = status;
}

// -----------------------------------------------------------------------------
// validateTopology()
// -----------------------------------------------------------------------------
void GameRegistry::validateTopology(
    const domain::GalaxyTopology& topology) {
  if (topology.stars.empty()) {
    throw ValidationError("galaxy has no stars");
  }
  std::set<StarId> ids;
  for (const auto& star : topology.stars) {
    if (star.id.empty()) {
      throw ValidationError("galaxy star with empty id");
    }
    if (!ids.insert(star.id).second) {
      throw ValidationError("duplicate star id '" + star.id + "'");
    }
  }
  for (const auto& w : topology.wormholes) {
    if (ids.count(w.a) == 0 || ids.count(w.b) == 0) {
      throw ValidationError("wormhole " + w.a + " <-> " + w.b +
                            " references an unknown star");
    }
    if (w.a == w.b) {
      throw ValidationError("wormhole loops on star '" + w.a + "'");
    }
  }
}

// -----------------------------------------------------------------------------
// storeGalaxy()
// -----------------------------------------------------------------------------
void GameRegistry::storeGalaxy(GameId game, domain::GalaxyTopology topology) {
  validateTopology(topology);
  auto tx = db_.begin();
  lookup::requireGame(tx.tables(), game);
  if (tx->galaxies.count(game) != 0) {
    throw ConflictError("game " + std::to_string(game) +
                        " already has a galaxy");
  }
  tx->galaxies.emplace(game, std::move(topology));
}

// -----------------------------------------------------------------------------
// getGalaxy()
// -----------------------------------------------------------------------------
domain::GalaxyTopology GameRegistry::getGalaxy(GameId game) {
  auto tx = db_.begin();
  return lookup::requireGalaxy(tx.tables(), game);
}

}  // namespace starlane
