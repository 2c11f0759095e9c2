#include "starlane/ai/world_view.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

#include <string>

namespace starlane {

WorldViewBuilder::WorldViewBuilder(Database& db) : db_(db) {}

// -----------------------------------------------------------------------------
// build()
// -----------------------------------------------------------------------------
WorldView WorldViewBuilder::build(GameId game, PlayerId viewer) {
  auto tx = db_.begin();
  auto& t = tx.tables();

  WorldView view;
  view.game = lookup::requireGame(t, game);
  lookup::requirePlayer(t, game, viewer);
  view.viewer = viewer;

  const auto* turn = lookup::findOpenTurn(t, game);
  if (turn == nullptr) {
    throw ConflictError("game " + std::to_string(game) + " has no open turn");
  }
  view.turn = *turn;
  view.galaxy = lookup::requireGalaxy(t, game);

  for (const auto* p : lookup::playersOf(t, game)) {
    view.players.push_back(*p);
  }
  for (const auto& [key, state] : t.star_states) {
    if (key.first == game) {
      view.stars.push_back(state);
    }
  }
  for (const auto& [id, ship] : t.ships) {
    if (ship.game_id == game) {
      view.ships.push_back(ship);
    }
  }
  return view;
}

}  // namespace starlane
