#pragma once

#include "starlane/domain/galaxy.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/domain/player.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/store/database.hpp"

#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// WorldView - what an AI player sees when it takes its turn
// -----------------------------------------------------------------------------
// A copy of the game state taken in one transaction, so the strategy can
// read it freely without holding the Database lock. Visibility is complete:
// every star state and every ship of the game is included.
// -----------------------------------------------------------------------------
struct WorldView {
  domain::Game game;
  domain::Turn turn;
  PlayerId viewer{0};
  domain::GalaxyTopology galaxy;
  std::vector<domain::Player> players;
  std::vector<domain::StarState> stars;
  std::vector<domain::Ship> ships;
};

class WorldViewBuilder {
 public:
  explicit WorldViewBuilder(Database& db);

  WorldViewBuilder(const WorldViewBuilder&) = delete;
  WorldViewBuilder& operator=(const WorldViewBuilder&) = delete;

  // -------------------------------------------------------------------------
  // build(game, viewer)
  // -------------------------------------------------------------------------
  // @throws NotFoundError  game, viewer or galaxy unknown
  // @throws ConflictError  the game has no open turn
  // -------------------------------------------------------------------------
  WorldView build(GameId game, PlayerId viewer);

 private:
  Database& db_;
};

}  // namespace starlane
