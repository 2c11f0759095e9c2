#pragma once

#include "starlane/domain/star.hpp"
#include "starlane/store/database.hpp"

#include <optional>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// WorldRepository - star states and ships
// -----------------------------------------------------------------------------
//
// @brief  Row-level access to the mutable world of a game: per-star economy
//         and ownership, and the ships.
//
// @details
// Used by game bootstrap (seeding), the command surface and tests. The
// resolution engine does not go through this class; it mutates the same
// rows inside its own per-order transaction so that a ship insert and the
// matching economy update commit together.
//
// upsertStarState() requires the star to exist in the game's galaxy.
// insertShip() requires the owner to be a player of the game and the
// location to be a known star.
// -----------------------------------------------------------------------------
class WorldRepository {
 public:
  explicit WorldRepository(Database& db);

  WorldRepository(const WorldRepository&) = delete;
  WorldRepository& operator=(const WorldRepository&) = delete;

  void upsertStarState(domain::StarState state);
  std::optional<domain::StarState> getStarState(GameId game,
                                                const StarId& star);
  std::vector<domain::StarState> listStarStates(GameId game);

  domain::Ship insertShip(domain::Ship ship);
  std::optional<domain::Ship> getShip(ShipId ship);
  std::vector<domain::Ship> listShips(GameId game);
  std::vector<domain::Ship> listShipsAt(GameId game, const StarId& star);

 private:
  Database& db_;
};

}  // namespace starlane
