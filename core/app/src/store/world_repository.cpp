#include "starlane/store/world_repository.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

#include <string>

namespace starlane {

namespace {

void requireKnownStar(Tables& t, GameId game, const StarId& star) {
  if (!lookup::requireGalaxy(t, game).hasStar(star)) {
    throw NotFoundError("star '" + star + "' is not part of game " +
                        std::to_string(game));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
WorldRepository::WorldRepository(Database& db) : db_(db) {}

// -----------------------------------------------------------------------------
// upsertStarState()
// -----------------------------------------------------------------------------
void WorldRepository::upsertStarState(domain::StarState state) {
  if (state.economy.available < 0.0) {
    throw ValidationError("star '" + state.star_id +
                          "' cannot start with negative available points");
  }
  if (!state.details.is_object()) {
    throw ValidationError("star details must be a JSON object");
  }
  auto tx = db_.begin();
  requireKnownStar(tx.tables(), state.game_id, state.star_id);
  if (state.owner) {
    lookup::requirePlayer(tx.tables(), state.game_id, *state.owner);
  }
  auto key = std::make_pair(state.game_id, state.star_id);
  tx->star_states[key] = std::move(state);
}

// -----------------------------------------------------------------------------
// getStarState() / listStarStates()
// -----------------------------------------------------------------------------
std::optional<domain::StarState> WorldRepository::getStarState(
    GameId game, const StarId& star) {
  auto tx = db_.begin();
  auto* state = lookup::findStarState(tx.tables(), game, star);
  if (state == nullptr) {
    return std::nullopt;
  }
  return *state;
}

std::vector<domain::StarState> WorldRepository::listStarStates(GameId game) {
  auto tx = db_.begin();
  std::vector<domain::StarState> result;
  for (const auto& [key, state] : tx->star_states) {
    if (key.first == game) {
      result.push_back(state);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// insertShip()
// -----------------------------------------------------------------------------
domain::Ship WorldRepository::insertShip(domain::Ship ship) {
  auto tx = db_.begin();
  lookup::requirePlayer(tx.tables(), ship.game_id, ship.owner);
  requireKnownStar(tx.tables(), ship.game_id, ship.location);
  ship.id = tx.nextId();
  tx->ships.emplace(ship.id, ship);
  return ship;
}

// -----------------------------------------------------------------------------
// getShip() / listShips() / listShipsAt()
// -----------------------------------------------------------------------------
std::optional<domain::Ship> WorldRepository::getShip(ShipId ship) {
  auto tx = db_.begin();
  auto it = tx->ships.find(ship);
  if (it == tx->ships.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Ship> WorldRepository::listShips(GameId game) {
  auto tx = db_.begin();
  std::vector<domain::Ship> result;
  for (const auto& [id, ship] : tx->ships) {
    if (ship.game_id == game) {
      result.push_back(ship);
    }
  }
  return result;
}

std::vector<domain::Ship> WorldRepository::listShipsAt(GameId game,
                                                       const StarId& star) {
  auto tx = db_.begin();
  std::vector<domain::Ship> result;
  for (const auto& [id, ship] : tx->ships) {
    if (ship.game_id == game && ship.location == star) {
      result.push_back(ship);
    }
  }
  return result;
}

}  // namespace starlane
