#include "starlane/store/lookups.hpp"

#include "starlane/domain/errors.hpp"

#include <string>

namespace starlane {
namespace lookup {

// -----------------------------------------------------------------------------
// requireGame()
// -----------------------------------------------------------------------------
domain::Game& requireGame(Tables& t, GameId game) {
  auto it = t.games.find(game);
  if (it == t.games.end()) {
    throw NotFoundError("game " + std::to_string(game) + " not found");
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// requirePlayer()
// -----------------------------------------------------------------------------
domain::Player& requirePlayer(Tables& t, GameId game, PlayerId player) {
  auto it = t.players.find(player);
  if (it == t.players.end() || it->second.game_id != game) {
    throw NotFoundError("player " + std::to_string(player) +
                        " not found in game " + std::to_string(game));
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// requireTurn()
// -----------------------------------------------------------------------------
domain::Turn& requireTurn(Tables& t, GameId game, TurnId turn) {
  auto it = t.turns.find(turn);
  if (it == t.turns.end() || it->second.game_id != game) {
    throw NotFoundError("turn " + std::to_string(turn) +
                        " not found in game " + std::to_string(game));
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// requireGalaxy()
// -----------------------------------------------------------------------------
const domain::GalaxyTopology& requireGalaxy(Tables& t, GameId game) {
  auto it = t.galaxies.find(game);
  if (it == t.galaxies.end()) {
    throw NotFoundError("no galaxy stored for game " + std::to_string(game));
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// requireStarState()
// -----------------------------------------------------------------------------
domain::StarState& requireStarState(Tables& t, GameId game,
                                    const StarId& star) {
  auto* state = findStarState(t, game, star);
  if (state == nullptr) {
    throw NotFoundError("star '" + star + "' has no state in game " +
                        std::to_string(game));
  }
  return *state;
}

// -----------------------------------------------------------------------------
// findTurnByNumber() / findOpenTurn()
// -----------------------------------------------------------------------------
domain::Turn* findTurnByNumber(Tables& t, GameId game, std::uint32_t number) {
  for (auto& [id, turn] : t.turns) {
    if (turn.game_id == game && turn.number == number) {
      return &turn;
    }
  }
  return nullptr;
}

domain::Turn* findOpenTurn(Tables& t, GameId game) {
  for (auto& [id, turn] : t.turns) {
    if (turn.game_id == game && turn.status == domain::TurnStatus::Open) {
      return &turn;
    }
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// findStarState()
// -----------------------------------------------------------------------------
domain::StarState* findStarState(Tables& t, GameId game, const StarId& star) {
  auto it = t.star_states.find({game, star});
  return it == t.star_states.end() ? nullptr : &it->second;
}

// -----------------------------------------------------------------------------
// playersOf()
// -----------------------------------------------------------------------------
std::vector<domain::Player*> playersOf(Tables& t, GameId game) {
  std::vector<domain::Player*> result;
  for (auto& [id, p] : t.players) {
    if (p.game_id == game) {
      result.push_back(&p);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// activeShipsAt()
// -----------------------------------------------------------------------------
std::vector<domain::Ship*> activeShipsAt(Tables& t, GameId game,
                                         const StarId& star, PlayerId owner) {
  std::vector<domain::Ship*> result;
  for (auto& [id, ship] : t.ships) {
    if (ship.game_id == game && ship.location == star &&
        ship.owner == owner && ship.status == domain::ShipStatus::Active) {
      result.push_back(&ship);
    }
  }
  return result;
}

}  // namespace lookup
}  // namespace starlane
