#pragma once

#include "starlane/store/database.hpp"

#include <cstdint>
#include <vector>

namespace starlane {
namespace lookup {

// -----------------------------------------------------------------------------
// Row lookups used inside a Database::Transaction
// -----------------------------------------------------------------------------
// require* throw NotFoundError; find* return nullptr. A player, turn or star
// state belonging to a different game counts as missing.
// -----------------------------------------------------------------------------

domain::Game& requireGame(Tables& t, GameId game);
domain::Player& requirePlayer(Tables& t, GameId game, PlayerId player);
domain::Turn& requireTurn(Tables& t, GameId game, TurnId turn);
const domain::GalaxyTopology& requireGalaxy(Tables& t, GameId game);
domain::StarState& requireStarState(Tables& t, GameId game, const StarId& star);

domain::Turn* findTurnByNumber(Tables& t, GameId game, std::uint32_t number);
domain::Turn* findOpenTurn(Tables& t, GameId game);
domain::StarState* findStarState(Tables& t, GameId game, const StarId& star);

std::vector<domain::Player*> playersOf(Tables& t, GameId game);

// Active ships of `owner` at `star`, in id order.
std::vector<domain::Ship*> activeShipsAt(Tables& t, GameId game,
                                         const StarId& star, PlayerId owner);

}  // namespace lookup
}  // namespace starlane
