#pragma once

#include "starlane/domain/player.hpp"
#include "starlane/store/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// PlayerRegistry - players of a game
// -----------------------------------------------------------------------------
// addPlayer() requires an existing game, a non-empty name and an object
// meta bag; a Human player must not carry main_ai. New players start
// Active. Status changes that belong to the turn cycle (active <-> waiting)
// go through the TurnLedger; setStatus() here is for suspend/eject.
// -----------------------------------------------------------------------------
class PlayerRegistry {
 public:
  explicit PlayerRegistry(Database& db);

  PlayerRegistry(const PlayerRegistry&) = delete;
  PlayerRegistry& operator=(const PlayerRegistry&) = delete;

  domain::Player addPlayer(GameId game, domain::Player player);

  std::optional<domain::Player> getPlayer(PlayerId player);
  std::vector<domain::Player> listPlayers(GameId game);

  // Active players whose meta names an AI strategy ("main_ai"), in id order.
  std::vector<domain::Player> listAiPlayers(GameId game);

  void setStatus(GameId game, PlayerId player, domain::PlayerStatus status);

 private:
  Database& db_;
};

// Strategy name from meta.main_ai, empty when absent or not a string.
std::string aiStrategyName(const domain::Player& player);

}  // namespace starlane
