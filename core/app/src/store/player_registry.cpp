#include "starlane/store/player_registry.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

namespace starlane {

// -----------------------------------------------------------------------------
// aiStrategyName()
// -----------------------------------------------------------------------------
std::string aiStrategyName(const domain::Player& player) {
  auto it = player.meta.find("main_ai");
  if (it == player.meta.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PlayerRegistry::PlayerRegistry(Database& db) : db_(db) {}

// -----------------------------------------------------------------------------
// addPlayer()
// -----------------------------------------------------------------------------
domain::Player PlayerRegistry::addPlayer(GameId game, domain::Player player) {
  if (player.name.empty()) {
    throw ValidationError("player name is required");
  }
  if (!player.meta.is_object()) {
    throw ValidationError("player meta must be a JSON object");
  }
  if (player.type == domain::PlayerType::Human && !aiStrategyName(player).empty()) {
    throw ValidationError("player '" + player.name +
                          "' of type player cannot name an AI strategy");
  }

  auto tx = db_.begin();
  lookup::requireGame(tx.tables(), game);
  player.id = tx.nextId();
  player.game_id = game;
  player.status = domain::PlayerStatus::Active;
  tx->players.emplace(player.id, player);
  return player;
}

// -----------------------------------------------------------------------------
// getPlayer() / listPlayers()
// -----------------------------------------------------------------------------
std::optional<domain::Player> PlayerRegistry::getPlayer(PlayerId player) {
  auto tx = db_.begin();
  auto it = tx->players.find(player);
  if (it == tx->players.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Player> PlayerRegistry::listPlayers(GameId game) {
  auto tx = db_.begin();
  std::vector<domain::Player> result;
  for (const auto* p : lookup::playersOf(tx.tables(), game)) {
    result.push_back(*p);
  }
  return result;
}

// -----------------------------------------------------------------------------
// listAiPlayers()
// -----------------------------------------------------------------------------
std::vector<domain::Player> PlayerRegistry::listAiPlayers(GameId game) {
  auto tx = db_.begin();
  std::vector<domain::Player> result;
  for (const auto* p : lookup::playersOf(tx.tables(), game)) {
    if (p->status == domain::PlayerStatus::Active &&
        !aiStrategyName(*p).empty()) {
      result.push_back(*p);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// setStatus()
// -----------------------------------------------------------------------------
void PlayerRegistry::setStatus(GameId game, PlayerId player,
                               domain::PlayerStatus status) {
  auto tx = db_.begin();
  lookup::requirePlayer(tx.tables(), game, player).status = status;
}

}  // namespace starlane
