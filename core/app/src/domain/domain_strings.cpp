#include "starlane/domain/errors.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/domain/order.hpp"
#include "starlane/domain/player.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/domain/turn.hpp"

namespace starlane {

// -----------------------------------------------------------------------------
// errorCode()
// -----------------------------------------------------------------------------
const char* errorCode(const std::exception& e) {
  if (dynamic_cast<const ValidationError*>(&e) != nullptr) {
    return "validation";
  }
  if (dynamic_cast<const NotFoundError*>(&e) != nullptr) {
    return "not_found";
  }
  if (dynamic_cast<const ConflictError*>(&e) != nullptr) {
    return "conflict";
  }
  return "internal";
}

namespace domain {

// -----------------------------------------------------------------------------
// GameStatus
// -----------------------------------------------------------------------------
const char* toString(GameStatus s) {
  switch (s) {
    case GameStatus::Lobby:    return "lobby";
    case GameStatus::Running:  return "running";
    case GameStatus::Paused:   return "paused";
    case GameStatus::Frozen:   return "frozen";
    case GameStatus::Finished: return "finished";
  }
  return "unknown";
}

std::optional<GameStatus> parseGameStatus(std::string_view s) {
  if (s == "lobby") return GameStatus::Lobby;
  if (s == "running") return GameStatus::Running;
  if (s == "paused") return GameStatus::Paused;
  if (s == "frozen") return GameStatus::Frozen;
  if (s == "finished") return GameStatus::Finished;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// PlayerStatus / PlayerType
// -----------------------------------------------------------------------------
const char* toString(PlayerStatus s) {
  switch (s) {
    case PlayerStatus::Active:    return "active";
    case PlayerStatus::Waiting:   return "waiting";
    case PlayerStatus::Suspended: return "suspended";
    case PlayerStatus::Ejected:   return "ejected";
  }
  return "unknown";
}

std::optional<PlayerStatus> parsePlayerStatus(std::string_view s) {
  if (s == "active") return PlayerStatus::Active;
  if (s == "waiting") return PlayerStatus::Waiting;
  if (s == "suspended") return PlayerStatus::Suspended;
  if (s == "ejected") return PlayerStatus::Ejected;
  return std::nullopt;
}

const char* toString(PlayerType t) {
  switch (t) {
    case PlayerType::Human: return "player";
    case PlayerType::Ai:    return "ai";
  }
  return "unknown";
}

std::optional<PlayerType> parsePlayerType(std::string_view s) {
  if (s == "player") return PlayerType::Human;
  if (s == "ai") return PlayerType::Ai;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// TurnStatus
// -----------------------------------------------------------------------------
const char* toString(TurnStatus s) {
  switch (s) {
    case TurnStatus::Open:      return "open";
    case TurnStatus::Resolving: return "resolving";
    case TurnStatus::Closed:    return "closed";
  }
  return "unknown";
}

std::optional<TurnStatus> parseTurnStatus(std::string_view s) {
  if (s == "open") return TurnStatus::Open;
  if (s == "resolving") return TurnStatus::Resolving;
  if (s == "closed") return TurnStatus::Closed;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Build:     return "build";
    case OrderType::AutoBuild: return "auto_build";
    case OrderType::Move:      return "move";
    case OrderType::AutoMove:  return "auto_move";
  }
  return "unknown";
}

std::optional<OrderType> parseOrderType(std::string_view s) {
  if (s == "build") return OrderType::Build;
  if (s == "auto_build") return OrderType::AutoBuild;
  if (s == "move") return OrderType::Move;
  if (s == "auto_move") return OrderType::AutoMove;
  return std::nullopt;
}

const StarId& sourceStar(const OrderPayload& p) {
  return std::visit(
      [](const auto& payload) -> const StarId& { return payload.source_star; },
      p);
}

// -----------------------------------------------------------------------------
// ShipStatus
// -----------------------------------------------------------------------------
const char* toString(ShipStatus s) {
  switch (s) {
    case ShipStatus::Active:    return "active";
    case ShipStatus::Destroyed: return "destroyed";
  }
  return "unknown";
}

std::optional<ShipStatus> parseShipStatus(std::string_view s) {
  if (s == "active") return ShipStatus::Active;
  if (s == "destroyed") return ShipStatus::Destroyed;
  return std::nullopt;
}

}  // namespace domain
}  // namespace starlane
