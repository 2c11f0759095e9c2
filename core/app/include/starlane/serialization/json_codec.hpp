#pragma once

#include "starlane/domain/galaxy.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/domain/order.hpp"
#include "starlane/domain/player.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/domain/turn_event.hpp"

#include <nlohmann/json.hpp>

namespace starlane {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for the domain model
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adapters (found by ADL) for every domain type that
//         crosses the IPC boundary or lands in a snapshot file.
//
// @details
// Keys are snake_case. Enums are written as their lower-case names.
// Decoding is strict: a missing required key or a wrong type surfaces as
// nlohmann::json::exception, and an unknown enum name as ValidationError.
// Optional keys (ids that may be null, payload "ships") are written as null
// or omitted and read back as std::nullopt.
//
// Order payloads are not self-describing: the order type selects the
// alternative, so they use payloadToJson()/payloadFromJson() instead of
// to_json/from_json.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Game& g);
void from_json(const nlohmann::json& j, Game& g);

void to_json(nlohmann::json& j, const Player& p);
void from_json(const nlohmann::json& j, Player& p);

void to_json(nlohmann::json& j, const Turn& t);
void from_json(const nlohmann::json& j, Turn& t);

nlohmann::json payloadToJson(const OrderPayload& payload);
OrderPayload payloadFromJson(OrderType type, const nlohmann::json& j);

void to_json(nlohmann::json& j, const OrderRecord& o);
void from_json(const nlohmann::json& j, OrderRecord& o);

void to_json(nlohmann::json& j, const Economy& e);
void from_json(const nlohmann::json& j, Economy& e);

void to_json(nlohmann::json& j, const StandingOrders& s);
void from_json(const nlohmann::json& j, StandingOrders& s);

void to_json(nlohmann::json& j, const StarState& s);
void from_json(const nlohmann::json& j, StarState& s);

void to_json(nlohmann::json& j, const Ship& s);
void from_json(const nlohmann::json& j, Ship& s);

void to_json(nlohmann::json& j, const TurnEvent& e);
void from_json(const nlohmann::json& j, TurnEvent& e);

void to_json(nlohmann::json& j, const Star& s);
void from_json(const nlohmann::json& j, Star& s);

void to_json(nlohmann::json& j, const Wormhole& w);
void from_json(const nlohmann::json& j, Wormhole& w);

void to_json(nlohmann::json& j, const GalaxyTopology& g);
void from_json(const nlohmann::json& j, GalaxyTopology& g);

// Enum decoders that throw ValidationError on unknown names.
GameStatus gameStatusFromJson(const nlohmann::json& j);
PlayerStatus playerStatusFromJson(const nlohmann::json& j);
PlayerType playerTypeFromJson(const nlohmann::json& j);
TurnStatus turnStatusFromJson(const nlohmann::json& j);
OrderType orderTypeFromJson(const nlohmann::json& j);
ShipStatus shipStatusFromJson(const nlohmann::json& j);

}  // namespace domain
}  // namespace starlane
