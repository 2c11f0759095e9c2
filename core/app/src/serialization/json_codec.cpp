#include "starlane/serialization/json_codec.hpp"

#include "starlane/domain/errors.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace starlane {
namespace domain {

namespace {

using nlohmann::json;

template <typename T>
std::optional<T> optionalAt(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

// A non-negative whole number that fits in T. nlohmann's get<> would wrap -1
// and truncate 2.7 without complaint.
template <typename T>
T countFromJson(const json& j, const char* key) {
  const bool whole = j.is_number_unsigned() ||
                     (j.is_number_integer() && j.get<std::int64_t>() >= 0);
  if (!whole || j.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
    throw ValidationError(std::string("'") + key +
                          "' must be a non-negative integer, got " + j.dump());
  }
  return static_cast<T>(j.get<std::uint64_t>());
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

// Reads an object-valued bag, defaulting to {} when absent.
json bagAt(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return json::object();
  }
  if (!it->is_object()) {
    throw ValidationError(std::string("'") + key + "' must be a JSON object");
  }
  return *it;
}

template <typename Enum>
Enum enumFromJson(const json& j, std::optional<Enum> (*parse)(std::string_view),
                  const char* what) {
  const auto text = j.get<std::string>();
  auto value = parse(text);
  if (!value) {
    throw ValidationError(std::string("unknown ") + what + " '" + text + "'");
  }
  return *value;
}

}  // namespace

// -----------------------------------------------------------------------------
// Enum decoders
// -----------------------------------------------------------------------------
GameStatus gameStatusFromJson(const json& j) {
  return enumFromJson<GameStatus>(j, &parseGameStatus, "game status");
}

PlayerStatus playerStatusFromJson(const json& j) {
  return enumFromJson<PlayerStatus>(j, &parsePlayerStatus, "player status");
}

PlayerType playerTypeFromJson(const json& j) {
  return enumFromJson<PlayerType>(j, &parsePlayerType, "player type");
}

TurnStatus turnStatusFromJson(const json& j) {
  return enumFromJson<TurnStatus>(j, &parseTurnStatus, "turn status");
}

OrderType orderTypeFromJson(const json& j) {
  return enumFromJson<OrderType>(j, &parseOrderType, "order type");
}

ShipStatus shipStatusFromJson(const json& j) {
  return enumFromJson<ShipStatus>(j, &parseShipStatus, "ship status");
}

// -----------------------------------------------------------------------------
// Game
// -----------------------------------------------------------------------------
void to_json(json& j, const Game& g) {
  j = json{{"id", g.id},
           {"owner_user_id", optionalToJson(g.owner_user_id)},
           {"name", g.name},
           {"map_seed", g.map_seed},
           {"map_size", g.map_size},
           {"density", g.density},
           {"status", toString(g.status)},
           {"params", g.params},
           {"created_at_ms", g.created_at_ms}};
}

void from_json(const json& j, Game& g) {
  g.id = j.value("id", GameId{0});
  g.owner_user_id = optionalAt<UserId>(j, "owner_user_id");
  g.name = j.value("name", std::string{});
  g.map_seed = j.value("map_seed", std::int64_t{0});
  g.map_size = j.value("map_size", 0);
  g.density = j.value("density", 0.0);
  g.status = j.contains("status") ? gameStatusFromJson(j.at("status"))
                                  : GameStatus::Lobby;
  g.params = bagAt(j, "params");
  g.created_at_ms = j.value("created_at_ms", TimestampMs{0});
}

// -----------------------------------------------------------------------------
// Player
// -----------------------------------------------------------------------------
void to_json(json& j, const Player& p) {
  j = json{{"id", p.id},
           {"game_id", p.game_id},
           {"user_id", optionalToJson(p.user_id)},
           {"name", p.name},
           {"color", p.color},
           {"country_name", p.country_name},
           {"status", toString(p.status)},
           {"type", toString(p.type)},
           {"meta", p.meta}};
}

void from_json(const json& j, Player& p) {
  p.id = j.value("id", PlayerId{0});
  p.game_id = j.value("game_id", GameId{0});
  p.user_id = optionalAt<UserId>(j, "user_id");
  p.name = j.at("name").get<std::string>();
  p.color = j.value("color", std::string{});
  p.country_name = j.value("country_name", std::string{});
  p.status = j.contains("status") ? playerStatusFromJson(j.at("status"))
                                  : PlayerStatus::Active;
  p.type = j.contains("type") ? playerTypeFromJson(j.at("type"))
                              : PlayerType::Human;
  p.meta = bagAt(j, "meta");
}

// -----------------------------------------------------------------------------
// Turn
// -----------------------------------------------------------------------------
void to_json(json& j, const Turn& t) {
  j = json{{"id", t.id},
           {"game_id", t.game_id},
           {"number", t.number},
           {"status", toString(t.status)},
           {"opened_at_ms", t.opened_at_ms},
           {"closed_at_ms", optionalToJson(t.closed_at_ms)}};
}

void from_json(const json& j, Turn& t) {
  t.id = j.at("id").get<TurnId>();
  t.game_id = j.at("game_id").get<GameId>();
  t.number = j.at("number").get<std::uint32_t>();
  t.status = turnStatusFromJson(j.at("status"));
  t.opened_at_ms = j.value("opened_at_ms", TimestampMs{0});
  t.closed_at_ms = optionalAt<TimestampMs>(j, "closed_at_ms");
}

// -----------------------------------------------------------------------------
// Order payloads
// -----------------------------------------------------------------------------
json payloadToJson(const OrderPayload& payload) {
  if (const auto* b = std::get_if<BuildPayload>(&payload)) {
    json j{{"source_star", b->source_star},
           {"expand", b->expand},
           {"research", b->research},
           {"build", b->build},
           {"from_standing_order", b->from_standing_order}};
    if (b->ships) {
      j["ships"] = *b->ships;
    }
    return j;
  }
  const auto& m = std::get<MovePayload>(payload);
  return json{{"source_star", m.source_star},
              {"destination_star", m.destination_star},
              {"ship_ids", m.ship_ids},
              {"from_standing_order", m.from_standing_order}};
}

OrderPayload payloadFromJson(OrderType type, const json& j) {
  if (!j.is_object()) {
    throw ValidationError("order payload must be a JSON object");
  }
  if (isBuildType(type)) {
    BuildPayload b;
    b.source_star = j.at("source_star").get<std::string>();
    auto ships = j.find("ships");
    if (ships != j.end() && !ships->is_null()) {
      b.ships = countFromJson<std::uint32_t>(*ships, "ships");
    }
    b.expand = j.value("expand", 0.0);
    b.research = j.value("research", 0.0);
    b.build = j.value("build", 0.0);
    b.from_standing_order = j.value("from_standing_order", false);
    return b;
  }
  MovePayload m;
  m.source_star = j.at("source_star").get<std::string>();
  m.destination_star = j.at("destination_star").get<std::string>();
  auto ids = j.find("ship_ids");
  if (ids != j.end() && !ids->is_null()) {
    if (!ids->is_array()) {
      throw ValidationError("'ship_ids' must be an array");
    }
    for (const auto& id : *ids) {
      m.ship_ids.push_back(countFromJson<ShipId>(id, "ship_ids"));
    }
  }
  m.from_standing_order = j.value("from_standing_order", false);
  return m;
}

// -----------------------------------------------------------------------------
// OrderRecord
// -----------------------------------------------------------------------------
void to_json(json& j, const OrderRecord& o) {
  j = json{{"row_id", o.row_id},
           {"game_id", o.game_id},
           {"turn_id", o.turn_id},
           {"player_id", o.player_id},
           {"client_order_id", o.client_order_id},
           {"revision", o.revision},
           {"order_type", toString(o.type)},
           {"payload", payloadToJson(o.payload)},
           {"is_deleted", o.is_deleted},
           {"is_final", o.is_final},
           {"finalized_at_ms", optionalToJson(o.finalized_at_ms)},
           {"created_at_ms", o.created_at_ms}};
}

void from_json(const json& j, OrderRecord& o) {
  o.row_id = j.at("row_id").get<OrderRowId>();
  o.game_id = j.at("game_id").get<GameId>();
  o.turn_id = j.at("turn_id").get<TurnId>();
  o.player_id = j.at("player_id").get<PlayerId>();
  o.client_order_id = j.at("client_order_id").get<ClientOrderId>();
  o.revision = j.at("revision").get<std::uint32_t>();
  o.type = orderTypeFromJson(j.at("order_type"));
  o.payload = payloadFromJson(o.type, j.at("payload"));
  o.is_deleted = j.value("is_deleted", false);
  o.is_final = j.value("is_final", false);
  o.finalized_at_ms = optionalAt<TimestampMs>(j, "finalized_at_ms");
  o.created_at_ms = j.value("created_at_ms", TimestampMs{0});
}

// -----------------------------------------------------------------------------
// Economy
// -----------------------------------------------------------------------------
void to_json(json& j, const Economy& e) {
  j = json{{"available", e.available},
           {"industry", e.industry},
           {"technology", e.technology}};
}

void from_json(const json& j, Economy& e) {
  e.available = j.value("available", 0.0);
  e.industry = j.value("industry", 0.0);
  e.technology = j.value("technology", 1.0);
}

// -----------------------------------------------------------------------------
// StandingOrders
// -----------------------------------------------------------------------------
void to_json(json& j, const StandingOrders& s) {
  j = json::object();
  if (s.industry) {
    j["industry"] = json{{"expand", s.industry->expand},
                         {"research", s.industry->research},
                         {"build", s.industry->build}};
  }
  if (s.move) {
    j["move"] = json{{"destination_star", s.move->destination_star}};
  }
}

void from_json(const json& j, StandingOrders& s) {
  s = StandingOrders{};
  if (auto it = j.find("industry"); it != j.end() && !it->is_null()) {
    IndustryTemplate t;
    t.expand = it->value("expand", 0.0);
    t.research = it->value("research", 0.0);
    t.build = it->value("build", 0.0);
    s.industry = t;
  }
  if (auto it = j.find("move"); it != j.end() && !it->is_null()) {
    s.move = MoveTemplate{it->at("destination_star").get<std::string>()};
  }
}

// -----------------------------------------------------------------------------
// StarState
// -----------------------------------------------------------------------------
void to_json(json& j, const StarState& s) {
  j = json{{"game_id", s.game_id},
           {"star_id", s.star_id},
           {"owner", optionalToJson(s.owner)},
           {"economy", s.economy},
           {"damage", s.damage},
           {"details", s.details}};
}

void from_json(const json& j, StarState& s) {
  s.game_id = j.value("game_id", GameId{0});
  s.star_id = j.at("star_id").get<std::string>();
  s.owner = optionalAt<PlayerId>(j, "owner");
  s.economy = j.value("economy", Economy{});
  s.damage = j.value("damage", 0.0);
  s.details = bagAt(j, "details");
}

// -----------------------------------------------------------------------------
// Ship
// -----------------------------------------------------------------------------
void to_json(json& j, const Ship& s) {
  j = json{{"id", s.id},
           {"game_id", s.game_id},
           {"owner", s.owner},
           {"location", s.location},
           {"hp", s.hp},
           {"power", s.power},
           {"status", toString(s.status)},
           {"details", s.details}};
}

void from_json(const json& j, Ship& s) {
  s.id = j.value("id", ShipId{0});
  s.game_id = j.value("game_id", GameId{0});
  s.owner = j.at("owner").get<PlayerId>();
  s.location = j.at("location").get<std::string>();
  s.hp = j.value("hp", 0.0);
  s.power = j.value("power", 0.0);
  s.status = j.contains("status") ? shipStatusFromJson(j.at("status"))
                                  : ShipStatus::Active;
  s.details = bagAt(j, "details");
}

// -----------------------------------------------------------------------------
// TurnEvent
// -----------------------------------------------------------------------------
void to_json(json& j, const TurnEvent& e) {
  j = json{{"id", e.id},
           {"game_id", e.game_id},
           {"turn_id", e.turn_id},
           {"player_id", optionalToJson(e.player_id)},
           {"seq", e.seq},
           {"kind", e.kind},
           {"details", e.details},
           {"created_at_ms", e.created_at_ms}};
}

void from_json(const json& j, TurnEvent& e) {
  e.id = j.at("id").get<EventId>();
  e.game_id = j.at("game_id").get<GameId>();
  e.turn_id = j.at("turn_id").get<TurnId>();
  e.player_id = optionalAt<PlayerId>(j, "player_id");
  e.seq = j.at("seq").get<std::uint64_t>();
  e.kind = j.at("kind").get<std::string>();
  e.details = j.value("details", json::object());
  e.created_at_ms = j.value("created_at_ms", TimestampMs{0});
}

// -----------------------------------------------------------------------------
// Galaxy
// -----------------------------------------------------------------------------
void to_json(json& j, const Star& s) {
  j = json{{"id", s.id},
           {"name", s.name},
           {"x", s.x},
           {"y", s.y},
           {"z", s.z},
           {"resource", s.resource}};
}

void from_json(const json& j, Star& s) {
  s.id = j.at("id").get<std::string>();
  s.name = j.value("name", s.id);
  s.x = j.value("x", 0.0);
  s.y = j.value("y", 0.0);
  s.z = j.value("z", 0.0);
  s.resource = j.value("resource", 0.0);
}

void to_json(json& j, const Wormhole& w) {
  j = json{{"a", w.a}, {"b", w.b}};
}

void from_json(const json& j, Wormhole& w) {
  w.a = j.at("a").get<std::string>();
  w.b = j.at("b").get<std::string>();
}

void to_json(json& j, const GalaxyTopology& g) {
  j = json{{"stars", g.stars}, {"wormholes", g.wormholes}};
}

void from_json(const json& j, GalaxyTopology& g) {
  g.stars = j.at("stars").get<std::vector<Star>>();
  g.wormholes = j.value("wormholes", std::vector<Wormhole>{});
}

}  // namespace domain
}  // namespace starlane
