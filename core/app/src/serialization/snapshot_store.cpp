#include "starlane/serialization/snapshot_store.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/serialization/json_codec.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace starlane {

namespace {

constexpr int kSnapshotFormat = 1;

template <typename Map>
nlohmann::json mapValues(const Map& rows) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& [key, row] : rows) {
    out.push_back(row);
  }
  return out;
}

const nlohmann::json& requireArray(const nlohmann::json& j, const char* key) {
  const auto& value = j.at(key);
  if (!value.is_array()) {
    throw ValidationError(std::string("snapshot: '") + key +
                          "' must be an array");
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// tablesToJson()
// -----------------------------------------------------------------------------
nlohmann::json tablesToJson(const Tables& tables) {
  nlohmann::json j;
  j["format"] = kSnapshotFormat;
  j["games"] = mapValues(tables.games);
  j["players"] = mapValues(tables.players);
  j["turns"] = mapValues(tables.turns);
  j["orders"] = tables.orders;
  j["star_states"] = mapValues(tables.star_states);
  j["ships"] = mapValues(tables.ships);
  j["events"] = tables.events;

  nlohmann::json galaxies = nlohmann::json::object();
  for (const auto& [game, topology] : tables.galaxies) {
    galaxies[std::to_string(game)] = topology;
  }
  j["galaxies"] = std::move(galaxies);
  return j;
}

// -----------------------------------------------------------------------------
// tablesFromJson()
// -----------------------------------------------------------------------------
Tables tablesFromJson(const nlohmann::json& j) {
  if (!j.is_object() || j.value("format", 0) != kSnapshotFormat) {
    throw ValidationError("snapshot: unsupported format");
  }

  Tables t;
  for (const auto& row : requireArray(j, "games")) {
    auto game = row.get<domain::Game>();
    t.games.emplace(game.id, std::move(game));
  }
  for (const auto& row : requireArray(j, "players")) {
    auto player = row.get<domain::Player>();
    t.players.emplace(player.id, std::move(player));
  }
  for (const auto& row : requireArray(j, "turns")) {
    auto turn = row.get<domain::Turn>();
    t.turns.emplace(turn.id, std::move(turn));
  }
  for (const auto& row : requireArray(j, "orders")) {
    t.orders.push_back(row.get<domain::OrderRecord>());
  }
  for (const auto& row : requireArray(j, "star_states")) {
    auto state = row.get<domain::StarState>();
    auto key = std::make_pair(state.game_id, state.star_id);
    t.star_states.emplace(std::move(key), std::move(state));
  }
  for (const auto& row : requireArray(j, "ships")) {
    auto ship = row.get<domain::Ship>();
    t.ships.emplace(ship.id, std::move(ship));
  }
  for (const auto& row : requireArray(j, "events")) {
    t.events.push_back(row.get<domain::TurnEvent>());
  }

  const auto& galaxies = j.at("galaxies");
  if (!galaxies.is_object()) {
    throw ValidationError("snapshot: 'galaxies' must be an object");
  }
  for (const auto& item : galaxies.items()) {
    t.galaxies.emplace(static_cast<GameId>(std::stoull(item.key())),
                       item.value().get<domain::GalaxyTopology>());
  }
  return t;
}

// -----------------------------------------------------------------------------
// saveSnapshot()
// -----------------------------------------------------------------------------
void saveSnapshot(Database& db, const std::string& path) {
  const auto document = tablesToJson(db.copyTables());
  const std::string tmp = path + ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw EngineError("snapshot: cannot write '" + tmp + "'");
    }
    out << document.dump(2);
    if (!out) {
      throw EngineError("snapshot: write to '" + tmp + "' failed");
    }
  }

  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    throw EngineError("snapshot: cannot replace '" + path + "'");
  }
  std::cout << "[Snapshot] saved to " << path << "\n";
}

// -----------------------------------------------------------------------------
// loadSnapshot()
// -----------------------------------------------------------------------------
bool loadSnapshot(Database& db, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }

  Tables tables;
  try {
    nlohmann::json j;
    in >> j;
    tables = tablesFromJson(j);
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("snapshot: '" + path + "' is malformed: " +
                          e.what());
  } catch (const std::logic_error&) {
    throw ValidationError("snapshot: '" + path + "' has a bad galaxy key");
  }

  std::cout << "[Snapshot] loaded " << tables.games.size() << " game(s) from "
            << path << "\n";
  db.hydrate(std::move(tables));
  return true;
}

}  // namespace starlane
