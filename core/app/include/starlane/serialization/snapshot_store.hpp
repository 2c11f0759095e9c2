#pragma once

#include "starlane/store/database.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// Snapshot persistence
// -----------------------------------------------------------------------------
//
// @brief  Writes the whole Database to one JSON document and restores it.
//
// @details
// Document layout (format 1):
//   { "format": 1, "games": [...], "players": [...], "turns": [...],
//     "orders": [...], "star_states": [...], "ships": [...],
//     "events": [...], "galaxies": { "<game id>": { stars, wormholes } } }
//
// saveSnapshot() copies the tables under the Database lock and serializes
// the copy without holding it. The file is written next to `path` and
// renamed over it, so a crash never leaves a half-written snapshot.
//
// loadSnapshot() parses the file completely before calling
// Database::hydrate(); a malformed file leaves the Database untouched.
// -----------------------------------------------------------------------------
nlohmann::json tablesToJson(const Tables& tables);
Tables tablesFromJson(const nlohmann::json& j);

void saveSnapshot(Database& db, const std::string& path);

// @return false when `path` does not exist. Throws ValidationError when it
//         exists but cannot be parsed.
bool loadSnapshot(Database& db, const std::string& path);

}  // namespace starlane
