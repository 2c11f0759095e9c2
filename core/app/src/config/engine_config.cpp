#include "starlane/config/engine_config.hpp"

#include "starlane/domain/errors.hpp"

#include <fstream>

namespace starlane {

namespace {

const nlohmann::json* section(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ValidationError(std::string("config: '") + key +
                          "' must be an object");
  }
  return &*it;
}

void readString(const nlohmann::json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_string()) {
    throw ValidationError(std::string("config: '") + key +
                          "' must be a string");
  }
  out = it->get<std::string>();
}

void readBool(const nlohmann::json& j, const char* key, bool& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_boolean()) {
    throw ValidationError(std::string("config: '") + key +
                          "' must be a boolean");
  }
  out = it->get<bool>();
}

void readNumber(const nlohmann::json& j, const char* key, double& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_number()) {
    throw ValidationError(std::string("config: '") + key +
                          "' must be a number");
  }
  out = it->get<double>();
}

template <typename Unsigned>
void readCount(const nlohmann::json& j, const char* key, Unsigned& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_number_integer() ||
      (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
    throw ValidationError(std::string("config: '") + key +
                          "' must be a non-negative integer");
  }
  out = it->get<Unsigned>();
}

void readEconomy(const nlohmann::json& j, const char* key,
                 domain::Economy& out) {
  if (const auto* s = section(j, key)) {
    readNumber(*s, "available", out.available);
    readNumber(*s, "industry", out.industry);
    readNumber(*s, "technology", out.technology);
  }
}

nlohmann::json economyJson(const domain::Economy& e) {
  return {{"available", e.available},
          {"industry", e.industry},
          {"technology", e.technology}};
}

}  // namespace

// -----------------------------------------------------------------------------
// from_json()
// -----------------------------------------------------------------------------
void from_json(const nlohmann::json& j, EngineConfig& config) {
  if (!j.is_object()) {
    throw ValidationError("config: top level must be an object");
  }

  if (const auto* ipc = section(j, "ipc")) {
    readString(*ipc, "cmd_endpoint", config.ipc_cmd_endpoint);
    readString(*ipc, "pub_endpoint", config.ipc_pub_endpoint);
  }

  if (const auto* ai = section(j, "ai")) {
    readBool(*ai, "auto_run", config.auto_run_ai);
    std::uint64_t delay = static_cast<std::uint64_t>(config.ai_delay_ms);
    readCount(*ai, "delay_ms", delay);
    config.ai_delay_ms = static_cast<std::int64_t>(delay);
  }

  readString(j, "snapshot_path", config.snapshot_path);

  if (const auto* game = section(j, "new_game")) {
    readEconomy(*game, "home_economy", config.home_economy);
    readEconomy(*game, "neutral_economy", config.neutral_economy);
    readCount(*game, "starting_ships", config.starting_ships);
    readNumber(*game, "ship_hp", config.ship_hp);
    readNumber(*game, "ship_power", config.ship_power);
  }

  if (const auto* events = section(j, "events")) {
    readCount(*events, "default_limit", config.default_event_limit);
  }
}

// -----------------------------------------------------------------------------
// to_json()
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const EngineConfig& config) {
  j = nlohmann::json{
      {"ipc",
       {{"cmd_endpoint", config.ipc_cmd_endpoint},
        {"pub_endpoint", config.ipc_pub_endpoint}}},
      {"ai",
       {{"auto_run", config.auto_run_ai}, {"delay_ms", config.ai_delay_ms}}},
      {"snapshot_path", config.snapshot_path},
      {"new_game",
       {{"home_economy", economyJson(config.home_economy)},
        {"neutral_economy", economyJson(config.neutral_economy)},
        {"starting_ships", config.starting_ships},
        {"ship_hp", config.ship_hp},
        {"ship_power", config.ship_power}}},
      {"events", {{"default_limit", config.default_event_limit}}}};
}

// -----------------------------------------------------------------------------
// loadConfig()
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("config: cannot open '" + path + "'");
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("config: '" + path + "' is not valid JSON: " +
                          e.what());
  }
  return j.get<EngineConfig>();
}

}  // namespace starlane
