#pragma once

#include "starlane/ai/i_ai_strategy.hpp"
#include "starlane/domain/ids.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// AiRegistry - strategy name -> factory
// -----------------------------------------------------------------------------
//
// @brief  Maps the names stored in a player's meta.main_ai to factories
//         that build a fresh strategy for one (game, player).
//
// @details
// The registry is an ordinary object injected into the AiTurnExecutor;
// tests build their own with fake strategies. Registering a name twice
// replaces the earlier factory.
//
// Thread model: all members are safe from any thread.
// -----------------------------------------------------------------------------
class AiRegistry {
 public:
  using Factory = std::function<std::unique_ptr<IAiStrategy>(
      GameId game, PlayerId player, const nlohmann::json& config)>;

  AiRegistry() = default;

  AiRegistry(const AiRegistry&) = delete;
  AiRegistry& operator=(const AiRegistry&) = delete;

  void registerStrategy(const std::string& name, Factory factory);

  bool has(const std::string& name) const;

  // @throws NotFoundError when no factory is registered under `name`.
  std::unique_ptr<IAiStrategy> create(const std::string& name, GameId game,
                                      PlayerId player,
                                      const nlohmann::json& config) const;

  // Registered names, sorted.
  std::vector<std::string> list() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Factory> factories_;
};

}  // namespace starlane
