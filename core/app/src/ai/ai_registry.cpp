#include "starlane/ai/ai_registry.hpp"

#include "starlane/domain/errors.hpp"

#include <iostream>

namespace starlane {

// -----------------------------------------------------------------------------
// registerStrategy()
// -----------------------------------------------------------------------------
void AiRegistry::registerStrategy(const std::string& name, Factory factory) {
  if (name.empty() || !factory) {
    throw ValidationError("strategy registration needs a name and a factory");
  }
  std::lock_guard lock(mutex_);
  if (factories_.count(name) != 0) {
    std::cerr << "[AiRegistry] strategy '" << name
              << "' already registered, replacing it.\n";
  }
  factories_[name] = std::move(factory);
}

bool AiRegistry::has(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return factories_.count(name) != 0;
}

// -----------------------------------------------------------------------------
// create()
// -----------------------------------------------------------------------------
std::unique_ptr<IAiStrategy> AiRegistry::create(
    const std::string& name, GameId game, PlayerId player,
    const nlohmann::json& config) const {
  Factory factory;
  {
    std::lock_guard lock(mutex_);
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      throw NotFoundError("AI strategy '" + name + "' is not registered");
    }
    factory = it->second;
  }
  auto strategy = factory(game, player, config);
  if (!strategy) {
    throw EngineError("AI strategy '" + name + "' factory returned nothing");
  }
  return strategy;
}

std::vector<std::string> AiRegistry::list() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [name, factory] : factories_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace starlane
