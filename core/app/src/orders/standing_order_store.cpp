#include "starlane/orders/standing_order_store.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/serialization/json_codec.hpp"
#include "starlane/store/lookups.hpp"

#include <cmath>
#include <string>

namespace starlane {

namespace {

// Accepts sums such as 33.3 + 33.3 + 33.4 that drift past 100 in binary.
constexpr double kPercentTolerance = 1e-9;

void requirePercentage(double value, const char* field) {
  if (!std::isfinite(value) || value < 0.0) {
    throw InvalidStandingOrder(std::string("industry percentage '") + field +
                               "' must be a non-negative number");
  }
}

bool hasStandingOrders(const domain::StarState& state) {
  auto it = state.details.find(StandingOrderStore::kDetailsKey);
  return it != state.details.end() && it->is_object() && !it->empty();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
StandingOrderStore::StandingOrderStore(Database& db) : db_(db) {}

// -----------------------------------------------------------------------------
// validateTemplate()
// -----------------------------------------------------------------------------
void StandingOrderStore::validateTemplate(
    const domain::StandingOrders& orders) {
  if (orders.empty()) {
    throw InvalidStandingOrder("standing orders need an industry or move part");
  }
  if (orders.industry) {
    const auto& t = *orders.industry;
    requirePercentage(t.expand, "expand");
    requirePercentage(t.research, "research");
    requirePercentage(t.build, "build");
    if (t.total() > 100.0 + kPercentTolerance) {
      throw InvalidStandingOrder("industry percentages sum to " +
                                 std::to_string(t.total()) +
                                 ", more than 100");
    }
  }
  if (orders.move && orders.move->destination_star.empty()) {
    throw InvalidStandingOrder("standing move needs a destination star");
  }
}

// -----------------------------------------------------------------------------
// setStandingOrders()
// -----------------------------------------------------------------------------
void StandingOrderStore::setStandingOrders(
    GameId game, const StarId& star, const domain::StandingOrders& orders) {
  validateTemplate(orders);

  auto tx = db_.begin();
  auto& state = lookup::requireStarState(tx.tables(), game, star);

  if (orders.move) {
    const auto& galaxy = lookup::requireGalaxy(tx.tables(), game);
    const auto& destination = orders.move->destination_star;
    if (destination == star) {
      throw InvalidStandingOrder("standing move cannot target its own star");
    }
    if (!galaxy.adjacent(star, destination)) {
      throw InvalidStandingOrder("star '" + destination +
                                 "' is not adjacent to '" + star + "'");
    }
  }

  state.details[kDetailsKey] = orders;
}

// -----------------------------------------------------------------------------
// getStandingOrders()
// -----------------------------------------------------------------------------
std::optional<domain::StandingOrders> StandingOrderStore::getStandingOrders(
    GameId game, const StarId& star) {
  auto tx = db_.begin();
  const auto& state = lookup::requireStarState(tx.tables(), game, star);
  if (!hasStandingOrders(state)) {
    return std::nullopt;
  }
  return state.details.at(kDetailsKey).get<domain::StandingOrders>();
}

// -----------------------------------------------------------------------------
// clearStandingOrders()
// -----------------------------------------------------------------------------
bool StandingOrderStore::clearStandingOrders(GameId game, const StarId& star) {
  auto tx = db_.begin();
  auto& state = lookup::requireStarState(tx.tables(), game, star);
  return state.details.erase(kDetailsKey) > 0;
}

// -----------------------------------------------------------------------------
// listStarsWithStandingOrders()
// -----------------------------------------------------------------------------
std::vector<StarId> StandingOrderStore::listStarsWithStandingOrders(
    GameId game) {
  auto tx = db_.begin();
  std::vector<StarId> result;
  for (const auto& [key, state] : tx->star_states) {
    if (key.first == game && hasStandingOrders(state)) {
      result.push_back(key.second);
    }
  }
  return result;
}

}  // namespace starlane
