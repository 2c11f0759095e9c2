#pragma once

#include "starlane/domain/star.hpp"
#include "starlane/store/database.hpp"

#include <optional>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// StandingOrderStore - per-star order templates that survive across turns
// -----------------------------------------------------------------------------
//
// @brief  Reads and writes the `standingOrders` entry of a star's details
//         bag.
//
// @details
// setStandingOrders() replaces both halves of the template at once and
// rejects with InvalidStandingOrder when:
//   - the template is empty (use clearStandingOrders instead)
//   - an industry percentage is negative or not finite
//   - the industry percentages sum to more than 100
//   - the move destination is empty, the star itself, or not connected to
//     the star by a wormhole
// The star must have a state row in the game (NotFoundError otherwise).
//
// Ownership of the star is an authorization concern checked by the caller
// (the engine's command surface), not here.
// -----------------------------------------------------------------------------
class StandingOrderStore {
 public:
  static constexpr const char* kDetailsKey = "standingOrders";

  explicit StandingOrderStore(Database& db);

  StandingOrderStore(const StandingOrderStore&) = delete;
  StandingOrderStore& operator=(const StandingOrderStore&) = delete;

  void setStandingOrders(GameId game, const StarId& star,
                         const domain::StandingOrders& orders);

  // std::nullopt when the star has no standing orders.
  std::optional<domain::StandingOrders> getStandingOrders(GameId game,
                                                          const StarId& star);

  // Returns true when something was removed.
  bool clearStandingOrders(GameId game, const StarId& star);

  // Stars of the game carrying standing orders, in star id order.
  std::vector<StarId> listStarsWithStandingOrders(GameId game);

  // Template checks that do not need the galaxy; throws InvalidStandingOrder.
  static void validateTemplate(const domain::StandingOrders& orders);

 private:
  Database& db_;
};

}  // namespace starlane
