#include "starlane/ai/map_analysis.hpp"

#include <algorithm>
#include <set>

namespace starlane::map_analysis {

std::vector<StarId> adjacentStars(const WorldView& view, const StarId& star) {
  return view.galaxy.neighbours(star);
}

std::vector<const domain::StarState*> ownedStars(const WorldView& view,
                                                 PlayerId player) {
  std::vector<const domain::StarState*> out;
  for (const auto& state : view.stars) {
    if (state.owner && *state.owner == player) {
      out.push_back(&state);
    }
  }
  return out;
}

std::vector<const domain::Ship*> shipsAtStar(const WorldView& view,
                                             const StarId& star) {
  std::vector<const domain::Ship*> out;
  for (const auto& ship : view.ships) {
    if (ship.location == star && ship.status == domain::ShipStatus::Active) {
      out.push_back(&ship);
    }
  }
  return out;
}

double shipRatio(const WorldView& view, const StarId& star, PlayerId player) {
  std::size_t friendly = 0;
  std::size_t enemy = 0;
  for (const auto* ship : shipsAtStar(view, star)) {
    if (ship->owner == player) {
      ++friendly;
    } else {
      ++enemy;
    }
  }
  if (enemy == 0) {
    return 0.0;
  }
  return static_cast<double>(friendly) / static_cast<double>(enemy);
}

double shipStrength(const std::vector<const domain::Ship*>& ships,
                    std::optional<PlayerId> owner) {
  double total = 0.0;
  for (const auto* ship : ships) {
    if (!owner || ship->owner == *owner) {
      total += ship->hp;
    }
  }
  return total;
}

double totalAvailableIndustry(const WorldView& view, PlayerId player) {
  double total = 0.0;
  for (const auto* state : ownedStars(view, player)) {
    total += state->economy.available;
  }
  return total;
}

std::vector<StarId> unownedAdjacentStars(const WorldView& view,
                                         PlayerId player) {
  const auto owned = ownedStars(view, player);
  std::set<StarId> owned_ids;
  for (const auto* state : owned) {
    owned_ids.insert(state->star_id);
  }

  std::vector<StarId> out;
  for (const auto* state : owned) {
    for (const auto& next : adjacentStars(view, state->star_id)) {
      if (owned_ids.count(next) == 0 &&
          std::find(out.begin(), out.end(), next) == out.end()) {
        out.push_back(next);
      }
    }
  }
  return out;
}

}  // namespace starlane::map_analysis
