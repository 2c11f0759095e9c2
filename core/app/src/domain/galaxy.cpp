#include "starlane/domain/galaxy.hpp"

#include <algorithm>

namespace starlane {
namespace domain {

// -----------------------------------------------------------------------------
// findStar()
// -----------------------------------------------------------------------------
const Star* GalaxyTopology::findStar(const StarId& id) const {
  auto it = std::find_if(stars.begin(), stars.end(),
                         [&id](const Star& s) { return s.id == id; });
  return it == stars.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------------------
// neighbours()
// -----------------------------------------------------------------------------
std::vector<StarId> GalaxyTopology::neighbours(const StarId& id) const {
  std::vector<StarId> result;
  for (const auto& w : wormholes) {
    const StarId* other = nullptr;
    if (w.a == id) {
      other = &w.b;
    } else if (w.b == id) {
      other = &w.a;
    }
    if (other != nullptr && *other != id &&
        std::find(result.begin(), result.end(), *other) == result.end()) {
      result.push_back(*other);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// adjacent()
// -----------------------------------------------------------------------------
bool GalaxyTopology::adjacent(const StarId& a, const StarId& b) const {
  return std::any_of(wormholes.begin(), wormholes.end(),
                     [&](const Wormhole& w) {
                       return (w.a == a && w.b == b) || (w.a == b && w.b == a);
                     });
}

}  // namespace domain
}  // namespace starlane
