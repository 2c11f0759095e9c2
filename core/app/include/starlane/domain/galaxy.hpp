#pragma once

#include "starlane/domain/ids.hpp"

#include <string>
#include <vector>

namespace starlane {
namespace domain {

struct Star {
  StarId id;
  std::string name;
  double x{0.0};
  double y{0.0};
  double z{0.0};
  double resource{0.0};
};

// Undirected edge between two stars.
struct Wormhole {
  StarId a;
  StarId b;
};

// -----------------------------------------------------------------------------
// GalaxyTopology
// -----------------------------------------------------------------------------
//
// @brief  Read-only star/wormhole graph of one game, supplied by the
//         external galaxy generator.
//
// @details
// Stored once per game at start and never mutated afterwards. Lookup helpers
// scan the vectors; galaxies are small enough that no index is kept.
// -----------------------------------------------------------------------------
struct GalaxyTopology {
  std::vector<Star> stars;
  std::vector<Wormhole> wormholes;

  const Star* findStar(const StarId& id) const;
  bool hasStar(const StarId& id) const { return findStar(id) != nullptr; }

  // Stars connected to `id` by a wormhole, in wormhole order, without
  // duplicates.
  std::vector<StarId> neighbours(const StarId& id) const;

  bool adjacent(const StarId& a, const StarId& b) const;
};

}  // namespace domain
}  // namespace starlane
