#pragma once

#include "starlane/ai/world_view.hpp"

#include <optional>
#include <vector>

// Read-only questions strategies ask about a WorldView.
namespace starlane::map_analysis {

std::vector<StarId> adjacentStars(const WorldView& view, const StarId& star);

std::vector<const domain::StarState*> ownedStars(const WorldView& view,
                                                 PlayerId player);

// Active ships at the star, any owner.
std::vector<const domain::Ship*> shipsAtStar(const WorldView& view,
                                             const StarId& star);

// friendly / enemy active ship count at the star; 0 when no enemy is there.
double shipRatio(const WorldView& view, const StarId& star, PlayerId player);

// Sum of hp, optionally of one owner's ships only.
double shipStrength(const std::vector<const domain::Ship*>& ships,
                    std::optional<PlayerId> owner = std::nullopt);

double totalAvailableIndustry(const WorldView& view, PlayerId player);

// Stars next to one of the player's stars that the player does not own,
// each listed once.
std::vector<StarId> unownedAdjacentStars(const WorldView& view,
                                         PlayerId player);

}  // namespace starlane::map_analysis
