#pragma once

#include "starlane/ai/ai_order_gateway.hpp"
#include "starlane/ai/world_view.hpp"

#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// IAiStrategy - one AI player's decision logic
// -----------------------------------------------------------------------------
// takeTurn() reads the view and submits draft orders through the gateway.
// It does not end the turn; the AiTurnExecutor does that once takeTurn()
// returns. Throwing from takeTurn() fails this player's AI turn only.
// -----------------------------------------------------------------------------
class IAiStrategy {
 public:
  virtual ~IAiStrategy() = default;

  virtual std::string name() const = 0;

  virtual void takeTurn(const WorldView& view, AiOrderGateway& orders) = 0;
};

}  // namespace starlane
