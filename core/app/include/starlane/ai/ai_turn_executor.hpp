#pragma once

#include "starlane/ai/ai_registry.hpp"
#include "starlane/ai/world_view.hpp"
#include "starlane/orders/order_store.hpp"
#include "starlane/store/player_registry.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace starlane {

struct AiTurnResult {
  PlayerId player_id{0};
  std::string strategy;
  bool success{false};
  std::size_t orders_submitted{0};
  std::string error;
};

struct AiBatchResult {
  GameId game_id{0};
  std::size_t processed{0};
  std::size_t successful{0};
  std::size_t failed{0};
  std::vector<AiTurnResult> results;
};

// -----------------------------------------------------------------------------
// AiTurnExecutor - runs the AI players of a game for the open turn
// -----------------------------------------------------------------------------
//
// @brief  For every Active player whose meta names a strategy: build a
//         WorldView, create the strategy with meta.ai_config, let it submit
//         drafts, then end the player's turn through `complete_turn`.
//
// @details
// complete_turn is the same end-turn path a human takes (the engine wires
// it to TurnCoordinator::endPlayerTurn), so the last AI player to finish
// can complete the set and resolve the turn from inside executeAll().
//
// A failure for one player (unknown strategy, throwing strategy, rejected
// end turn) is logged and reported; the remaining players still run.
// `delay` is slept between two players.
//
// Thread model: the engine calls executeAll() from its AI loop thread only.
// -----------------------------------------------------------------------------
class AiTurnExecutor {
 public:
  using TurnCompleter = std::function<void(GameId game, PlayerId player)>;

  AiTurnExecutor(PlayerRegistry& players, WorldViewBuilder& views,
                 OrderStore& orders, const AiRegistry& registry,
                 TurnCompleter complete_turn,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0));

  AiTurnExecutor(const AiTurnExecutor&) = delete;
  AiTurnExecutor& operator=(const AiTurnExecutor&) = delete;

  AiBatchResult executeAll(GameId game);

  // Runs one player; never throws, failures land in the result.
  AiTurnResult executeOne(GameId game, const domain::Player& player);

 private:
  PlayerRegistry& players_;
  WorldViewBuilder& views_;
  OrderStore& orders_;
  const AiRegistry& registry_;
  TurnCompleter complete_turn_;
  std::chrono::milliseconds delay_;
};

}  // namespace starlane
