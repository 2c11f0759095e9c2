#include "starlane/ai/ai_turn_executor.hpp"

#include "starlane/domain/errors.hpp"

#include <exception>
#include <iostream>
#include <thread>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AiTurnExecutor::AiTurnExecutor(PlayerRegistry& players,
                               WorldViewBuilder& views, OrderStore& orders,
                               const AiRegistry& registry,
                               TurnCompleter complete_turn,
                               std::chrono::milliseconds delay)
    : players_(players),
      views_(views),
      orders_(orders),
      registry_(registry),
      complete_turn_(std::move(complete_turn)),
      delay_(delay) {}

// -----------------------------------------------------------------------------
// executeAll()
// -----------------------------------------------------------------------------
AiBatchResult AiTurnExecutor::executeAll(GameId game) {
  AiBatchResult batch;
  batch.game_id = game;

  const auto ai_players = players_.listAiPlayers(game);
  std::cout << "[AiTurnExecutor] game " << game << ": " << ai_players.size()
            << " AI player(s) to run.\n";

  for (std::size_t i = 0; i < ai_players.size(); ++i) {
    if (i > 0 && delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }

    auto result = executeOne(game, ai_players[i]);
    ++batch.processed;
    if (result.success) {
      ++batch.successful;
    } else {
      ++batch.failed;
    }
    batch.results.push_back(std::move(result));
  }

  std::cout << "[AiTurnExecutor] game " << game << ": " << batch.successful
            << " succeeded, " << batch.failed << " failed.\n";
  return batch;
}

// -----------------------------------------------------------------------------
// executeOne()
// -----------------------------------------------------------------------------
AiTurnResult AiTurnExecutor::executeOne(GameId game,
                                        const domain::Player& player) {
  AiTurnResult result;
  result.player_id = player.id;
  result.strategy = aiStrategyName(player);

  try {
    if (result.strategy.empty()) {
      throw ValidationError("player " + std::to_string(player.id) +
                            " has no AI strategy");
    }

    const nlohmann::json config = player.meta.contains("ai_config")
                                      ? player.meta.at("ai_config")
                                      : nlohmann::json::object();
    auto strategy = registry_.create(result.strategy, game, player.id, config);
    const auto view = views_.build(game, player.id);

    AiOrderGateway gateway(orders_, game, view.turn.id, player.id);
    strategy->takeTurn(view, gateway);
    result.orders_submitted = gateway.submitted();

    if (complete_turn_) {
      complete_turn_(game, player.id);
    }
    result.success = true;
  } catch (const std::exception& e) {
    result.error = e.what();
    std::cerr << "[AiTurnExecutor] player " << player.id << " ("
              << player.name << ") failed: " << e.what() << "\n";
  }
  return result;
}

}  // namespace starlane
