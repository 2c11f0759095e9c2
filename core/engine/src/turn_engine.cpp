#include "starlane/engine/turn_engine.hpp"

#include "starlane/ai/randy_strategy.hpp"
#include "starlane/domain/errors.hpp"
#include "starlane/domain/turn_event.hpp"
#include "starlane/serialization/snapshot_store.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor: wire services and bridges, no threads yet
// -----------------------------------------------------------------------------
TurnEngine::TurnEngine(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      games_(db_, clock_),
      players_(db_),
      world_(db_),
      events_(db_, clock_),
      orders_(db_, clock_),
      standing_orders_(db_),
      ledger_(db_, clock_),
      materializer_(standing_orders_, world_, orders_),
      resolver_(db_, orders_, events_),
      views_(db_),
      notify_loop_("notify"),
      ai_loop_("ai"),
      sink_(notify_loop_),
      advancer_(ledger_, materializer_, sink_, clock_),
      coordinator_(orders_, ledger_, resolver_, advancer_, sink_, clock_),
      ai_executor_(
          players_, views_, orders_, ai_registry_,
          [this](GameId game, PlayerId player) {
            coordinator_.endPlayerTurn(game, player);
          },
          std::chrono::milliseconds(config_.ai_delay_ms)) {
  registerBuiltinStrategies(ai_registry_);

  // Bridge 1: every notification -> IPC PUB socket.
  notify_loop_.eventBus().subscribe([this](const Event& event) {
    if (ipc_server_) {
      ipc_server_->pushTelemetry(event);
    }
  });

  // Bridge 2: TurnOpenedEvent -> ai_loop.
  if (config_.auto_run_ai) {
    notify_loop_.eventBus().subscribe<TurnOpenedEvent>(
        [this](const TurnOpenedEvent& e) { ai_loop_.push(e); });
  }

  ai_loop_.eventBus().subscribe<TurnOpenedEvent>(
      [this](const TurnOpenedEvent& e) { onTurnOpened(e); });
}

TurnEngine::~TurnEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TurnEngine::start() {
  if (running_) {
    return;
  }

  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();
  }

  notify_loop_.start();
  ai_loop_.start();
  running_ = true;

  std::cout << "[TurnEngine] started. Threads: notify, ai"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TurnEngine::stop() {
  if (!running_) {
    return;
  }

  ai_loop_.stop();
  notify_loop_.stop();
  ipc_server_.reset();
  running_ = false;

  std::cout << "[TurnEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// startGame()
// -----------------------------------------------------------------------------
StartedGame TurnEngine::startGame(GameSetup setup) {
  GameRegistry::validateTopology(setup.galaxy);
  if (setup.players.empty()) {
    throw ValidationError("a game needs at least one player");
  }
  std::set<StarId> homes;
  for (const auto& seat : setup.players) {
    if (seat.player.name.empty()) {
      throw ValidationError("player name is required");
    }
    if (seat.player.type == domain::PlayerType::Human &&
        !aiStrategyName(seat.player).empty()) {
      throw ValidationError("player '" + seat.player.name +
                            "' of type player cannot name an AI strategy");
    }
    if (seat.home_star.empty()) {
      continue;
    }
    if (!setup.galaxy.hasStar(seat.home_star)) {
      throw ValidationError("home star '" + seat.home_star +
                            "' is not part of the galaxy");
    }
    if (!homes.insert(seat.home_star).second) {
      throw ValidationError("home star '" + seat.home_star +
                            "' is assigned twice");
    }
  }

  StartedGame started;
  setup.game.status = domain::GameStatus::Lobby;
  started.game = games_.createGame(std::move(setup.game));
  const GameId game = started.game.id;
  games_.storeGalaxy(game, setup.galaxy);

  std::map<StarId, PlayerId> owners;
  for (auto& seat : setup.players) {
    auto player = players_.addPlayer(game, std::move(seat.player));
    if (!seat.home_star.empty()) {
      owners.emplace(seat.home_star, player.id);
    }
    started.players.push_back(std::move(player));
  }

  for (const auto& star : setup.galaxy.stars) {
    domain::StarState state;
    state.game_id = game;
    state.star_id = star.id;
    auto owner = owners.find(star.id);
    if (owner != owners.end()) {
      state.owner = owner->second;
      state.economy = config_.home_economy;
    } else {
      state.economy = config_.neutral_economy;
    }
    world_.upsertStarState(std::move(state));
  }

  for (const auto& [star, owner] : owners) {
    for (std::uint32_t i = 0; i < config_.starting_ships; ++i) {
      domain::Ship ship;
      ship.game_id = game;
      ship.owner = owner;
      ship.location = star;
      ship.hp = config_.ship_hp;
      ship.power = config_.ship_power;
      ship.details = {{"seed", started.game.map_seed}};
      world_.insertShip(std::move(ship));
    }
  }

  games_.setStatus(game, domain::GameStatus::Running);
  started.game.status = domain::GameStatus::Running;
  started.turn = ledger_.openTurn(game, 1);

  nlohmann::json roster = nlohmann::json::array();
  for (const auto& p : started.players) {
    roster.push_back({{"id", p.id},
                      {"name", p.name},
                      {"type", domain::toString(p.type)}});
  }
  events_.append(game, started.turn.id, std::nullopt,
                 domain::event_kind::kGameStarted,
                 {{"seed", started.game.map_seed},
                  {"map_size", started.game.map_size},
                  {"stars", setup.galaxy.stars.size()},
                  {"wormholes", setup.galaxy.wormholes.size()},
                  {"players", std::move(roster)}});

  std::cout << "[TurnEngine] game " << game << " '" << started.game.name
            << "' started with " << started.players.size()
            << " player(s) on " << setup.galaxy.stars.size() << " star(s).\n";

  sink_.publish(TurnOpenedEvent{game, started.turn.id, started.turn.number,
                                clock_.now_ms()});
  return started;
}

// -----------------------------------------------------------------------------
// setPlayerStatus()
// -----------------------------------------------------------------------------
std::optional<TurnCompletion> TurnEngine::setPlayerStatus(
    GameId game, PlayerId player, domain::PlayerStatus status) {
  players_.setStatus(game, player, status);
  std::cout << "[TurnEngine] game " << game << ": player " << player
            << " is now " << domain::toString(status) << ".\n";
  return coordinator_.resolveIfComplete(game);
}

AiBatchResult TurnEngine::runAiTurns(GameId game) {
  return ai_executor_.executeAll(game);
}

// -----------------------------------------------------------------------------
// saveSnapshot() / loadSnapshot()
// -----------------------------------------------------------------------------
bool TurnEngine::saveSnapshot() {
  if (config_.snapshot_path.empty()) {
    return false;
  }
  starlane::saveSnapshot(db_, config_.snapshot_path);
  return true;
}

bool TurnEngine::loadSnapshot() {
  if (config_.snapshot_path.empty()) {
    return false;
  }
  return starlane::loadSnapshot(db_, config_.snapshot_path);
}

// -----------------------------------------------------------------------------
// requireStarOwner()
// -----------------------------------------------------------------------------
void TurnEngine::requireStarOwner(GameId game, PlayerId player,
                                  const StarId& star) {
  auto state = world_.getStarState(game, star);
  if (!state) {
    throw NotFoundError("star '" + star + "' has no state in game " +
                        std::to_string(game));
  }
  if (!state->owner || *state->owner != player) {
    throw ConflictError("star '" + star + "' is not owned by player " +
                        std::to_string(player));
  }
}

// -----------------------------------------------------------------------------
// onTurnOpened(): AI loop handler
// -----------------------------------------------------------------------------
void TurnEngine::onTurnOpened(const TurnOpenedEvent& event) {
  const auto open = ledger_.getOpenTurn(event.game_id);
  if (!open || open->id != event.turn_id) {
    std::cout << "[TurnEngine] game " << event.game_id << ": turn "
              << event.turn_number << " is no longer open, AI run skipped.\n";
    return;
  }
  ai_executor_.executeAll(event.game_id);
}

}  // namespace starlane
