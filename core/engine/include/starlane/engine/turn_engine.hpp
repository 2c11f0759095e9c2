#pragma once

#include "starlane/ai/ai_registry.hpp"
#include "starlane/ai/ai_turn_executor.hpp"
#include "starlane/ai/world_view.hpp"
#include "starlane/concurrent/event_loop_thread.hpp"
#include "starlane/config/engine_config.hpp"
#include "starlane/domain/galaxy.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/domain/player.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/network/ipc_server.hpp"
#include "starlane/orders/order_store.hpp"
#include "starlane/orders/standing_order_materializer.hpp"
#include "starlane/orders/standing_order_store.hpp"
#include "starlane/resolution/resolution_engine.hpp"
#include "starlane/store/database.hpp"
#include "starlane/store/event_log.hpp"
#include "starlane/store/game_registry.hpp"
#include "starlane/store/player_registry.hpp"
#include "starlane/store/world_repository.hpp"
#include "starlane/time/i_time_provider.hpp"
#include "starlane/turn/event_loop_notification_sink.hpp"
#include "starlane/turn/turn_advancer.hpp"
#include "starlane/turn/turn_coordinator.hpp"
#include "starlane/turn/turn_ledger.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace starlane {

// One seat of a new game. An empty home_star starts the player without a
// star or ships.
struct PlayerSetup {
  domain::Player player;
  StarId home_star;
};

struct GameSetup {
  domain::Game game;
  domain::GalaxyTopology galaxy;
  std::vector<PlayerSetup> players;
};

struct StartedGame {
  domain::Game game;
  domain::Turn turn;
  std::vector<domain::Player> players;
};

// -----------------------------------------------------------------------------
// TurnEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of the turn core: owns the store, every service, the
//         two event loops and the IPC server, and exposes the JSON command
//         surface.
//
// @details
// Thread layout:
//
//   notify_loop thread   drains turn notifications (PlayerReady,
//                        TurnResolved, TurnAdvanced, TurnOpened) and fans
//                        them out to the IPC PUB socket and to external
//                        subscribers of notificationBus()
//   ai_loop thread       runs AiTurnExecutor::executeAll() when a turn
//                        opens (config "ai.auto_run")
//   ipc thread           answers commands via executeCommand()
//   caller threads       executeCommand() / startGame() / coordinator()
//
// Cross-thread bridges (subscribed once, in the constructor):
//   1. notify_loop -> ipc_server:  every notification (pushTelemetry)
//   2. notify_loop -> ai_loop:     TurnOpenedEvent, when ai.auto_run is set
//
// Notifications raised before start() stay queued and are delivered once
// the loops run.
//
// Ownership:
//   TurnEngine
//    ├── config_, clock_ (borrowed)
//    ├── db_                          (Database, value member)
//    ├── stores and services          (value members, borrow db_)
//    ├── notify_loop_, ai_loop_       (EventLoopThread, value members)
//    ├── sink_                        (pushes into notify_loop_)
//    └── ipc_server_                  (unique_ptr, only when both IPC
//                                      endpoints are configured)
//
// Every service is a value member declared after the things it borrows,
// so reverse destruction order is always safe. stop() joins every thread
// before any member is destroyed.
// -----------------------------------------------------------------------------
class TurnEngine {
 public:
  TurnEngine(EngineConfig config, const ITimeProvider& clock);

  ~TurnEngine();

  TurnEngine(const TurnEngine&) = delete;
  TurnEngine& operator=(const TurnEngine&) = delete;
  TurnEngine(TurnEngine&&) = delete;
  TurnEngine& operator=(TurnEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Startup sequence:
  //   1. Create and start the IpcServer (when both endpoints are set).
  //   2. Start notify_loop_ and ai_loop_.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Joins the AI loop, then the notification loop, then the IPC server.
  // No thread reads the services after stop() returns. Idempotent.
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // startGame(setup)
  // -------------------------------------------------------------------------
  //
  // @brief  Creates a running game with turn 1 open.
  //
  // @details
  //   1. Validate the galaxy, the players and their home stars.
  //   2. Create the game and store its galaxy.
  //   3. Add the players.
  //   4. Seed a state row for every star: home stars owned with the home
  //      economy, every other star neutral.
  //   5. Seed the starting ships at each home star.
  //   6. Set the game Running and open turn 1.
  //   7. Log game_started and publish TurnOpenedEvent.
  //
  // @throws ValidationError for a bad setup, before anything is written.
  // -------------------------------------------------------------------------
  StartedGame startGame(GameSetup setup);

  // -------------------------------------------------------------------------
  // setPlayerStatus(game, player, status)
  // -------------------------------------------------------------------------
  // Suspend, eject or reinstate a player. Taking a player out of the
  // eligible set may complete it, in which case the open turn is resolved
  // here.
  // -------------------------------------------------------------------------
  std::optional<TurnCompletion> setPlayerStatus(GameId game, PlayerId player,
                                                domain::PlayerStatus status);

  AiBatchResult runAiTurns(GameId game);

  // Writes a snapshot to config "snapshot_path"; false when none is set.
  bool saveSnapshot();

  // Restores config "snapshot_path" into the store; false when no file.
  bool loadSnapshot();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one JSON command ({"command": "...", ...}).
  //
  // @return {"status": "ok", ...} or
  //         {"status": "error", "code": "...", "response": "..."}.
  //
  // @details
  // Never throws. Called on the IPC thread, or directly by tests.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Subscribers run on the notification loop thread.
  EventBus& notificationBus() { return notify_loop_.eventBus(); }

  const EngineConfig& config() const { return config_; }
  Database& database() { return db_; }
  GameRegistry& games() { return games_; }
  PlayerRegistry& players() { return players_; }
  WorldRepository& world() { return world_; }
  EventLog& events() { return events_; }
  OrderStore& orders() { return orders_; }
  StandingOrderStore& standingOrders() { return standing_orders_; }
  TurnLedger& ledger() { return ledger_; }
  TurnCoordinator& coordinator() { return coordinator_; }
  AiRegistry& aiRegistry() { return ai_registry_; }

 private:
  // Command dispatch, defined in turn_engine_commands.cpp.
  nlohmann::json dispatch(const nlohmann::json& request);

  // Throws ConflictError unless `player` owns `star`.
  void requireStarOwner(GameId game, PlayerId player, const StarId& star);

  void onTurnOpened(const TurnOpenedEvent& event);

  EngineConfig config_;
  const ITimeProvider& clock_;

  Database db_;
  GameRegistry games_;
  PlayerRegistry players_;
  WorldRepository world_;
  EventLog events_;
  OrderStore orders_;
  StandingOrderStore standing_orders_;
  TurnLedger ledger_;
  StandingOrderMaterializer materializer_;
  ResolutionEngine resolver_;
  AiRegistry ai_registry_;
  WorldViewBuilder views_;

  EventLoopThread notify_loop_;
  EventLoopThread ai_loop_;
  EventLoopNotificationSink sink_;

  TurnAdvancer advancer_;
  TurnCoordinator coordinator_;
  AiTurnExecutor ai_executor_;

  std::unique_ptr<IpcServer> ipc_server_;
  bool running_{false};
};

}  // namespace starlane
