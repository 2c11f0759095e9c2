// =============================================================================
// test_support.hpp
// =============================================================================
// Shared helpers for the turn-core suites:
//   - RecordingSink: INotificationSink that keeps every event in memory
//   - lineGalaxy():  A - B - C - D, plus an isolated star E
//   - TestWorld:     Database, simulated clock and every store, with one
//                    running game of two human players and turn 1 open
// =============================================================================
#pragma once

#include "starlane/domain/galaxy.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/domain/player.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/orders/order_store.hpp"
#include "starlane/orders/standing_order_store.hpp"
#include "starlane/store/database.hpp"
#include "starlane/store/event_log.hpp"
#include "starlane/store/game_registry.hpp"
#include "starlane/store/player_registry.hpp"
#include "starlane/store/world_repository.hpp"
#include "starlane/time/simulation_time_provider.hpp"
#include "starlane/turn/i_notification_sink.hpp"
#include "starlane/turn/turn_ledger.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace starlane::test_support {

class RecordingSink final : public INotificationSink {
 public:
  void publish(Event event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(std::move(event));
  }

  template <typename T>
  std::vector<T> eventsOf() const {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    for (const auto& e : events_) {
      if (const auto* typed = std::get_if<T>(&e)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

inline domain::GalaxyTopology lineGalaxy() {
  domain::GalaxyTopology g;
  for (const char* id : {"A", "B", "C", "D", "E"}) {
    domain::Star star;
    star.id = id;
    star.name = std::string("Star ") + id;
    g.stars.push_back(star);
  }
  g.wormholes = {{"A", "B"}, {"B", "C"}, {"C", "D"}};
  return g;
}

// -----------------------------------------------------------------------------
// TestWorld
// -----------------------------------------------------------------------------
// alice owns A, bob owns D; B, C and E are neutral. Every star starts with
// available = 0, industry = 0, technology = 1 unless a test sets it.
// -----------------------------------------------------------------------------
struct TestWorld {
  SimulationTimeProvider clock{1'000};
  Database db;
  GameRegistry games{db, clock};
  PlayerRegistry players{db};
  WorldRepository world{db};
  EventLog events{db, clock};
  OrderStore orders{db, clock};
  StandingOrderStore standing{db};
  TurnLedger ledger{db, clock};

  GameId game{0};
  PlayerId alice{0};
  PlayerId bob{0};
  domain::Turn turn;

  TestWorld() {
    domain::Game setup;
    setup.name = "test";
    setup.map_seed = 7;
    game = games.createGame(setup).id;
    games.storeGalaxy(game, lineGalaxy());
    games.setStatus(game, domain::GameStatus::Running);

    alice = addPlayer("alice");
    bob = addPlayer("bob");

    for (const auto& star : lineGalaxy().stars) {
      domain::StarState state;
      state.game_id = game;
      state.star_id = star.id;
      if (star.id == "A") {
        state.owner = alice;
      } else if (star.id == "D") {
        state.owner = bob;
      }
      world.upsertStarState(state);
    }

    turn = ledger.openTurn(game, 1);
  }

  PlayerId addPlayer(const std::string& name,
                     domain::PlayerType type = domain::PlayerType::Human,
                     nlohmann::json meta = nlohmann::json::object()) {
    domain::Player p;
    p.name = name;
    p.type = type;
    p.meta = std::move(meta);
    return players.addPlayer(game, p).id;
  }

  void setEconomy(const StarId& star, double available, double industry,
                  double technology) {
    auto state = *world.getStarState(game, star);
    state.economy = {available, industry, technology};
    world.upsertStarState(state);
  }

  void setOwner(const StarId& star, std::optional<PlayerId> owner) {
    auto state = *world.getStarState(game, star);
    state.owner = owner;
    world.upsertStarState(state);
  }

  domain::Economy economy(const StarId& star) {
    return world.getStarState(game, star)->economy;
  }

  ShipId addShip(const StarId& star, PlayerId owner) {
    domain::Ship ship;
    ship.game_id = game;
    ship.owner = owner;
    ship.location = star;
    ship.hp = 1.0;
    ship.power = 1.0;
    return world.insertShip(ship).id;
  }

  static domain::BuildPayload build(const StarId& star,
                                    std::optional<std::uint32_t> ships,
                                    double expand = 0.0, double research = 0.0,
                                    double amount = 0.0) {
    domain::BuildPayload p;
    p.source_star = star;
    p.ships = ships;
    p.expand = expand;
    p.research = research;
    p.build = amount;
    return p;
  }

  static domain::MovePayload move(const StarId& from, const StarId& to,
                                  std::vector<ShipId> ships = {}) {
    domain::MovePayload p;
    p.source_star = from;
    p.destination_star = to;
    p.ship_ids = std::move(ships);
    return p;
  }
};

}  // namespace starlane::test_support
