#pragma once

#include "starlane/concurrent/id_generator.hpp"
#include "starlane/domain/galaxy.hpp"
#include "starlane/domain/game.hpp"
#include "starlane/domain/ids.hpp"
#include "starlane/domain/order.hpp"
#include "starlane/domain/player.hpp"
#include "starlane/domain/star.hpp"
#include "starlane/domain/turn.hpp"
#include "starlane/domain/turn_event.hpp"

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// Tables
// -----------------------------------------------------------------------------
// The relational state of every game hosted by one engine. Keyed maps give
// deterministic iteration order (by id); orders and events are append-only
// vectors in insertion order.
// -----------------------------------------------------------------------------
struct Tables {
  std::map<GameId, domain::Game> games;
  std::map<PlayerId, domain::Player> players;
  std::map<TurnId, domain::Turn> turns;
  std::vector<domain::OrderRecord> orders;
  std::map<std::pair<GameId, StarId>, domain::StarState> star_states;
  std::map<ShipId, domain::Ship> ships;
  std::vector<domain::TurnEvent> events;
  std::map<GameId, domain::GalaxyTopology> galaxies;
};

// -----------------------------------------------------------------------------
// Database - single source of truth for the turn core
// -----------------------------------------------------------------------------
//
// @brief  In-memory store shared by every repository and service. All access
//         goes through a Transaction, which holds the store lock for its
//         whole lifetime.
//
// @details
// A Transaction is the unit of atomicity: whatever a caller reads and writes
// between begin() and the Transaction's destruction is observed by other
// threads as one step. Repositories validate before they write, so a thrown
// error leaves the tables untouched; there is no rollback log.
//
// Composite operations (finalize, readiness check, one resolved order) open
// exactly one Transaction. Batch operations (resolution, materialization)
// open one per item, so the lock is never held across a whole turn.
//
// Thread model:
//   begin() may be called from any thread. Transactions are not re-entrant:
//   code running inside a Transaction must use the *InTx / lookup helpers
//   and never call begin() again.
//
// Ownership:
//   Owned by TurnEngine (or a test fixture). Repositories hold a reference.
// -----------------------------------------------------------------------------
class Database {
 public:
  class Transaction {
   public:
    Transaction(Transaction&&) = default;
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Tables& tables() { return *tables_; }
    Tables* operator->() { return tables_; }

    // Fresh row id from the owning Database.
    std::uint64_t nextId() { return ids_->next_id(); }

   private:
    friend class Database;
    Transaction(std::mutex& mutex, Tables& tables, IdGenerator& ids)
        : lock_(mutex), tables_(&tables), ids_(&ids) {}

    std::unique_lock<std::mutex> lock_;
    Tables* tables_;
    IdGenerator* ids_;
  };

  Database() = default;

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;
  Database(Database&&) = delete;
  Database& operator=(Database&&) = delete;

  Transaction begin() { return Transaction(mutex_, tables_, ids_); }

  // -------------------------------------------------------------------------
  // hydrate(tables)
  // -------------------------------------------------------------------------
  // @brief  Replaces the whole state with a restored copy (snapshot load)
  //         and moves the id generator past every restored id.
  // -------------------------------------------------------------------------
  void hydrate(Tables tables);

  // Deep copy of the current state, for snapshot saving.
  Tables copyTables();

 private:
  std::mutex mutex_;
  Tables tables_;
  IdGenerator ids_;
};

}  // namespace starlane
