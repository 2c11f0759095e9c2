#pragma once

#include <atomic>
#include <cstdint>

namespace starlane {

// -----------------------------------------------------------------------------
// IdGenerator - thread-safe, monotonically increasing row id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids for every table of the in-memory store
//         (games, players, turns, order rows, ships, events, client order
//         ids). Ids start at 1; 0 is reserved as the "unset" sentinel.
//
// @details
// One generator is owned by each Database. After a snapshot is loaded,
// advancePast() moves the counter beyond the largest hydrated id so new
// rows never collide with restored ones.
//
// Thread model:
//   next_id() and advancePast() are safe to call concurrently.
//
// Ownership:
//   Value member of Database.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // advancePast(id)
  // -------------------------------------------------------------------------
  // @brief  Ensures every later next_id() returns a value greater than id.
  //
  // @details
  // CAS loop so a concurrent next_id() is never moved backwards.
  // -------------------------------------------------------------------------
  void advancePast(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace starlane
