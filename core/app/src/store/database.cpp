#include "starlane/store/database.hpp"

#include <algorithm>

namespace starlane {

namespace {

// Largest id of any row, client order ids included.
std::uint64_t maxRowId(const Tables& t) {
  std::uint64_t max_id = 0;
  for (const auto& [id, g] : t.games) max_id = std::max(max_id, id);
  for (const auto& [id, p] : t.players) max_id = std::max(max_id, id);
  for (const auto& [id, turn] : t.turns) max_id = std::max(max_id, id);
  for (const auto& [id, s] : t.ships) max_id = std::max(max_id, id);
  for (const auto& o : t.orders) {
    max_id = std::max({max_id, o.row_id, o.client_order_id});
  }
  for (const auto& e : t.events) max_id = std::max(max_id, e.id);
  return max_id;
}

}  // namespace

// -----------------------------------------------------------------------------
// hydrate()
// -----------------------------------------------------------------------------
void Database::hydrate(Tables tables) {
  std::lock_guard lock(mutex_);
  ids_.advancePast(maxRowId(tables));
  tables_ = std::move(tables);
}

// -----------------------------------------------------------------------------
// copyTables()
// -----------------------------------------------------------------------------
Tables Database::copyTables() {
  std::lock_guard lock(mutex_);
  return tables_;
}

}  // namespace starlane
