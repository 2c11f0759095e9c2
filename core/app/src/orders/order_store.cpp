#include "starlane/orders/order_store.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/store/lookups.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <tuple>

namespace starlane {

namespace {

void requireFiniteAmount(double value, const char* field) {
  if (!std::isfinite(value) || value < 0.0) {
    throw ValidationError(std::string("build payload field '") + field +
                          "' must be a finite, non-negative number");
  }
}

// Sort key shared by every listing: player first, then order creation.
bool byPlayerThenOrder(const domain::OrderRecord& a,
                       const domain::OrderRecord& b) {
  return std::tie(a.player_id, a.client_order_id, a.row_id) <
         std::tie(b.player_id, b.client_order_id, b.row_id);
}

std::string describe(GameId game, TurnId turn, PlayerId player,
                     ClientOrderId order) {
  return "order " + std::to_string(order) + " of player " +
         std::to_string(player) + " (game " + std::to_string(game) +
         ", turn " + std::to_string(turn) + ")";
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderStore::OrderStore(Database& db, const ITimeProvider& clock)
    : db_(db), clock_(clock) {}

// -----------------------------------------------------------------------------
// validateDraftWrite()
// -----------------------------------------------------------------------------
void OrderStore::validateDraftWrite(Tables& t, GameId game, TurnId turn,
                                    PlayerId player, domain::OrderType type,
                                    const domain::OrderPayload& payload) {
  const auto& turn_row = lookup::requireTurn(t, game, turn);
  if (turn_row.status != domain::TurnStatus::Open) {
    throw ConflictError("turn " + std::to_string(turn_row.number) +
                        " is not open for orders");
  }
  lookup::requirePlayer(t, game, player);

  if (!domain::payloadMatchesType(type, payload)) {
    throw ValidationError(std::string("payload does not match order type '") +
                          domain::toString(type) + "'");
  }

  const auto& galaxy = lookup::requireGalaxy(t, game);
  const auto& source = domain::sourceStar(payload);
  if (source.empty()) {
    throw ValidationError("order payload requires a source star");
  }
  if (!galaxy.hasStar(source)) {
    throw NotFoundError("source star '" + source + "' does not exist");
  }

  if (const auto* build = std::get_if<domain::BuildPayload>(&payload)) {
    requireFiniteAmount(build->expand, "expand");
    requireFiniteAmount(build->research, "research");
    requireFiniteAmount(build->build, "build");
  } else if (const auto* move = std::get_if<domain::MovePayload>(&payload)) {
    if (move->destination_star.empty()) {
      throw ValidationError("move payload requires a destination star");
    }
    if (move->destination_star == move->source_star) {
      throw ValidationError("move destination equals its source");
    }
    if (!galaxy.hasStar(move->destination_star)) {
      throw NotFoundError("destination star '" + move->destination_star +
                          "' does not exist");
    }
  }
}

// -----------------------------------------------------------------------------
// latestDraftRevisions()
// -----------------------------------------------------------------------------
std::vector<const domain::OrderRecord*> OrderStore::latestDraftRevisions(
    const Tables& t, GameId game, TurnId turn,
    std::optional<PlayerId> player) {
  std::map<std::pair<PlayerId, ClientOrderId>, const domain::OrderRecord*>
      latest;
  for (const auto& row : t.orders) {
    if (row.is_final || row.game_id != game || row.turn_id != turn) {
      continue;
    }
    if (player && row.player_id != *player) {
      continue;
    }
    auto& slot = latest[{row.player_id, row.client_order_id}];
    if (slot == nullptr || row.revision > slot->revision) {
      slot = &row;
    }
  }

  std::vector<const domain::OrderRecord*> result;
  result.reserve(latest.size());
  for (const auto& [key, row] : latest) {
    result.push_back(row);
  }
  return result;
}

// -----------------------------------------------------------------------------
// createDraft()
// -----------------------------------------------------------------------------
domain::OrderRecord OrderStore::createDraft(GameId game, TurnId turn,
                                            PlayerId player,
                                            domain::OrderType type,
                                            domain::OrderPayload payload) {
  auto tx = db_.begin();
  validateDraftWrite(tx.tables(), game, turn, player, type, payload);

  domain::OrderRecord row;
  row.row_id = tx.nextId();
  row.client_order_id = tx.nextId();
  row.game_id = game;
  row.turn_id = turn;
  row.player_id = player;
  row.revision = 1;
  row.type = type;
  row.payload = std::move(payload);
  row.created_at_ms = clock_.now_ms();

  tx->orders.push_back(row);
  return row;
}

// -----------------------------------------------------------------------------
// editDraft()
// -----------------------------------------------------------------------------
domain::OrderRecord OrderStore::editDraft(GameId game, TurnId turn,
                                          PlayerId player, ClientOrderId order,
                                          domain::OrderType type,
                                          domain::OrderPayload payload) {
  auto tx = db_.begin();
  validateDraftWrite(tx.tables(), game, turn, player, type, payload);

  const domain::OrderRecord* latest = nullptr;
  for (const auto* row :
       latestDraftRevisions(tx.tables(), game, turn, player)) {
    if (row->client_order_id == order) {
      latest = row;
    }
  }
  if (latest == nullptr) {
    throw NotFoundError(describe(game, turn, player, order) +
                        " has no draft to edit");
  }

  domain::OrderRecord row;
  row.row_id = tx.nextId();
  row.client_order_id = order;
  row.game_id = game;
  row.turn_id = turn;
  row.player_id = player;
  row.revision = latest->revision + 1;
  row.type = type;
  row.payload = std::move(payload);
  row.created_at_ms = clock_.now_ms();

  tx->orders.push_back(row);
  return row;
}

// -----------------------------------------------------------------------------
// deleteDraft()
// -----------------------------------------------------------------------------
domain::OrderRecord OrderStore::deleteDraft(GameId game, TurnId turn,
                                            PlayerId player,
                                            ClientOrderId order) {
  auto tx = db_.begin();
  const auto& turn_row = lookup::requireTurn(tx.tables(), game, turn);
  if (turn_row.status != domain::TurnStatus::Open) {
    throw ConflictError("turn " + std::to_string(turn_row.number) +
                        " is not open for orders");
  }
  lookup::requirePlayer(tx.tables(), game, player);

  const domain::OrderRecord* latest = nullptr;
  for (const auto* row :
       latestDraftRevisions(tx.tables(), game, turn, player)) {
    if (row->client_order_id == order) {
      latest = row;
    }
  }
  if (latest == nullptr || latest->is_deleted) {
    throw NotFoundError(describe(game, turn, player, order) +
                        " has no draft to delete");
  }

  domain::OrderRecord row = *latest;
  row.row_id = tx.nextId();
  row.revision = latest->revision + 1;
  row.is_deleted = true;
  row.is_final = false;
  row.finalized_at_ms.reset();
  row.created_at_ms = clock_.now_ms();

  tx->orders.push_back(row);
  return row;
}

// -----------------------------------------------------------------------------
// listLatestDrafts()
// -----------------------------------------------------------------------------
std::vector<domain::OrderRecord> OrderStore::listLatestDrafts(GameId game,
                                                              TurnId turn,
                                                              PlayerId player) {
  auto tx = db_.begin();
  std::vector<domain::OrderRecord> result;
  for (const auto* row :
       latestDraftRevisions(tx.tables(), game, turn, player)) {
    if (!row->is_deleted) {
      result.push_back(*row);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// finalizePlayerTurn()
// -----------------------------------------------------------------------------
std::vector<domain::OrderRecord> OrderStore::finalizePlayerTurn(
    GameId game, TurnId turn, PlayerId player) {
  auto tx = db_.begin();
  const auto& turn_row = lookup::requireTurn(tx.tables(), game, turn);
  if (turn_row.status != domain::TurnStatus::Open) {
    throw ConflictError("turn " + std::to_string(turn_row.number) +
                        " is not open; orders cannot be finalized");
  }
  lookup::requirePlayer(tx.tables(), game, player);

  // Copy the live drafts first: appending to tx->orders below invalidates
  // the pointers returned by latestDraftRevisions().
  std::vector<domain::OrderRecord> live;
  for (const auto* row :
       latestDraftRevisions(tx.tables(), game, turn, player)) {
    if (!row->is_deleted) {
      live.push_back(*row);
    }
  }

  for (auto& row : tx->orders) {
    if (row.is_final && row.game_id == game && row.turn_id == turn &&
        row.player_id == player) {
      row.is_final = false;
    }
  }

  const TimestampMs now = clock_.now_ms();
  std::vector<domain::OrderRecord> finals;
  finals.reserve(live.size());
  for (auto& draft : live) {
    draft.row_id = tx.nextId();
    draft.is_final = true;
    draft.finalized_at_ms = now;
    draft.created_at_ms = now;
    tx->orders.push_back(draft);
    finals.push_back(std::move(draft));
  }
  return finals;
}

// -----------------------------------------------------------------------------
// listFinalOrdersForTurn()
// -----------------------------------------------------------------------------
std::vector<domain::OrderRecord> OrderStore::listFinalOrdersForTurn(
    GameId game, TurnId turn, std::optional<PlayerId> player) {
  auto tx = db_.begin();
  std::vector<domain::OrderRecord> result;
  for (const auto& row : tx->orders) {
    if (row.is_final && row.game_id == game && row.turn_id == turn &&
        (!player || row.player_id == *player)) {
      result.push_back(row);
    }
  }
  std::sort(result.begin(), result.end(), byPlayerThenOrder);
  return result;
}

// -----------------------------------------------------------------------------
// listFinalOrdersByType()
// -----------------------------------------------------------------------------
std::vector<domain::OrderRecord> OrderStore::listFinalOrdersByType(
    GameId game, TurnId turn, domain::OrderType type) {
  auto finals = listFinalOrdersForTurn(game, turn);
  finals.erase(std::remove_if(finals.begin(), finals.end(),
                              [type](const domain::OrderRecord& r) {
                                return r.type != type;
                              }),
               finals.end());
  return finals;
}

// -----------------------------------------------------------------------------
// listOrdersForStar()
// -----------------------------------------------------------------------------
std::vector<domain::OrderRecord> OrderStore::listOrdersForStar(
    GameId game, TurnId turn, const StarId& star,
    std::optional<PlayerId> player, std::optional<domain::OrderType> type,
    bool finals) {
  std::vector<domain::OrderRecord> candidates;
  if (finals) {
    candidates = listFinalOrdersForTurn(game, turn, player);
  } else {
    auto tx = db_.begin();
    for (const auto* row :
         latestDraftRevisions(tx.tables(), game, turn, player)) {
      if (!row->is_deleted) {
        candidates.push_back(*row);
      }
    }
  }

  std::vector<domain::OrderRecord> result;
  for (auto& row : candidates) {
    if (domain::sourceStar(row.payload) == star &&
        (!type || row.type == *type)) {
      result.push_back(std::move(row));
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// orderHistory()
// -----------------------------------------------------------------------------
std::vector<domain::OrderRecord> OrderStore::orderHistory(GameId game,
                                                          TurnId turn,
                                                          PlayerId player,
                                                          ClientOrderId order) {
  auto tx = db_.begin();
  std::vector<domain::OrderRecord> result;
  for (const auto& row : tx->orders) {
    if (row.game_id == game && row.turn_id == turn &&
        row.player_id == player && row.client_order_id == order) {
      result.push_back(row);
    }
  }
  return result;
}

}  // namespace starlane
