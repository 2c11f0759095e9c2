#pragma once

#include "starlane/domain/order.hpp"
#include "starlane/store/database.hpp"
#include "starlane/time/i_time_provider.hpp"

#include <optional>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// OrderStore - revisioned draft orders and their final snapshots
// -----------------------------------------------------------------------------
//
// @brief  Persists every order a player (human or AI) submits for a turn as
//         append-only revision rows, and turns the live drafts into final
//         orders when the player ends the turn.
//
// @details
// A logical order is identified by (game, turn, player, client_order_id).
// The client_order_id is assigned by createDraft().
//
// Draft rows (is_final == false):
//   createDraft  revision 1
//   editDraft    revision latest + 1 with the new type and payload;
//                NotFoundError when the order has no revision yet
//   deleteDraft  revision latest + 1, is_deleted = true, type and payload
//                copied forward from the latest revision
//
// Final rows (is_final == true):
//   finalizePlayerTurn clears is_final on every previous final of the
//   player+turn, then appends one final copy (same revision, fresh row id,
//   finalized_at = now) of each live draft. Both steps run in one
//   transaction; no reader can observe the player with zero finals halfway
//   through a re-finalize.
//
// Every draft write validates, before touching the tables:
//   - the turn exists in the game and is open (NotFoundError / ConflictError)
//   - the player belongs to the game (NotFoundError)
//   - the payload alternative matches the order type and its stars are part
//     of the galaxy (ValidationError / NotFoundError)
//   - build amounts are finite and non-negative; a move names a destination
//     different from its source (ValidationError)
//
// Thread model:
//   Every public call is one Database transaction. Players writing their
//   own orders never conflict with each other beyond that lock.
//
// Ownership:
//   Owned by TurnEngine. Borrowed by the TurnCoordinator, the
//   StandingOrderMaterializer, the ResolutionEngine and the AI executor.
// -----------------------------------------------------------------------------
class OrderStore {
 public:
  OrderStore(Database& db, const ITimeProvider& clock);

  OrderStore(const OrderStore&) = delete;
  OrderStore& operator=(const OrderStore&) = delete;

  domain::OrderRecord createDraft(GameId game, TurnId turn, PlayerId player,
                                  domain::OrderType type,
                                  domain::OrderPayload payload);

  domain::OrderRecord editDraft(GameId game, TurnId turn, PlayerId player,
                                ClientOrderId order, domain::OrderType type,
                                domain::OrderPayload payload);

  domain::OrderRecord deleteDraft(GameId game, TurnId turn, PlayerId player,
                                  ClientOrderId order);

  // Latest revision of each logical order, without deleted ones, in
  // client_order_id order.
  std::vector<domain::OrderRecord> listLatestDrafts(GameId game, TurnId turn,
                                                    PlayerId player);

  // Returns the final rows written by this call.
  std::vector<domain::OrderRecord> finalizePlayerTurn(GameId game, TurnId turn,
                                                      PlayerId player);

  // -------------------------------------------------------------------------
  // listFinalOrdersForTurn(game, turn, player)
  // -------------------------------------------------------------------------
  // @brief  Current finals of the turn, optionally for one player only.
  //
  // @return Sorted by (player_id, client_order_id). This is the order in
  //         which the ResolutionEngine applies them.
  // -------------------------------------------------------------------------
  std::vector<domain::OrderRecord> listFinalOrdersForTurn(
      GameId game, TurnId turn, std::optional<PlayerId> player = std::nullopt);

  std::vector<domain::OrderRecord> listFinalOrdersByType(
      GameId game, TurnId turn, domain::OrderType type);

  // -------------------------------------------------------------------------
  // listOrdersForStar(game, turn, star, player, type, finals)
  // -------------------------------------------------------------------------
  // @brief  Orders whose payload source star is `star`.
  //
  // @details
  // With finals == false the latest live drafts are searched, otherwise the
  // current finals. player and type narrow the result further.
  // -------------------------------------------------------------------------
  std::vector<domain::OrderRecord> listOrdersForStar(
      GameId game, TurnId turn, const StarId& star,
      std::optional<PlayerId> player = std::nullopt,
      std::optional<domain::OrderType> type = std::nullopt,
      bool finals = false);

  // Every revision row of one logical order, finals included, in row order.
  std::vector<domain::OrderRecord> orderHistory(GameId game, TurnId turn,
                                                PlayerId player,
                                                ClientOrderId order);

 private:
  // Validation shared by create and edit; runs inside the caller's
  // transaction.
  static void validateDraftWrite(Tables& t, GameId game, TurnId turn,
                                 PlayerId player, domain::OrderType type,
                                 const domain::OrderPayload& payload);

  // Latest draft revision (deleted ones included) of every logical order
  // of the turn, optionally of one player only.
  static std::vector<const domain::OrderRecord*> latestDraftRevisions(
      const Tables& t, GameId game, TurnId turn,
      std::optional<PlayerId> player);

  Database& db_;
  const ITimeProvider& clock_;
};

}  // namespace starlane
