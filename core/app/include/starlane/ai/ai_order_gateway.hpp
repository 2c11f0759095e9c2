#pragma once

#include "starlane/domain/order.hpp"
#include "starlane/orders/order_store.hpp"

#include <cstddef>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// AiOrderGateway
// -----------------------------------------------------------------------------
// The OrderStore, bound to one (game, turn, player). Strategies submit
// drafts through it exactly like a human client would; there is no other
// write path for an AI player.
// -----------------------------------------------------------------------------
class AiOrderGateway {
 public:
  AiOrderGateway(OrderStore& orders, GameId game, TurnId turn,
                 PlayerId player)
      : orders_(orders), game_(game), turn_(turn), player_(player) {}

  domain::OrderRecord createDraft(domain::OrderType type,
                                  domain::OrderPayload payload) {
    auto record =
        orders_.createDraft(game_, turn_, player_, type, std::move(payload));
    ++submitted_;
    return record;
  }

  std::vector<domain::OrderRecord> drafts() {
    return orders_.listLatestDrafts(game_, turn_, player_);
  }

  std::size_t submitted() const { return submitted_; }

  GameId game() const { return game_; }
  TurnId turn() const { return turn_; }
  PlayerId player() const { return player_; }

 private:
  OrderStore& orders_;
  GameId game_;
  TurnId turn_;
  PlayerId player_;
  std::size_t submitted_{0};
};

}  // namespace starlane
