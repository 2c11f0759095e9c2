#pragma once

#include "starlane/events/event_types.hpp"

#include <variant>

namespace starlane {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The envelope carried by every EventBus and EventLoopThread in the engine.
// These are in-process notifications; the persisted, per-turn game history
// lives in the EventLog (domain::TurnEvent), not here.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TurnOpenedEvent,
    PlayerReadyEvent,
    TurnResolvedEvent,
    TurnAdvancedEvent>;

}  // namespace starlane
