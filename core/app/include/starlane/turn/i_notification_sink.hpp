#pragma once

#include "starlane/events/event.hpp"

namespace starlane {

// -----------------------------------------------------------------------------
// INotificationSink - outbound turn notifications
// -----------------------------------------------------------------------------
//
// @brief  Receives PlayerReady, TurnResolved, TurnAdvanced and TurnOpened
//         notifications from the turn core.
//
// @details
// Delivery is fire-and-forget: publish() must not block on listeners and
// the core neither waits for nor retries a delivery. A throwing sink is
// logged by the caller and otherwise ignored.
//
// Implementations:
//   EventLoopNotificationSink  hands events to an EventLoopThread (engine)
//   test doubles               record events in memory
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void publish(Event event) = 0;
};

}  // namespace starlane
