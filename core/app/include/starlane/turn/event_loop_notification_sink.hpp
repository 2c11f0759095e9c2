#pragma once

#include "starlane/concurrent/event_loop_thread.hpp"
#include "starlane/turn/i_notification_sink.hpp"

namespace starlane {

// -----------------------------------------------------------------------------
// EventLoopNotificationSink
// -----------------------------------------------------------------------------
// Pushes every notification into an EventLoopThread's queue. Listeners
// subscribe to that loop's EventBus and run on its worker, never on the
// thread that resolved the turn.
// -----------------------------------------------------------------------------
class EventLoopNotificationSink final : public INotificationSink {
 public:
  explicit EventLoopNotificationSink(EventLoopThread& loop) : loop_(loop) {}

  void publish(Event event) override { loop_.push(std::move(event)); }

 private:
  EventLoopThread& loop_;
};

}  // namespace starlane
