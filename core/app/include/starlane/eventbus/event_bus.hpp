#pragma once

#include "starlane/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace starlane {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel. Subscribers register
// callbacks; publish() invokes every matching subscriber synchronously on
// the publishing thread.
//
// Each EventLoopThread owns one bus, so subscribers of that bus always run on
// the loop's worker thread.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// publish() copies the subscriber list under the lock and runs callbacks
// without holding it, so a callback may publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only fires when the published variant holds an
  // EventType. Implemented as a filtering wrapper around the generic form.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // After unsubscribe() returns, the callback will not run for later
  // publishes; a publish already in flight may still deliver one event.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace starlane
