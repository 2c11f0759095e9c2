#pragma once

#include "starlane/concurrent/thread_safe_queue.hpp"
#include "starlane/eventbus/event_bus.hpp"
#include "starlane/events/event.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace starlane {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Other threads hand work to
// the loop with push(); subscribers of eventBus() run only on the worker.
//
// The engine runs two of these: the notification loop (fans turn
// notifications out to the IPC publisher and external listeners) and the AI
// loop (runs AI turns when a turn opens). Work pushed from inside a
// subscriber is queued, never re-entered, so an AI turn that completes a
// turn cannot recurse into the next AI turn on the same stack.
//
// Thread model: start() and stop() may be called from any thread but not
// from the worker itself. push() is safe from any thread, including the
// worker.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. Idempotent while the worker is running. After stop(),
  // start() may be called again; events pushed while stopped are kept and
  // delivered once the loop runs.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker and joins it; the worker notices within one idle
  // wait. Events still queued when stop() is called stay in the queue.
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  bool running() const { return running_.load(); }

  // Number of events waiting to be dispatched.
  std::size_t pending() const { return queue_.size(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

 private:
  // Worker loop: pop_for with a short timeout, publish, re-check running_.
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace starlane
