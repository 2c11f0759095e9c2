#pragma once

#include "starlane/concurrent/thread_safe_queue.hpp"
#include "starlane/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace starlane {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ command and notification gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands from clients
//         (REP socket) and broadcasts turn notifications to listeners
//         (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (port 5556, configurable):
//      Receives one JSON command per request, forwards it to the command
//      handler (bound to TurnEngine::executeCommand()) and sends the JSON
//      reply back. ZMQ_RCVTIMEO keeps recv() from blocking indefinitely so
//      the thread can alternate between commands and notifications.
//
//   2. PUB socket (port 5557, configurable):
//      Broadcasts player_ready, turn_resolved, turn_advanced and
//      turn_opened messages. Events arrive through a ThreadSafeQueue from
//      the engine's notification loop; publishing is fire-and-forget
//      (dontwait).
//
// Thread model:
//   start() spawns the worker; stop() clears the flag and joins it.
//   pushTelemetry() is safe from any thread. The command handler runs on
//   the IPC thread.
//
// Ownership:
//   Owned by TurnEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the notification queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no thread is spawned until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets, sets ZMQ_RCVTIMEO on the REP
  // socket and spawns the worker. Idempotent while running.
  // -------------------------------------------------------------------------
  void start();

  // Joins the worker and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON text published for the event.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Loop (while running_): drain notifications, then wait up to
  // kPollTimeoutMs for one command. Drains once more on exit.
  void run();

  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace starlane
