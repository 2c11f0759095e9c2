#include "starlane/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace starlane {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  for (const auto& event : telemetry_queue_.drain()) {
    auto json_str = formatTelemetry(event);
    if (!json_str) {
      continue;
    }
    zmq::message_t msg(json_str->data(), json_str->size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] notification dropped (PUB would block).\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per notification
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<PlayerReadyEvent>(&event)) {
    j["type"] = "player_ready";
    j["game_id"] = e->game_id;
    j["turn_id"] = e->turn_id;
    j["player_id"] = e->player_id;
    j["completed_set"] = e->completed_set;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<TurnResolvedEvent>(&event)) {
    j["type"] = "turn_resolved";
    j["game_id"] = e->game_id;
    j["turn_id"] = e->turn_id;
    j["turn_number"] = e->turn_number;
    j["ships_built"] = e->ships_built;
    j["stars_expanded"] = e->stars_expanded;
    j["ships_moved"] = e->ships_moved;
    j["error_count"] = e->error_count;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<TurnAdvancedEvent>(&event)) {
    j["type"] = "turn_advanced";
    j["game_id"] = e->game_id;
    j["previous_turn_id"] = e->previous_turn_id;
    j["previous_turn_number"] = e->previous_turn_number;
    j["new_turn_id"] = e->new_turn_id;
    j["new_turn_number"] = e->new_turn_number;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<TurnOpenedEvent>(&event)) {
    j["type"] = "turn_opened";
    j["game_id"] = e->game_id;
    j["turn_id"] = e->turn_id;
    j["turn_number"] = e->turn_number;
    j["timestamp_ms"] = e->timestamp_ms;
  } else {
    return std::nullopt;
  }
  return j.dump();
}

}  // namespace starlane
