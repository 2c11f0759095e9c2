#include "starlane/engine/turn_engine.hpp"

#include "starlane/domain/errors.hpp"
#include "starlane/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>

namespace starlane {

namespace {

using nlohmann::json;

template <typename T>
T field(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    throw ValidationError(std::string("missing field '") + key + "'");
  }
  return it->get<T>();
}

template <typename T>
std::optional<T> optionalField(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

domain::OrderType orderTypeField(const json& request, const char* key) {
  return domain::orderTypeFromJson(request.at(key));
}

// "turn_id" when given, otherwise the game's open turn.
TurnId turnField(const json& request, GameId game, TurnLedger& ledger) {
  if (auto turn = optionalField<TurnId>(request, "turn_id")) {
    return *turn;
  }
  auto open = ledger.getOpenTurn(game);
  if (!open) {
    throw ConflictError("game " + std::to_string(game) + " has no open turn");
  }
  return open->id;
}

template <typename Rows>
json rowsToJson(const Rows& rows) {
  json out = json::array();
  for (const auto& row : rows) {
    out.push_back(row);
  }
  return out;
}

json phaseToJson(const PhaseReport& phase) {
  json failures = json::array();
  for (const auto& f : phase.failures) {
    failures.push_back({{"row_id", f.row_id},
                        {"client_order_id", f.client_order_id},
                        {"player_id", f.player_id},
                        {"star_id", f.star},
                        {"error", f.error}});
  }
  return {{"considered", phase.considered},
          {"applied", phase.applied},
          {"skipped", phase.skipped},
          {"failures", std::move(failures)}};
}

json resolutionToJson(const ResolutionReport& r) {
  return {{"game_id", r.game_id},
          {"turn_id", r.turn_id},
          {"turn_number", r.turn_number},
          {"build", phaseToJson(r.build)},
          {"expansion", phaseToJson(r.expansion)},
          {"movement", phaseToJson(r.movement)},
          {"ships_built", r.ships_built},
          {"build_points_spent", r.build_points_spent},
          {"stars_expanded", r.stars_expanded},
          {"expansion_points_spent", r.expansion_points_spent},
          {"ships_moved", r.ships_moved},
          {"error_count", r.failureCount()}};
}

json materializeToJson(const MaterializeReport& m) {
  json failures = json::array();
  for (const auto& f : m.failures) {
    failures.push_back({{"star_id", f.star}, {"error", f.error}});
  }
  return {{"stars_scanned", m.stars_scanned},
          {"auto_build_orders", m.auto_build_orders},
          {"auto_move_orders", m.auto_move_orders},
          {"skipped_unowned", m.skipped_unowned},
          {"failures", std::move(failures)}};
}

json advanceToJson(const TurnAdvance& a) {
  return {{"previous_turn_id", a.closed.id},
          {"previous_turn_number", a.closed.number},
          {"new_turn_id", a.opened.id},
          {"new_turn_number", a.opened.number},
          {"players_reset", a.players_reset},
          {"standing_orders", materializeToJson(a.standing_orders)}};
}

json completionToJson(const std::optional<TurnCompletion>& completion) {
  if (!completion) {
    return nullptr;
  }
  json j;
  j["resolution"] = resolutionToJson(completion->resolution);
  j["advance"] = completion->advance ? advanceToJson(*completion->advance)
                                     : json(nullptr);
  return j;
}

json endTurnToJson(const EndTurnResult& r) {
  json j;
  j["game_id"] = r.game_id;
  j["player_id"] = r.player_id;
  j["turn_id"] = r.turn_id;
  j["turn_number"] = r.turn_number;
  j["finalized_orders"] = rowsToJson(r.finalized_orders);
  j["transitioned"] = r.transitioned;
  j["completed_set"] = r.completed_set;
  j["resolution"] =
      r.resolution ? resolutionToJson(*r.resolution) : json(nullptr);
  j["advance"] = r.advance ? advanceToJson(*r.advance) : json(nullptr);
  return j;
}

json aiBatchToJson(const AiBatchResult& batch) {
  json results = json::array();
  for (const auto& r : batch.results) {
    results.push_back({{"player_id", r.player_id},
                       {"strategy", r.strategy},
                       {"success", r.success},
                       {"orders_submitted", r.orders_submitted},
                       {"error", r.error}});
  }
  return {{"game_id", batch.game_id},
          {"processed", batch.processed},
          {"successful", batch.successful},
          {"failed", batch.failed},
          {"results", std::move(results)}};
}

GameSetup gameSetupFromJson(const json& request) {
  GameSetup setup;
  setup.game = request.value("game", json::object()).get<domain::Game>();
  setup.galaxy = field<domain::GalaxyTopology>(request, "galaxy");

  const auto& players = request.at("players");
  if (!players.is_array()) {
    throw ValidationError("'players' must be an array");
  }
  for (const auto& p : players) {
    PlayerSetup seat;
    seat.player = p.get<domain::Player>();
    seat.home_star = p.value("home_star", std::string{});
    setup.players.push_back(std::move(seat));
  }
  return setup;
}

}  // namespace

// -----------------------------------------------------------------------------
// executeCommand(): JSON in, JSON out, never throws
// -----------------------------------------------------------------------------
std::string TurnEngine::executeCommand(const std::string& cmd) {
  json response;
  try {
    const auto request = json::parse(cmd);
    if (!request.is_object()) {
      throw ValidationError("command must be a JSON object");
    }
    response = dispatch(request);
    response["status"] = "ok";
  } catch (const json::exception& e) {
    response = {{"status", "error"},
                {"code", "validation"},
                {"response", e.what()}};
  } catch (const std::exception& e) {
    response = {{"status", "error"},
                {"code", errorCode(e)},
                {"response", e.what()}};
  }

  if (response["status"] == "error") {
    std::cerr << "[TurnEngine] command failed (" << response["code"].get<std::string>()
              << "): " << response["response"].get<std::string>() << "\n";
  }
  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one handler per command name
// -----------------------------------------------------------------------------
json TurnEngine::dispatch(const json& request) {
  const auto command = field<std::string>(request, "command");

  using Handler = std::function<json(const json&)>;
  const std::map<std::string, Handler> handlers = {
      // --- engine ------------------------------------------------------------
      {"ping", [](const json&) { return json{{"response", "PONG"}}; }},
      {"status",
       [this](const json&) {
         json games = json::array();
         for (const auto& g : games_.listGames()) {
           auto open = ledger_.getOpenTurn(g.id);
           games.push_back(
               {{"id", g.id},
                {"name", g.name},
                {"status", domain::toString(g.status)},
                {"open_turn", open ? json(open->number) : json(nullptr)}});
         }
         return json{{"running", running_},
                     {"games", std::move(games)},
                     {"ai_strategies", ai_registry_.list()}};
       }},
      {"save_snapshot",
       [this](const json&) { return json{{"saved", saveSnapshot()}}; }},

      // --- games -------------------------------------------------------------
      {"start_game",
       [this](const json& r) {
         auto started = startGame(gameSetupFromJson(r));
         return json{{"game", started.game},
                     {"turn", started.turn},
                     {"players", rowsToJson(started.players)}};
       }},
      {"list_games",
       [this](const json&) {
         return json{{"games", rowsToJson(games_.listGames())}};
       }},
      {"list_players",
       [this](const json& r) {
         return json{{"players", rowsToJson(players_.listPlayers(
                                     field<GameId>(r, "game_id")))}};
       }},
      {"list_star_states",
       [this](const json& r) {
         return json{{"stars", rowsToJson(world_.listStarStates(
                                   field<GameId>(r, "game_id")))}};
       }},
      {"list_ships",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         auto star = optionalField<std::string>(r, "star_id");
         return json{{"ships", rowsToJson(star ? world_.listShipsAt(game, *star)
                                               : world_.listShips(game))}};
       }},

      // --- draft orders ------------------------------------------------------
      {"create_draft",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         const auto type = orderTypeField(r, "order_type");
         auto order = orders_.createDraft(
             game, turnField(r, game, ledger_), field<PlayerId>(r, "player_id"),
             type, domain::payloadFromJson(type, r.at("payload")));
         return json{{"order", order}};
       }},
      {"edit_draft",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         const auto type = orderTypeField(r, "order_type");
         auto order = orders_.editDraft(
             game, turnField(r, game, ledger_), field<PlayerId>(r, "player_id"),
             field<ClientOrderId>(r, "client_order_id"), type,
             domain::payloadFromJson(type, r.at("payload")));
         return json{{"order", order}};
       }},
      {"delete_draft",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         auto order = orders_.deleteDraft(
             game, turnField(r, game, ledger_), field<PlayerId>(r, "player_id"),
             field<ClientOrderId>(r, "client_order_id"));
         return json{{"order", order}};
       }},
      {"list_drafts",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         return json{{"orders", rowsToJson(orders_.listLatestDrafts(
                                    game, turnField(r, game, ledger_),
                                    field<PlayerId>(r, "player_id")))}};
       }},
      {"order_history",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         return json{{"orders", rowsToJson(orders_.orderHistory(
                                    game, turnField(r, game, ledger_),
                                    field<PlayerId>(r, "player_id"),
                                    field<ClientOrderId>(r, "client_order_id")))}};
       }},
      {"end_turn",
       [this](const json& r) {
         return endTurnToJson(coordinator_.endPlayerTurn(
             field<GameId>(r, "game_id"), field<PlayerId>(r, "player_id")));
       }},

      // --- final orders ------------------------------------------------------
      {"list_final_orders",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         const auto turn = turnField(r, game, ledger_);
         if (r.contains("order_type") && !r.at("order_type").is_null()) {
           return json{{"orders", rowsToJson(orders_.listFinalOrdersByType(
                                      game, turn,
                                      orderTypeField(r, "order_type")))}};
         }
         return json{{"orders",
                      rowsToJson(orders_.listFinalOrdersForTurn(
                          game, turn, optionalField<PlayerId>(r, "player_id")))}};
       }},
      {"list_orders_for_star",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         std::optional<domain::OrderType> type;
         if (r.contains("order_type") && !r.at("order_type").is_null()) {
           type = orderTypeField(r, "order_type");
         }
         return json{{"orders",
                      rowsToJson(orders_.listOrdersForStar(
                          game, turnField(r, game, ledger_),
                          field<std::string>(r, "star_id"),
                          optionalField<PlayerId>(r, "player_id"), type,
                          r.value("finals", false)))}};
       }},

      // --- standing orders ---------------------------------------------------
      {"set_standing_orders",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         const auto star = field<std::string>(r, "star_id");
         requireStarOwner(game, field<PlayerId>(r, "player_id"), star);
         const auto orders =
             field<domain::StandingOrders>(r, "standing_orders");
         standing_orders_.setStandingOrders(game, star, orders);
         return json{{"star_id", star}, {"standing_orders", orders}};
       }},
      {"get_standing_orders",
       [this](const json& r) {
         const auto star = field<std::string>(r, "star_id");
         auto orders = standing_orders_.getStandingOrders(
             field<GameId>(r, "game_id"), star);
         return json{{"star_id", star},
                     {"standing_orders", orders ? json(*orders) : json(nullptr)}};
       }},
      {"clear_standing_orders",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         const auto star = field<std::string>(r, "star_id");
         requireStarOwner(game, field<PlayerId>(r, "player_id"), star);
         return json{{"star_id", star},
                     {"cleared", standing_orders_.clearStandingOrders(game, star)}};
       }},
      {"list_standing_orders",
       [this](const json& r) {
         return json{{"stars", standing_orders_.listStarsWithStandingOrders(
                                   field<GameId>(r, "game_id"))}};
       }},

      // --- turns and readiness -----------------------------------------------
      {"open_turn",
       [this](const json& r) {
         return json{{"turn", ledger_.openTurn(field<GameId>(r, "game_id"),
                                               field<std::uint32_t>(r, "number"))}};
       }},
      {"get_open_turn",
       [this](const json& r) {
         auto turn = ledger_.getOpenTurn(field<GameId>(r, "game_id"));
         return json{{"turn", turn ? json(*turn) : json(nullptr)}};
       }},
      {"list_turns",
       [this](const json& r) {
         return json{{"turns",
                      rowsToJson(ledger_.listTurns(field<GameId>(r, "game_id")))}};
       }},
      {"player_statuses",
       [this](const json& r) {
         json players = json::array();
         for (const auto& p :
              ledger_.listPlayerStatuses(field<GameId>(r, "game_id"))) {
           players.push_back({{"player_id", p.player_id},
                              {"name", p.name},
                              {"type", domain::toString(p.type)},
                              {"status", domain::toString(p.status)}});
         }
         return json{{"players", std::move(players)}};
       }},
      {"reset_players",
       [this](const json& r) {
         return json{{"players_reset", ledger_.resetPlayersForNewTurn(
                                           field<GameId>(r, "game_id"))}};
       }},
      {"set_player_status",
       [this](const json& r) {
         const auto status =
             domain::playerStatusFromJson(r.at("player_status"));
         auto completion = setPlayerStatus(field<GameId>(r, "game_id"),
                                           field<PlayerId>(r, "player_id"),
                                           status);
         return json{{"player_status", domain::toString(status)},
                     {"completion", completionToJson(completion)}};
       }},

      // --- events ------------------------------------------------------------
      {"events_for_player",
       [this](const json& r) {
         const auto game = field<GameId>(r, "game_id");
         return json{{"events", rowsToJson(events_.forPlayerTurn(
                                    game, field<TurnId>(r, "turn_id"),
                                    field<PlayerId>(r, "player_id")))}};
       }},
      {"events_for_turn",
       [this](const json& r) {
         return json{{"events", rowsToJson(events_.forTurn(
                                    field<GameId>(r, "game_id"),
                                    field<TurnId>(r, "turn_id")))}};
       }},
      {"events_by_kind",
       [this](const json& r) {
         const auto limit = r.value("limit", config_.default_event_limit);
         return json{{"events", rowsToJson(events_.byKind(
                                    field<GameId>(r, "game_id"),
                                    field<std::string>(r, "kind"), limit))}};
       }},

      // --- AI ----------------------------------------------------------------
      {"run_ai_turns",
       [this](const json& r) {
         return aiBatchToJson(runAiTurns(field<GameId>(r, "game_id")));
       }},
      {"list_ai_strategies",
       [this](const json&) {
         return json{{"strategies", ai_registry_.list()}};
       }},
  };

  auto it = handlers.find(command);
  if (it == handlers.end()) {
    throw ValidationError("unknown command '" + command + "'");
  }
  return it->second(request);
}

}  // namespace starlane
