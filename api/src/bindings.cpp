#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include "Deck.h"
#include "Game.h"
#include "JsonSerializer.h"
#include "RoomAPI.h"
#include "RoomRegistry.h"
#include <nlohmann/json.hpp>

namespace py = pybind11;

namespace {

// One registry per interpreter, like the server process
RoomRegistry& moduleRegistry() {
    static RoomRegistry registry;
    return registry;
}

}

// Helper to route a request through the same API the HTTP server uses
py::tuple handle_request(const std::string& method, const std::string& path, const std::string& body) {
    nlohmann::json requestData = nullptr;
    if (!body.empty()) {
        try {
            requestData = nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            nlohmann::json error = {{"error", "Invalid JSON"}, {"details", e.what()}};
            return py::make_tuple(400, error.dump());
        }
    }

    RoomAPI api(moduleRegistry());
    ApiResponse response = api.processRequest(method, path, requestData);
    return py::make_tuple(response.status, response.body.dump());
}

// Helper to expose a fresh canonical deck as short strings
std::vector<std::string> build_deck() {
    Deck deck(1);
    std::vector<std::string> cards;
    for (const auto& card : deck.getCards()) {
        cards.push_back(card.toString());
    }
    return cards;
}

Game new_game(const std::vector<std::string>& playerIds, int startingChips, int smallBlind, int bigBlind,
              unsigned int seed) {
    Game::GameConfig config;
    config.startingChips = startingChips;
    config.smallBlind = smallBlind;
    config.bigBlind = bigBlind;
    config.seed = seed;
    return Game(config, playerIds);
}

// Helper to process action via string; failures raise ValueError with the reason
bool process_action_str(Game& game, const std::string& playerId, const std::string& actionStr, int amount) {
    Player::Action action = JsonSerializer::stringToAction(actionStr);
    Result<Game::TurnStatus> outcome = game.processAction(playerId, action, amount);
    if (!outcome.ok()) {
        throw py::value_error(outcome.error().message);
    }
    return outcome.value() == Game::TurnStatus::NEXT_PLAYER;
}

std::string get_game_state_json(const Game& game) {
    return JsonSerializer::gameToJson(game).dump();
}

PYBIND11_MODULE(chipme_binding, m) {
    m.doc() = "Poker room engine bindings";

    m.def("handle_request", &handle_request,
        "Route a request through the room API. Returns (status, json_body).",
        py::arg("method"), py::arg("path"), py::arg("body") = "");

    m.def("build_deck", &build_deck, "The 52 cards in canonical order, e.g. ['2H', '3H', ...]");

    py::class_<Game>(m, "Game")
        .def("process_action", &process_action_str,
             "Apply fold/call/raise/all-in. Returns False when nobody is left to act.",
             py::arg("player_id"), py::arg("action"), py::arg("amount") = 0)
        .def("get_state_json", &get_game_state_json)
        .def_property_readonly("pot", &Game::getPot)
        .def_property_readonly("current_bet", &Game::getCurrentBet)
        .def_property_readonly("current_player_index", &Game::getCurrentPlayerIndex)
        .def_property_readonly("hand_complete", &Game::isHandComplete);

    m.def("new_game", &new_game, "Deal a new hand to the given player ids",
        py::arg("player_ids"), py::arg("starting_chips") = 1000, py::arg("small_blind") = 10,
        py::arg("big_blind") = 20, py::arg("seed") = 0);
}
