#include "RoomAPI.h"
#include "JsonSerializer.h"
#include <ctime>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>

namespace {

constexpr std::string_view apiPrefix = "/api";
constexpr std::string_view roomsPrefix = "/rooms/";
constexpr std::string_view syncSuffix = "/sync";

/**
 * Reads a string field; absent and null both read as empty
 */
std::string stringField(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return "";
    }
    return it->get<std::string>();
}

std::string isoTimestamp(std::time_t now) {
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

}

RoomAPI::RoomAPI(RoomRegistry& rooms) : registry(rooms) {}

ApiResponse RoomAPI::processRequest(std::string_view method, std::string_view target, const json& body) {
    std::string_view path = target;
    std::string_view query;
    size_t queryPos = target.find('?');
    if (queryPos != std::string_view::npos) {
        path = target.substr(0, queryPos);
        query = target.substr(queryPos + 1);
    }

    if (path.starts_with(apiPrefix)) {
        path.remove_prefix(apiPrefix.size());
    }

    try {
        if (method == "GET") {
            if (path == "/health") {
                return health();
            }
            // /rooms/{roomCode}/sync
            if (path.starts_with(roomsPrefix) && path.ends_with(syncSuffix)) {
                std::string_view code = path.substr(roomsPrefix.size(),
                    path.size() - roomsPrefix.size() - syncSuffix.size());
                if (!code.empty() && code.find('/') == std::string_view::npos) {
                    return sync(std::string(code), parseQuery(query));
                }
            }
        } else if (method == "POST") {
            if (!body.is_object()) {
                return errorResponse(400, "Request body must be a JSON object");
            }
            if (path == "/rooms/create") return createRoom(body);
            if (path == "/rooms/join") return joinRoom(body);
            if (path == "/rooms/settings") return updateSettings(body);
            if (path == "/rooms/new-hand") return startNewHand(body);
            if (path == "/rooms/action") return applyAction(body);
        }
    } catch (const json::exception& e) {
        // Wrong field types surface here from get<>()
        return errorResponse(400, std::string("Malformed request: ") + e.what());
    }

    return errorResponse(404, "Invalid endpoint");
}

ApiResponse RoomAPI::createRoom(const json& body) {
    std::string hostName = stringField(body, "hostName");

    std::optional<RoomSettings> settings;
    auto settingsIt = body.find("settings");
    if (settingsIt != body.end() && !settingsIt->is_null()) {
        Result<RoomSettings> parsed = JsonSerializer::settingsFromJson(*settingsIt);
        if (!parsed.ok()) {
            return errorResponse(parsed.error());
        }
        settings = parsed.value();
    }

    Result<SeatAssignment> created = registry.createRoom(hostName, settings);
    if (!created.ok()) {
        return errorResponse(created.error());
    }

    const SeatAssignment& seat = created.value();
    return {200, json{
        {"roomCode", seat.roomCode},
        {"playerId", seat.playerId},
        {"isHost", true},
        {"game", JsonSerializer::roomToJson(seat.game)}
    }};
}

ApiResponse RoomAPI::joinRoom(const json& body) {
    Result<SeatAssignment> joined = registry.joinRoom(stringField(body, "roomCode"),
                                                      stringField(body, "playerName"));
    if (!joined.ok()) {
        return errorResponse(joined.error());
    }

    const SeatAssignment& seat = joined.value();
    return {200, json{
        {"roomCode", seat.roomCode},
        {"playerId", seat.playerId},
        {"isHost", false},
        {"game", JsonSerializer::roomToJson(seat.game)}
    }};
}

ApiResponse RoomAPI::updateSettings(const json& body) {
    SettingsPatch patch;
    auto settingsIt = body.find("settings");
    if (settingsIt != body.end() && !settingsIt->is_null()) {
        Result<SettingsPatch> parsed = JsonSerializer::settingsPatchFromJson(*settingsIt);
        if (!parsed.ok()) {
            return errorResponse(parsed.error());
        }
        patch = parsed.value();
    }

    Result<RoomSnapshot> updated = registry.updateSettings(stringField(body, "roomCode"),
                                                           stringField(body, "hostId"), patch);
    if (!updated.ok()) {
        return errorResponse(updated.error());
    }
    return {200, json{{"game", JsonSerializer::roomToJson(updated.value())}}};
}

ApiResponse RoomAPI::startNewHand(const json& body) {
    Result<RoomSnapshot> started = registry.startNewHand(stringField(body, "roomCode"),
                                                         stringField(body, "hostId"));
    if (!started.ok()) {
        return errorResponse(started.error());
    }
    return {200, json{{"game", JsonSerializer::roomToJson(started.value())}}};
}

ApiResponse RoomAPI::applyAction(const json& body) {
    std::string actionStr = stringField(body, "action");
    Player::Action action = JsonSerializer::stringToAction(actionStr);

    int amount = 0;
    auto amountIt = body.find("amount");
    if (amountIt != body.end() && !amountIt->is_null()) {
        std::optional<int> parsed = JsonSerializer::intFromJson(*amountIt, 0, std::numeric_limits<int>::max());
        if (!parsed) {
            return errorResponse(Error{ErrorCode::VALIDATION, "amount must be a non-negative integer"});
        }
        amount = *parsed;
    }

    // Unknown tokens pass through as NONE so turn checks still come first
    Result<RoomSnapshot> applied = registry.applyAction(stringField(body, "roomCode"),
                                                        stringField(body, "playerId"), action, amount);
    if (!applied.ok()) {
        return errorResponse(applied.error());
    }
    return {200, json{{"game", JsonSerializer::roomToJson(applied.value())}}};
}

ApiResponse RoomAPI::sync(const std::string& roomCode, const std::unordered_map<std::string, std::string>& query) {
    auto it = query.find("playerId");
    std::string playerId = (it != query.end()) ? it->second : "";

    Result<RoomSnapshot> snapshot = registry.sync(roomCode, playerId);
    if (!snapshot.ok()) {
        return errorResponse(snapshot.error());
    }
    return {200, json{{"game", JsonSerializer::roomToJson(snapshot.value())}}};
}

ApiResponse RoomAPI::health() const {
    return {200, json{
        {"status", "ok"},
        {"timestamp", isoTimestamp(std::time(nullptr))},
        {"rooms", registry.roomCount()}
    }};
}

std::unordered_map<std::string, std::string> RoomAPI::parseQuery(std::string_view query) {
    std::unordered_map<std::string, std::string> params;

    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view() : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        if (eq == std::string_view::npos) {
            params[std::string(pair)] = "";
        } else {
            params[std::string(pair.substr(0, eq))] = std::string(pair.substr(eq + 1));
        }
    }

    return params;
}

ApiResponse RoomAPI::errorResponse(const Error& error) {
    return errorResponse(httpStatus(error.code), error.message);
}

ApiResponse RoomAPI::errorResponse(int status, const std::string& message) {
    return {status, json{{"error", message}}};
}
