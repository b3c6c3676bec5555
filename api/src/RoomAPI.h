#ifndef ROOM_API_H
#define ROOM_API_H

#include <string>
#include <string_view>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "Result.h"
#include "RoomRegistry.h"

using json = nlohmann::json;

/**
 * Status code and JSON body for one request
 */
struct ApiResponse {
    int status;
    json body;
};

/**
 * Room API - maps requests onto the room registry
 *
 * Routes (an optional "/api" prefix is accepted):
 *   GET  /health
 *   POST /rooms/create    {hostName, settings}
 *   POST /rooms/join      {roomCode, playerName}
 *   POST /rooms/settings  {roomCode, hostId, settings}
 *   POST /rooms/new-hand  {roomCode, hostId}
 *   POST /rooms/action    {roomCode, playerId, action, amount?}
 *   GET  /rooms/{roomCode}/sync?playerId=
 *
 * Every room endpoint answers with the room snapshot under "game".
 * Errors are {"error": message} with the status from httpStatus().
 */
class RoomAPI {
public:
    explicit RoomAPI(RoomRegistry& rooms);

    /**
     * Routes one request
     * @param target Path plus optional query string
     * @param body Parsed request body (null for GET)
     */
    [[nodiscard]] ApiResponse processRequest(std::string_view method, std::string_view target, const json& body);

private:
    RoomRegistry& registry;

    ApiResponse createRoom(const json& body);
    ApiResponse joinRoom(const json& body);
    ApiResponse updateSettings(const json& body);
    ApiResponse startNewHand(const json& body);
    ApiResponse applyAction(const json& body);
    ApiResponse sync(const std::string& roomCode, const std::unordered_map<std::string, std::string>& query);
    ApiResponse health() const;

    /**
     * Splits "a=1&b=2" into a map; later duplicates win
     */
    static std::unordered_map<std::string, std::string> parseQuery(std::string_view query);

    /**
     * Creates an error response JSON object
     */
    static ApiResponse errorResponse(const Error& error);
    static ApiResponse errorResponse(int status, const std::string& message);
};

#endif // ROOM_API_H
