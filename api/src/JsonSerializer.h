#ifndef JSON_SERIALIZER_H
#define JSON_SERIALIZER_H

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "Card.h"
#include "Player.h"
#include "Game.h"
#include "Room.h"
#include "Result.h"

using json = nlohmann::json;

/**
 * JsonSerializer - Utility class for converting between game objects and JSON
 *
 * Provides static methods for serialization/deserialization of:
 * - Player::Action enum to/from wire tokens
 * - Cards, players and game state to JSON
 * - Room snapshots to the payload every endpoint returns
 * - Room settings from request bodies
 */
class JsonSerializer {
public:
    /**
     * Converts a Player::Action enum to its wire token ("all-in", not "all_in")
     */
    [[nodiscard]] static std::string actionToString(Player::Action action);

    /**
     * Converts a wire token to Player::Action; unknown tokens map to NONE
     */
    [[nodiscard]] static Player::Action stringToAction(std::string_view str);

    /**
     * {"suit": "hearts", "rank": "10"}
     */
    [[nodiscard]] static json cardToJson(const Card& card);

    [[nodiscard]] static json cardsToJson(const std::vector<Card>& cards);

    /**
     * Converts player state to JSON (includes hole cards)
     */
    [[nodiscard]] static json playerToJson(const Player& player);

    /**
     * Converts game state to JSON (full serialization, including the residual deck)
     */
    [[nodiscard]] static json gameToJson(const Game& game);

    [[nodiscard]] static json settingsToJson(const RoomSettings& settings);

    /**
     * {roomCode, players, settings, gameStarted, gameState | null}
     */
    [[nodiscard]] static json roomToJson(const RoomSnapshot& room);

    /**
     * Reads a JSON integer within [minValue, maxValue]
     * @return nullopt for non-integers (including fractions) and out-of-range values
     */
    [[nodiscard]] static std::optional<int> intFromJson(const json& value, int minValue, int maxValue);

    /**
     * Reads settings from a request object, starting from defaults.
     * Fails with VALIDATION when a present field is not an integer in int range.
     */
    [[nodiscard]] static Result<RoomSettings> settingsFromJson(const json& settingsJson);

    /**
     * Reads only the fields present in a request object
     */
    [[nodiscard]] static Result<SettingsPatch> settingsPatchFromJson(const json& settingsJson);
};

#endif // JSON_SERIALIZER_H
