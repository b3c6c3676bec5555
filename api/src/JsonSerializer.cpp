#include "JsonSerializer.h"
#include <cstdint>
#include <limits>
#include <unordered_map>

namespace {

/**
 * Reads an integer field if present. Returns false when the field is present
 * but not an integer that fits in an int.
 */
bool readIntField(const json& obj, const char* key, std::optional<int>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    out = JsonSerializer::intFromJson(*it, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    return out.has_value();
}

}

std::optional<int> JsonSerializer::intFromJson(const json& value, int minValue, int maxValue) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }

    // Positive literals parse as unsigned and may exceed int64_t
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        if (maxValue < 0 || number > static_cast<std::uint64_t>(maxValue)) {
            return std::nullopt;
        }
        if (minValue > 0 && number < static_cast<std::uint64_t>(minValue)) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }

    const auto number = value.get<std::int64_t>();
    if (number < minValue || number > maxValue) {
        return std::nullopt;
    }
    return static_cast<int>(number);
}

std::string JsonSerializer::actionToString(Player::Action action) {
    switch (action) {
        case Player::Action::NONE: return "none";
        case Player::Action::FOLD: return "fold";
        case Player::Action::CALL: return "call";
        case Player::Action::RAISE: return "raise";
        case Player::Action::ALL_IN: return "all-in";
        default: return "unknown";
    }
}

Player::Action JsonSerializer::stringToAction(std::string_view str) {
    static const std::unordered_map<std::string_view, Player::Action> actionMap = {
        {"fold", Player::Action::FOLD},
        {"call", Player::Action::CALL},
        {"raise", Player::Action::RAISE},
        {"all-in", Player::Action::ALL_IN}
    };

    auto it = actionMap.find(str);
    return (it != actionMap.end()) ? it->second : Player::Action::NONE;
}

json JsonSerializer::cardToJson(const Card& card) {
    return json{
        {"suit", card.getSuitName()},
        {"rank", card.getRankName()}
    };
}

json JsonSerializer::cardsToJson(const std::vector<Card>& cards) {
    json cardsJson = json::array();
    for (const auto& card : cards) {
        cardsJson.push_back(cardToJson(card));
    }
    return cardsJson;
}

json JsonSerializer::playerToJson(const Player& player) {
    json holeCardsJson = json::array();
    for (const auto& card : player.getHoleCards()) {
        holeCardsJson.push_back(cardToJson(card));
    }

    return json{
        {"id", player.getId()},
        {"chips", player.getChips()},
        {"bet", player.getBet()},
        {"folded", player.isFolded()},
        {"allIn", player.isAllIn()},
        {"cards", std::move(holeCardsJson)},
        {"position", player.getPosition()}
    };
}

json JsonSerializer::gameToJson(const Game& game) {
    json playersJson = json::array();
    for (const auto& player : game.getPlayers()) {
        playersJson.push_back(playerToJson(player));
    }

    json historyJson = json::array();
    for (const auto& event : game.getHistory()) {
        historyJson.push_back(event);
    }

    return json{
        {"players", std::move(playersJson)},
        {"pot", game.getPot()},
        {"currentBet", game.getCurrentBet()},
        {"currentPlayerIndex", game.getCurrentPlayerIndex()},
        {"phase", game.getPhaseName()},
        {"communityCards", cardsToJson(game.getCommunityCards())},
        {"deck", cardsToJson(game.getDeck())},
        {"smallBlind", game.getSmallBlind()},
        {"bigBlind", game.getBigBlind()},
        {"handNumber", game.getHandNumber()},
        {"handComplete", game.isHandComplete()},
        {"history", std::move(historyJson)}
    };
}

json JsonSerializer::settingsToJson(const RoomSettings& settings) {
    return json{
        {"startingChips", settings.startingChips},
        {"smallBlind", settings.smallBlind},
        {"bigBlind", settings.bigBlind},
        {"maxPlayers", settings.maxPlayers}
    };
}

json JsonSerializer::roomToJson(const RoomSnapshot& room) {
    json playersJson = json::array();
    for (const auto& member : room.players) {
        playersJson.push_back({
            {"id", member.id},
            {"name", member.name},
            {"isHost", member.isHost}
        });
    }

    return json{
        {"roomCode", room.code},
        {"players", std::move(playersJson)},
        {"settings", settingsToJson(room.settings)},
        {"gameStarted", room.gameStarted},
        {"gameState", room.game ? gameToJson(*room.game) : json(nullptr)}
    };
}

Result<SettingsPatch> JsonSerializer::settingsPatchFromJson(const json& settingsJson) {
    if (!settingsJson.is_object()) {
        return Result<SettingsPatch>::failure(ErrorCode::VALIDATION, "settings must be an object");
    }

    SettingsPatch patch;
    if (!readIntField(settingsJson, "startingChips", patch.startingChips) ||
        !readIntField(settingsJson, "smallBlind", patch.smallBlind) ||
        !readIntField(settingsJson, "bigBlind", patch.bigBlind) ||
        !readIntField(settingsJson, "maxPlayers", patch.maxPlayers)) {
        return Result<SettingsPatch>::failure(ErrorCode::VALIDATION, "Settings values must be integers in range");
    }

    return Result<SettingsPatch>::success(patch);
}

Result<RoomSettings> JsonSerializer::settingsFromJson(const json& settingsJson) {
    Result<SettingsPatch> patch = settingsPatchFromJson(settingsJson);
    if (!patch.ok()) {
        return Result<RoomSettings>::failure(patch.error());
    }
    return Result<RoomSettings>::success(patch.value().applyTo(RoomSettings()));
}
