#include "Room.h"
#include <algorithm>
#include <string>

std::string RoomSettings::validate() const {
    if (startingChips <= 0) {
        return "startingChips must be positive";
    }
    if (startingChips > Game::MAX_STARTING_CHIPS) {
        return "startingChips must be at most " + std::to_string(Game::MAX_STARTING_CHIPS);
    }
    if (smallBlind <= 0 || bigBlind <= 0) {
        return "Blinds must be positive";
    }
    if (maxPlayers < 2 || maxPlayers > Game::MAX_SEATS) {
        return "maxPlayers must be between 2 and " + std::to_string(Game::MAX_SEATS);
    }
    return "";
}

RoomSettings SettingsPatch::applyTo(RoomSettings settings) const {
    if (startingChips) settings.startingChips = *startingChips;
    if (smallBlind) settings.smallBlind = *smallBlind;
    if (bigBlind) settings.bigBlind = *bigBlind;
    if (maxPlayers) settings.maxPlayers = *maxPlayers;
    return settings;
}

Room::Room(std::string_view roomCode, std::string_view hostPlayerId, std::string_view hostName,
           const RoomSettings& cfg, Clock::time_point created)
    : code(roomCode), hostId(hostPlayerId), settings(cfg), gameStarted(false),
      createdAt(created), handsPlayed(0), closed(false) {
    members.push_back({hostId, std::string(hostName), true});
}

bool Room::isMember(std::string_view playerId) const {
    return std::any_of(members.begin(), members.end(),
        [playerId](const RoomMember& m) { return m.id == playerId; });
}

void Room::addMember(std::string_view playerId, std::string_view name) {
    members.push_back({std::string(playerId), std::string(name), false});
}

void Room::startHand(unsigned int seed) {
    std::vector<std::string> playerIds;
    playerIds.reserve(members.size());
    for (const auto& member : members) {
        playerIds.push_back(member.id);
    }

    Game::GameConfig config;
    config.smallBlind = settings.smallBlind;
    config.bigBlind = settings.bigBlind;
    config.startingChips = settings.startingChips;
    config.seed = seed;

    // Build before replacing so a failed deal leaves the previous hand in place
    Game next(config, playerIds, handsPlayed + 1);
    game = std::move(next);
    handsPlayed++;
    gameStarted = true;
}

Result<Game::TurnStatus> Room::applyAction(std::string_view playerId, Player::Action action, int amount) {
    if (!game) {
        return Result<Game::TurnStatus>::failure(ErrorCode::NOT_FOUND, "Room or game not found");
    }
    return game->processAction(playerId, action, amount);
}

RoomSnapshot Room::snapshot() const {
    return RoomSnapshot{code, members, settings, gameStarted, game};
}
