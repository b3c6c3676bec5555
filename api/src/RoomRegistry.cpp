#include "RoomRegistry.h"
#include "JsonSerializer.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <vector>

namespace {

template <typename T>
Result<T> roomNotFound() {
    return Result<T>::failure(ErrorCode::NOT_FOUND, "Room not found");
}

}

RoomRegistry::RoomRegistry(std::unique_ptr<IdGenerator> generator) : ids(std::move(generator)) {}

std::string RoomRegistry::normalizeCode(std::string_view code) {
    std::string normalized(code);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

std::shared_ptr<Room> RoomRegistry::findRoom(std::string_view normalizedCode) const {
    std::shared_lock<std::shared_mutex> lock(mapMutex);
    auto it = rooms.find(normalizedCode);
    return (it != rooms.end()) ? it->second : nullptr;
}

Result<SeatAssignment> RoomRegistry::createRoom(std::string_view hostName,
                                                const std::optional<RoomSettings>& settings,
                                                Room::Clock::time_point now) {
    if (hostName.empty() || !settings) {
        return Result<SeatAssignment>::failure(ErrorCode::VALIDATION, "Missing hostName or settings");
    }

    std::string problem = settings->validate();
    if (!problem.empty()) {
        return Result<SeatAssignment>::failure(ErrorCode::VALIDATION, problem);
    }

    std::shared_ptr<Room> room;
    {
        std::unique_lock<std::shared_mutex> lock(mapMutex);

        std::string code = ids->newRoomCode();
        while (rooms.contains(code)) {
            code = ids->newRoomCode();
        }
        std::string hostId = ids->newPlayerId();
        while (players.contains(hostId)) {
            hostId = ids->newPlayerId();
        }

        room = std::make_shared<Room>(code, hostId, hostName, *settings, now);
        rooms.emplace(code, room);
        players.emplace(hostId, code);
    }

    // Not yet visible to anyone else, but snapshot under the lock like every other path
    std::lock_guard<std::mutex> roomLock(room->mutex);
    std::cout << "[registry] Room created: " << room->getCode() << " by " << hostName << std::endl;

    return Result<SeatAssignment>::success({room->getCode(), room->getHostId(), room->snapshot()});
}

Result<SeatAssignment> RoomRegistry::joinRoom(std::string_view code, std::string_view playerName) {
    if (code.empty() || playerName.empty()) {
        return Result<SeatAssignment>::failure(ErrorCode::VALIDATION, "Missing roomCode or playerName");
    }

    std::shared_ptr<Room> room = findRoom(normalizeCode(code));
    if (!room) {
        return roomNotFound<SeatAssignment>();
    }

    std::lock_guard<std::mutex> roomLock(room->mutex);
    if (room->isClosed()) {
        return roomNotFound<SeatAssignment>();
    }

    if (room->isGameStarted()) {
        return Result<SeatAssignment>::failure(ErrorCode::INVALID_STATE, "Game already started");
    }

    if (room->isFull()) {
        return Result<SeatAssignment>::failure(ErrorCode::ROOM_FULL, "Room is full");
    }

    std::string playerId;
    {
        std::unique_lock<std::shared_mutex> lock(mapMutex);
        playerId = ids->newPlayerId();
        while (players.contains(playerId)) {
            playerId = ids->newPlayerId();
        }
        players.emplace(playerId, room->getCode());
    }
    room->addMember(playerId, playerName);

    std::cout << "[registry] Player " << playerName << " joined room " << room->getCode() << std::endl;

    return Result<SeatAssignment>::success({room->getCode(), playerId, room->snapshot()});
}

Result<RoomSnapshot> RoomRegistry::updateSettings(std::string_view code, std::string_view hostId,
                                                  const SettingsPatch& patch) {
    std::shared_ptr<Room> room = findRoom(normalizeCode(code));
    if (!room) {
        return roomNotFound<RoomSnapshot>();
    }

    std::lock_guard<std::mutex> roomLock(room->mutex);
    if (room->isClosed()) {
        return roomNotFound<RoomSnapshot>();
    }

    if (!room->isHost(hostId)) {
        return Result<RoomSnapshot>::failure(ErrorCode::FORBIDDEN, "Only host can update settings");
    }

    RoomSettings merged = patch.applyTo(room->getSettings());
    std::string problem = merged.validate();
    if (!problem.empty()) {
        return Result<RoomSnapshot>::failure(ErrorCode::VALIDATION, problem);
    }
    room->setSettings(merged);

    std::cout << "[registry] Settings updated for room " << room->getCode() << std::endl;

    return Result<RoomSnapshot>::success(room->snapshot());
}

Result<RoomSnapshot> RoomRegistry::startNewHand(std::string_view code, std::string_view hostId,
                                                unsigned int seed) {
    std::shared_ptr<Room> room = findRoom(normalizeCode(code));
    if (!room) {
        return roomNotFound<RoomSnapshot>();
    }

    std::lock_guard<std::mutex> roomLock(room->mutex);
    if (room->isClosed()) {
        return roomNotFound<RoomSnapshot>();
    }

    if (!room->isHost(hostId)) {
        return Result<RoomSnapshot>::failure(ErrorCode::FORBIDDEN, "Only host can start new hand");
    }

    if (room->getMembers().size() < 2) {
        return Result<RoomSnapshot>::failure(ErrorCode::INVALID_STATE, "Need at least 2 players to start");
    }

    room->startHand(seed);

    std::cout << "[registry] New hand started for room " << room->getCode() << std::endl;

    return Result<RoomSnapshot>::success(room->snapshot());
}

Result<RoomSnapshot> RoomRegistry::applyAction(std::string_view code, std::string_view playerId,
                                               Player::Action action, int amount) {
    std::shared_ptr<Room> room = findRoom(normalizeCode(code));
    if (!room) {
        return Result<RoomSnapshot>::failure(ErrorCode::NOT_FOUND, "Room or game not found");
    }

    std::lock_guard<std::mutex> roomLock(room->mutex);
    if (room->isClosed()) {
        return Result<RoomSnapshot>::failure(ErrorCode::NOT_FOUND, "Room or game not found");
    }

    Result<Game::TurnStatus> outcome = room->applyAction(playerId, action, amount);
    if (!outcome.ok()) {
        return Result<RoomSnapshot>::failure(outcome.error());
    }

    std::cout << "[registry] Player " << playerId << " performed "
              << JsonSerializer::actionToString(action) << " in room " << room->getCode() << std::endl;
    if (outcome.value() == Game::TurnStatus::NO_ELIGIBLE_ACTOR) {
        std::cout << "[registry] No player left to act in room " << room->getCode() << std::endl;
    }

    return Result<RoomSnapshot>::success(room->snapshot());
}

Result<RoomSnapshot> RoomRegistry::sync(std::string_view code, std::string_view playerId) const {
    std::shared_ptr<Room> room = findRoom(normalizeCode(code));
    if (!room) {
        return roomNotFound<RoomSnapshot>();
    }

    std::lock_guard<std::mutex> roomLock(room->mutex);
    if (room->isClosed()) {
        return roomNotFound<RoomSnapshot>();
    }

    if (!room->isMember(playerId)) {
        return Result<RoomSnapshot>::failure(ErrorCode::FORBIDDEN, "Player not in room");
    }

    return Result<RoomSnapshot>::success(room->snapshot());
}

size_t RoomRegistry::expireRooms(Room::Clock::time_point now, std::chrono::seconds retention) {
    std::vector<std::shared_ptr<Room>> candidates;
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex);
        candidates.reserve(rooms.size());
        for (const auto& entry : rooms) {
            candidates.push_back(entry.second);
        }
    }

    size_t removed = 0;
    for (const auto& room : candidates) {
        std::lock_guard<std::mutex> roomLock(room->mutex);
        if (room->isClosed() || now - room->getCreatedAt() <= retention) {
            continue;
        }

        // Close first so anyone already holding the pointer sees NOT_FOUND
        room->close();
        {
            std::unique_lock<std::shared_mutex> lock(mapMutex);
            for (const auto& member : room->getMembers()) {
                players.erase(member.id);
            }
            rooms.erase(room->getCode());
        }

        std::cout << "[registry] Cleaning up old room: " << room->getCode() << std::endl;
        removed++;
    }

    return removed;
}

size_t RoomRegistry::roomCount() const {
    std::shared_lock<std::shared_mutex> lock(mapMutex);
    return rooms.size();
}

size_t RoomRegistry::playerCount() const {
    std::shared_lock<std::shared_mutex> lock(mapMutex);
    return players.size();
}
