#ifndef ROOM_H
#define ROOM_H

#include "Game.h"
#include "Result.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Table settings chosen by the host
 */
struct RoomSettings {
    int startingChips;
    int smallBlind;
    int bigBlind;
    int maxPlayers;

    RoomSettings()
        : startingChips(1000), smallBlind(10), bigBlind(20), maxPlayers(10) {}

    /**
     * Checks ranges; maxPlayers is capped by the number of two-card hands in a deck
     * @return Empty string when valid, otherwise the reason
     */
    [[nodiscard]] std::string validate() const;
};

/**
 * Fields present in a settings update; absent fields keep their value
 */
struct SettingsPatch {
    std::optional<int> startingChips;
    std::optional<int> smallBlind;
    std::optional<int> bigBlind;
    std::optional<int> maxPlayers;

    [[nodiscard]] RoomSettings applyTo(RoomSettings settings) const;
};

/**
 * A person seated in the room. Persists across hands.
 */
struct RoomMember {
    std::string id;
    std::string name;
    bool isHost;
};

/**
 * Value copy of a room taken under its lock, safe to serialize anywhere
 */
struct RoomSnapshot {
    std::string code;
    std::vector<RoomMember> players;
    RoomSettings settings;
    bool gameStarted;
    std::optional<Game> game;
};

/**
 * One table. All access goes through the owning registry, which holds
 * the room mutex for the duration of each operation.
 */
class Room {
public:
    using Clock = std::chrono::system_clock;

private:
    std::string code;
    std::string hostId;
    RoomSettings settings;
    std::vector<RoomMember> members;
    std::optional<Game> game;
    bool gameStarted;
    Clock::time_point createdAt;
    int handsPlayed;
    bool closed;          // Set by expiry before the room leaves the registry

public:
    mutable std::mutex mutex;

    Room(std::string_view roomCode, std::string_view hostPlayerId, std::string_view hostName,
         const RoomSettings& cfg, Clock::time_point created);

    const std::string& getCode() const noexcept { return code; }
    const std::string& getHostId() const noexcept { return hostId; }
    const RoomSettings& getSettings() const noexcept { return settings; }
    const std::vector<RoomMember>& getMembers() const noexcept { return members; }
    bool isGameStarted() const noexcept { return gameStarted; }
    Clock::time_point getCreatedAt() const noexcept { return createdAt; }
    bool isClosed() const noexcept { return closed; }

    [[nodiscard]] bool isHost(std::string_view playerId) const { return playerId == hostId; }
    [[nodiscard]] bool isMember(std::string_view playerId) const;
    [[nodiscard]] bool isFull() const noexcept {
        return members.size() >= static_cast<size_t>(settings.maxPlayers);
    }

    void addMember(std::string_view playerId, std::string_view name);
    void setSettings(const RoomSettings& updated) { settings = updated; }
    void close() noexcept { closed = true; }

    /**
     * Deals a new hand to every member in join order and marks the game started.
     * @param seed Deck seed, 0 for random
     */
    void startHand(unsigned int seed = 0);

    /**
     * Delegates to the current hand; NOT_FOUND when no hand has been dealt
     */
    [[nodiscard]] Result<Game::TurnStatus> applyAction(std::string_view playerId, Player::Action action, int amount);

    [[nodiscard]] RoomSnapshot snapshot() const;
};

#endif // ROOM_H
