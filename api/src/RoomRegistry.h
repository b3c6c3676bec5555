#ifndef ROOM_REGISTRY_H
#define ROOM_REGISTRY_H

#include "IdGenerator.h"
#include "Result.h"
#include "Room.h"
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

// Transparent hash for string_view lookups without building a std::string
struct StringHash {
    using is_transparent = void;
    using hash_type = std::hash<std::string_view>;

    size_t operator()(std::string_view sv) const { return hash_type{}(sv); }
    size_t operator()(const std::string& s) const { return hash_type{}(s); }
    size_t operator()(const char* s) const { return hash_type{}(s); }
};

struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const {
        return lhs == rhs;
    }
};

/**
 * Seat handed out by create/join, with the room as it looked right after
 */
struct SeatAssignment {
    std::string roomCode;
    std::string playerId;
    RoomSnapshot game;
};

/**
 * Owns every room and the player-id index.
 *
 * Locking: each room has its own mutex, held for the whole of an operation on
 * that room. The two maps share one reader/writer lock that is only ever taken
 * after (never while waiting for) a room lock, so rooms proceed in parallel and
 * expiry cannot deadlock with a join.
 */
class RoomRegistry {
private:
    std::unique_ptr<IdGenerator> ids;
    mutable std::shared_mutex mapMutex;
    std::unordered_map<std::string, std::shared_ptr<Room>, StringHash, StringEqual> rooms;
    // Player id -> room code, for id uniqueness and expiry
    std::unordered_map<std::string, std::string, StringHash, StringEqual> players;

public:
    explicit RoomRegistry(std::unique_ptr<IdGenerator> generator = std::make_unique<RandomIdGenerator>());

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    /**
     * Creates a room with the host as its only member
     * @param settings Missing settings are a validation error
     */
    [[nodiscard]] Result<SeatAssignment> createRoom(std::string_view hostName,
                                                    const std::optional<RoomSettings>& settings,
                                                    Room::Clock::time_point now = Room::Clock::now());

    /**
     * Seats a new player; refused once a game has started or the room is full
     */
    [[nodiscard]] Result<SeatAssignment> joinRoom(std::string_view code, std::string_view playerName);

    /**
     * Host-only shallow merge of the present settings fields
     */
    [[nodiscard]] Result<RoomSnapshot> updateSettings(std::string_view code, std::string_view hostId,
                                                      const SettingsPatch& patch);

    /**
     * Host-only; deals a fresh hand to every member. Needs at least two members.
     * @param seed Deck seed, 0 for random
     */
    [[nodiscard]] Result<RoomSnapshot> startNewHand(std::string_view code, std::string_view hostId,
                                                    unsigned int seed = 0);

    /**
     * Applies one betting action to the room's current hand
     */
    [[nodiscard]] Result<RoomSnapshot> applyAction(std::string_view code, std::string_view playerId,
                                                   Player::Action action, int amount);

    /**
     * Read-only snapshot for a member of the room
     */
    [[nodiscard]] Result<RoomSnapshot> sync(std::string_view code, std::string_view playerId) const;

    /**
     * Removes rooms created more than `retention` before `now`, along with their player index entries
     * @return Number of rooms removed
     */
    size_t expireRooms(Room::Clock::time_point now, std::chrono::seconds retention);

    [[nodiscard]] size_t roomCount() const;
    [[nodiscard]] size_t playerCount() const;

    /**
     * Room codes are case-insensitive; stored upper-case
     */
    [[nodiscard]] static std::string normalizeCode(std::string_view code);

private:
    /**
     * Looks up a live room. The caller must lock the room and re-check isClosed().
     */
    std::shared_ptr<Room> findRoom(std::string_view normalizedCode) const;
};

#endif // ROOM_REGISTRY_H
