#include <iostream>
#include <cassert>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <string>
#include <thread>
#include <vector>
#include "RoomRegistry.h"
#include "JsonSerializer.h"

namespace {

/**
 * Hands out scripted room codes and numbered player ids
 */
class ScriptedIdGenerator : public IdGenerator {
private:
    std::deque<std::string> codes;
    int nextPlayer = 0;

public:
    explicit ScriptedIdGenerator(std::deque<std::string> roomCodes) : codes(std::move(roomCodes)) {}

    std::string newRoomCode() override {
        std::string code = codes.front();
        if (codes.size() > 1) {
            codes.pop_front();
        }
        return code;
    }

    std::string newPlayerId() override {
        return "player-" + std::to_string(nextPlayer++);
    }
};

RoomSettings smallTable(int maxPlayers = 4) {
    RoomSettings settings;
    settings.startingChips = 100;
    settings.smallBlind = 1;
    settings.bigBlind = 2;
    settings.maxPlayers = maxPlayers;
    return settings;
}

}

void testCreateRoom() {
    std::cout << "Testing room creation..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable());
    assert(created.ok());

    const SeatAssignment& seat = created.value();
    assert(seat.roomCode.size() == 6);
    for (char c : seat.roomCode) {
        assert((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'));
    }
    assert(!seat.playerId.empty());
    assert(seat.game.code == seat.roomCode);
    assert(seat.game.players.size() == 1);
    assert(seat.game.players[0].id == seat.playerId);
    assert(seat.game.players[0].name == "Alice");
    assert(seat.game.players[0].isHost);
    assert(!seat.game.gameStarted);
    assert(!seat.game.game.has_value());
    assert(seat.game.settings.startingChips == 100);

    assert(registry.roomCount() == 1);
    assert(registry.playerCount() == 1);

    std::cout << "  ✓ Room created with host seated" << std::endl;
}

void testCreateRoomValidation() {
    std::cout << "Testing room creation validation..." << std::endl;

    RoomRegistry registry;

    auto noName = registry.createRoom("", smallTable());
    assert(!noName.ok() && noName.error().code == ErrorCode::VALIDATION);
    assert(noName.error().message == "Missing hostName or settings");

    auto noSettings = registry.createRoom("Alice", std::nullopt);
    assert(!noSettings.ok() && noSettings.error().code == ErrorCode::VALIDATION);

    RoomSettings broke = smallTable();
    broke.startingChips = 0;
    auto badChips = registry.createRoom("Alice", broke);
    assert(!badChips.ok() && badChips.error().code == ErrorCode::VALIDATION);

    auto crowded = registry.createRoom("Alice", smallTable(27));
    assert(!crowded.ok() && crowded.error().code == ErrorCode::VALIDATION);

    assert(registry.roomCount() == 0);
    assert(registry.playerCount() == 0);

    std::cout << "  ✓ Invalid requests create nothing" << std::endl;
}

void testStackLimit() {
    std::cout << "Testing starting stack limit..." << std::endl;

    RoomRegistry registry;

    RoomSettings huge = smallTable(2);
    huge.startingChips = 2000000000;
    auto rejected = registry.createRoom("Alice", huge);
    assert(!rejected.ok() && rejected.error().code == ErrorCode::VALIDATION);
    assert(rejected.error().message == "startingChips must be at most " + std::to_string(Game::MAX_STARTING_CHIPS));

    RoomSettings deep = smallTable(Game::MAX_SEATS);
    deep.startingChips = Game::MAX_STARTING_CHIPS;
    auto created = registry.createRoom("Alice", deep);
    assert(created.ok());
    const std::string code = created.value().roomCode;
    const std::string hostId = created.value().playerId;

    SettingsPatch raise;
    raise.startingChips = Game::MAX_STARTING_CHIPS + 1;
    auto tooDeep = registry.updateSettings(code, hostId, raise);
    assert(!tooDeep.ok() && tooDeep.error().code == ErrorCode::VALIDATION);

    std::vector<std::string> seats{hostId};
    for (int i = 1; i < Game::MAX_SEATS; i++) {
        seats.push_back(registry.joinRoom(code, "guest" + std::to_string(i)).value().playerId);
    }
    assert(registry.startNewHand(code, hostId, 8).ok());

    // Every seat shoves: the pot holds the whole table without overflowing
    Result<RoomSnapshot> last = registry.sync(code, hostId);
    for (const auto& seat : seats) {
        last = registry.applyAction(code, seat, Player::Action::ALL_IN, 0);
        assert(last.ok());
    }
    const Game& hand = *last.value().game;
    assert(hand.isHandComplete());
    assert(hand.getPot() == Game::MAX_SEATS * Game::MAX_STARTING_CHIPS);
    assert(hand.getPot() > 0);
    assert(hand.getCurrentBet() == Game::MAX_STARTING_CHIPS);

    std::cout << "  ✓ Oversized stacks rejected; a full table of maximum stacks fits" << std::endl;
}

void testJoinRoom() {
    std::cout << "Testing joining a room..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable());
    const std::string code = created.value().roomCode;

    auto joined = registry.joinRoom(code, "Bob");
    assert(joined.ok());
    assert(joined.value().roomCode == code);
    assert(joined.value().playerId != created.value().playerId);
    assert(joined.value().game.players.size() == 2);
    assert(joined.value().game.players[1].name == "Bob");
    assert(!joined.value().game.players[1].isHost);

    // Codes are case-insensitive
    std::string lower = code;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto joinedLower = registry.joinRoom(lower, "Carol");
    assert(joinedLower.ok());
    assert(joinedLower.value().roomCode == code);

    auto missing = registry.joinRoom("ZZZZZZ", "Dave");
    assert(!missing.ok() && missing.error().code == ErrorCode::NOT_FOUND);
    assert(missing.error().message == "Room not found");

    auto noName = registry.joinRoom(code, "");
    assert(!noName.ok() && noName.error().code == ErrorCode::VALIDATION);

    assert(registry.playerCount() == 3);

    std::cout << "  ✓ Players join in order with fresh ids" << std::endl;
}

void testJoinRefusals() {
    std::cout << "Testing join refused when full or started..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable(2));
    const std::string code = created.value().roomCode;

    assert(registry.joinRoom(code, "Bob").ok());
    auto full = registry.joinRoom(code, "Carol");
    assert(!full.ok() && full.error().code == ErrorCode::ROOM_FULL);
    assert(httpStatus(full.error().code) == 400);

    // Make room, start, then try again
    SettingsPatch patch;
    patch.maxPlayers = 6;
    assert(registry.updateSettings(code, created.value().playerId, patch).ok());
    assert(registry.startNewHand(code, created.value().playerId).ok());

    auto started = registry.joinRoom(code, "Carol");
    assert(!started.ok() && started.error().code == ErrorCode::INVALID_STATE);
    assert(started.error().message == "Game already started");

    std::cout << "  ✓ Full and started rooms refuse new players" << std::endl;
}

void testUpdateSettings() {
    std::cout << "Testing settings updates..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable());
    const std::string code = created.value().roomCode;
    const std::string hostId = created.value().playerId;
    const std::string guestId = registry.joinRoom(code, "Bob").value().playerId;

    SettingsPatch patch;
    patch.bigBlind = 50;
    auto updated = registry.updateSettings(code, hostId, patch);
    assert(updated.ok());
    assert(updated.value().settings.bigBlind == 50);
    assert(updated.value().settings.smallBlind == 1);
    assert(updated.value().settings.startingChips == 100);

    auto forbidden = registry.updateSettings(code, guestId, patch);
    assert(!forbidden.ok() && forbidden.error().code == ErrorCode::FORBIDDEN);
    assert(httpStatus(forbidden.error().code) == 403);

    SettingsPatch invalid;
    invalid.smallBlind = -5;
    auto rejected = registry.updateSettings(code, hostId, invalid);
    assert(!rejected.ok() && rejected.error().code == ErrorCode::VALIDATION);
    assert(registry.sync(code, hostId).value().settings.smallBlind == 1);

    auto missing = registry.updateSettings("NOPE00", hostId, patch);
    assert(!missing.ok() && missing.error().code == ErrorCode::NOT_FOUND);

    std::cout << "  ✓ Host-only shallow merge with validation" << std::endl;
}

void testStartNewHand() {
    std::cout << "Testing starting hands..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable());
    const std::string code = created.value().roomCode;
    const std::string hostId = created.value().playerId;

    auto alone = registry.startNewHand(code, hostId);
    assert(!alone.ok() && alone.error().code == ErrorCode::INVALID_STATE);
    assert(alone.error().message == "Need at least 2 players to start");

    const std::string guestId = registry.joinRoom(code, "Bob").value().playerId;

    auto notHost = registry.startNewHand(code, guestId);
    assert(!notHost.ok() && notHost.error().code == ErrorCode::FORBIDDEN);

    auto first = registry.startNewHand(code, hostId, 11);
    assert(first.ok());
    assert(first.value().gameStarted);
    assert(first.value().game.has_value());
    const Game& hand = *first.value().game;
    assert(hand.getHandNumber() == 1);
    assert(hand.getPlayers().size() == 2);
    assert(hand.getPlayers()[0].getId() == hostId);
    assert(hand.getPlayers()[1].getId() == guestId);
    assert(hand.getDeck().size() == 48);
    assert(hand.getSmallBlind() == 1 && hand.getBigBlind() == 2);

    assert(registry.applyAction(code, hostId, Player::Action::RAISE, 40).ok());

    // A new hand resets stacks and bets
    auto second = registry.startNewHand(code, hostId, 12);
    assert(second.ok());
    const Game& next = *second.value().game;
    assert(next.getHandNumber() == 2);
    assert(next.getPot() == 0);
    assert(next.getPlayers()[0].getChips() == 100);
    assert(next.getHistory().empty());

    std::cout << "  ✓ Hands dealt to members in join order" << std::endl;
}

void testApplyAction() {
    std::cout << "Testing actions through the registry..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable());
    const std::string code = created.value().roomCode;
    const std::string hostId = created.value().playerId;
    const std::string guestId = registry.joinRoom(code, "Bob").value().playerId;

    auto beforeHand = registry.applyAction(code, hostId, Player::Action::CALL, 0);
    assert(!beforeHand.ok() && beforeHand.error().code == ErrorCode::NOT_FOUND);
    assert(beforeHand.error().message == "Room or game not found");

    assert(registry.startNewHand(code, hostId, 5).ok());

    auto raised = registry.applyAction(code, hostId, Player::Action::RAISE, 10);
    assert(raised.ok());
    assert(raised.value().game->getPot() == 10);
    assert(raised.value().game->getCurrentPlayerIndex() == 1);

    auto outOfTurn = registry.applyAction(code, hostId, Player::Action::CALL, 0);
    assert(!outOfTurn.ok() && outOfTurn.error().code == ErrorCode::OUT_OF_TURN);

    auto called = registry.applyAction(code, guestId, Player::Action::CALL, 0);
    assert(called.ok());
    assert(called.value().game->getPot() == 20);
    assert(called.value().game->getCurrentPlayerIndex() == 0);

    auto stranger = registry.applyAction(code, "nobody", Player::Action::CALL, 0);
    assert(!stranger.ok() && stranger.error().code == ErrorCode::NOT_FOUND);

    auto noRoom = registry.applyAction("QQQQQQ", hostId, Player::Action::CALL, 0);
    assert(!noRoom.ok() && noRoom.error().code == ErrorCode::NOT_FOUND);

    std::cout << "  ✓ Actions applied in turn and errors propagated" << std::endl;
}

void testSync() {
    std::cout << "Testing sync..." << std::endl;

    RoomRegistry registry;
    auto created = registry.createRoom("Alice", smallTable());
    const std::string code = created.value().roomCode;
    const std::string hostId = created.value().playerId;
    const std::string guestId = registry.joinRoom(code, "Bob").value().playerId;
    assert(registry.startNewHand(code, hostId, 99).ok());

    auto first = registry.sync(code, guestId);
    auto second = registry.sync(code, guestId);
    assert(first.ok() && second.ok());
    assert(JsonSerializer::roomToJson(first.value()) == JsonSerializer::roomToJson(second.value()));

    auto outsider = registry.sync(code, "someone-else");
    assert(!outsider.ok() && outsider.error().code == ErrorCode::FORBIDDEN);
    assert(outsider.error().message == "Player not in room");

    // A member of another room is still an outsider here
    auto other = registry.createRoom("Zed", smallTable());
    auto crossed = registry.sync(code, other.value().playerId);
    assert(!crossed.ok() && crossed.error().code == ErrorCode::FORBIDDEN);

    auto missing = registry.sync("ABCDEF", guestId);
    assert(!missing.ok() && missing.error().code == ErrorCode::NOT_FOUND);

    std::cout << "  ✓ Sync is read-only and member-only" << std::endl;
}

void testRoomCodeCollision() {
    std::cout << "Testing room code collision retry..." << std::endl;

    auto generator = std::make_unique<ScriptedIdGenerator>(
        std::deque<std::string>{"AAAAAA", "AAAAAA", "BBBBBB"});
    RoomRegistry registry(std::move(generator));

    auto first = registry.createRoom("Alice", smallTable());
    auto second = registry.createRoom("Bob", smallTable());
    assert(first.ok() && second.ok());
    assert(first.value().roomCode == "AAAAAA");
    assert(second.value().roomCode == "BBBBBB");
    assert(registry.roomCount() == 2);

    std::cout << "  ✓ Duplicate codes are regenerated" << std::endl;
}

void testExpireRooms() {
    std::cout << "Testing room expiry..." << std::endl;

    RoomRegistry registry;
    const auto start = Room::Clock::now();
    const auto retention = std::chrono::hours(24);

    auto old = registry.createRoom("Alice", smallTable(), start);
    const std::string oldCode = old.value().roomCode;
    const std::string oldHost = old.value().playerId;
    assert(registry.joinRoom(oldCode, "Bob").ok());

    auto fresh = registry.createRoom("Carol", smallTable(), start + std::chrono::hours(10));
    assert(registry.roomCount() == 2);
    assert(registry.playerCount() == 3);

    // Exactly at the retention boundary nothing is removed
    assert(registry.expireRooms(start + retention, retention) == 0);
    assert(registry.roomCount() == 2);

    assert(registry.expireRooms(start + retention + std::chrono::seconds(1), retention) == 1);
    assert(registry.roomCount() == 1);
    assert(registry.playerCount() == 1);

    auto gone = registry.sync(oldCode, oldHost);
    assert(!gone.ok() && gone.error().code == ErrorCode::NOT_FOUND);
    auto join = registry.joinRoom(oldCode, "Dave");
    assert(!join.ok() && join.error().code == ErrorCode::NOT_FOUND);

    assert(registry.sync(fresh.value().roomCode, fresh.value().playerId).ok());

    assert(registry.expireRooms(start + std::chrono::hours(48), retention) == 1);
    assert(registry.roomCount() == 0);
    assert(registry.playerCount() == 0);

    std::cout << "  ✓ Rooms older than the retention window are removed with their players" << std::endl;
}

void testConcurrentRooms() {
    std::cout << "Testing concurrent access..." << std::endl;

    RoomRegistry registry;
    RoomSettings settings = smallTable(26);
    settings.startingChips = 1000000;

    auto created = registry.createRoom("Host", settings);
    const std::string code = created.value().roomCode;
    const std::string hostId = created.value().playerId;

    std::atomic<int> joined{0};
    std::vector<std::thread> joiners;
    for (int t = 0; t < 8; t++) {
        joiners.emplace_back([&registry, &code, &joined, t]() {
            for (int i = 0; i < 5; i++) {
                if (registry.joinRoom(code, "guest" + std::to_string(t) + "-" + std::to_string(i)).ok()) {
                    joined++;
                }
            }
        });
    }
    for (auto& thread : joiners) {
        thread.join();
    }

    // 26 seats, host included
    assert(joined == 25);
    auto view = registry.sync(code, hostId);
    assert(view.ok());
    assert(view.value().players.size() == 26);
    assert(registry.playerCount() == 26);

    assert(registry.startNewHand(code, hostId, 3).ok());

    // Every member hammers the room; only the player to act succeeds
    std::vector<std::string> memberIds;
    for (const auto& member : view.value().players) {
        memberIds.push_back(member.id);
    }

    std::atomic<int> accepted{0};
    std::vector<std::thread> actors;
    for (size_t t = 0; t < 4; t++) {
        actors.emplace_back([&registry, &code, &memberIds, &accepted, t]() {
            for (int round = 0; round < 50; round++) {
                for (size_t i = t; i < memberIds.size(); i += 4) {
                    if (registry.applyAction(code, memberIds[i], Player::Action::CALL, 0).ok()) {
                        accepted++;
                    }
                    (void)registry.sync(code, memberIds[i]);
                }
            }
        });
    }
    std::thread sweeper([&registry]() {
        for (int i = 0; i < 50; i++) {
            registry.expireRooms(Room::Clock::now(), std::chrono::hours(1));
        }
    });
    for (auto& thread : actors) {
        thread.join();
    }
    sweeper.join();

    auto after = registry.sync(code, hostId);
    assert(after.ok());
    const Game& hand = *after.value().game;
    assert(accepted.load() > 0);
    const size_t expectedHistory = std::min(static_cast<size_t>(accepted.load()), Game::MAX_HISTORY);
    assert(hand.getHistory().size() == expectedHistory);
    int bets = 0;
    for (const auto& player : hand.getPlayers()) {
        bets += player.getBet();
    }
    assert(hand.getPot() == bets);

    std::cout << "  ✓ Concurrent joins and actions stay consistent" << std::endl;
}

int main() {
    std::cout << "\n🃏 Room Registry Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    try {
        testCreateRoom();
        testCreateRoomValidation();
        testStackLimit();
        testJoinRoom();
        testJoinRefusals();
        testUpdateSettings();
        testStartNewHand();
        testApplyAction();
        testSync();
        testRoomCodeCollision();
        testExpireRooms();
        testConcurrentRooms();

        std::cout << "\n✅ All Room Registry tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with error: " << e.what() << std::endl;
        return 1;
    }
}
