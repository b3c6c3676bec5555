#ifndef GAME_H
#define GAME_H

#include "Card.h"
#include "Deck.h"
#include "Player.h"
#include "Result.h"
#include <limits>
#include <vector>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * State of one hand at a table: seats, pot and turn pointer.
 * Only betting mechanics are modelled; the hand never leaves preflop.
 */
class Game {
public:
    // Two-card hands a single deck can serve
    static constexpr int MAX_SEATS = static_cast<int>(Deck::FULL_SIZE / 2);

    // Largest stack for which a full table's chips still fit in an int
    static constexpr int MAX_STARTING_CHIPS = std::numeric_limits<int>::max() / MAX_SEATS;

    // Events kept per hand; older ones are dropped first
    static constexpr size_t MAX_HISTORY = 200;

    enum class Phase {
        PREFLOP,
        FLOP,
        TURN,
        RIVER
    };

    /**
     * Outcome of turn advancement after an accepted action
     */
    enum class TurnStatus {
        NEXT_PLAYER,        // Pointer moved to a seat that can act
        NO_ELIGIBLE_ACTOR   // Everyone is folded or all-in
    };

    struct GameConfig {
        int smallBlind;
        int bigBlind;
        int startingChips;
        unsigned int seed; // 0 means random seed

        GameConfig()
            : smallBlind(10), bigBlind(20), startingChips(1000), seed(0) {}
    };

private:
    std::vector<Player> players;
    int pot;
    int currentBet;
    int currentPlayerIndex;
    Phase phase;
    std::vector<Card> communityCards;
    std::vector<Card> deck;
    int smallBlind;
    int bigBlind;
    int handNumber;
    bool handComplete;
    std::vector<json> history;

public:
    /**
     * Starts a hand: shuffles a fresh deck and deals two cards to each id in seat order.
     * Blinds are recorded but not posted; seat 0 acts first.
     * Throws std::invalid_argument for an empty seat list, more seats than the deck can serve,
     * or a starting stack outside [1, MAX_STARTING_CHIPS].
     */
    Game(const GameConfig& cfg, const std::vector<std::string>& playerIds, int handNumber = 1);

    // Getters
    const std::vector<Player>& getPlayers() const noexcept { return players; }
    int getPot() const noexcept { return pot; }
    int getCurrentBet() const noexcept { return currentBet; }
    int getCurrentPlayerIndex() const noexcept { return currentPlayerIndex; }
    Phase getPhase() const noexcept { return phase; }
    const std::vector<Card>& getCommunityCards() const noexcept { return communityCards; }
    const std::vector<Card>& getDeck() const noexcept { return deck; }
    int getSmallBlind() const noexcept { return smallBlind; }
    int getBigBlind() const noexcept { return bigBlind; }
    int getHandNumber() const noexcept { return handNumber; }
    bool isHandComplete() const noexcept { return handComplete; }
    [[nodiscard]] const std::vector<json>& getHistory() const noexcept { return history; }

    /**
     * Gets player by ID
     * @return Non-owning pointer to player, or nullptr if not found
     */
    [[nodiscard]] const Player* getPlayer(std::string_view id) const;

    /**
     * Gets current player whose turn it is
     */
    [[nodiscard]] const Player& getCurrentPlayer() const { return players[currentPlayerIndex]; }

    /**
     * Processes a player action.
     * Every precondition is checked before anything is mutated, so a failure leaves the hand untouched.
     * @param amount New total bet for RAISE, ignored otherwise
     */
    [[nodiscard]] Result<TurnStatus> processAction(std::string_view playerId, Player::Action action, int amount = 0);

    /**
     * Gets phase name as string
     */
    std::string getPhaseName() const;

private:
    /**
     * Resolves a player id to its seat, or -1
     */
    int findSeat(std::string_view id) const;

    /**
     * Advances to next player who can act, scanning at most one full cycle
     */
    TurnStatus advanceToNextPlayer();

    /**
     * Adds an event to the history, dropping the oldest beyond MAX_HISTORY
     */
    void recordEvent(const json& event);
};

#endif // GAME_H
