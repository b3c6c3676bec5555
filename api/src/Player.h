#ifndef PLAYER_H
#define PLAYER_H

#include "Card.h"
#include "Deck.h"
#include <string>
#include <string_view>

/**
 * A seat in the current hand: chip stack, bet this round and hole cards.
 * Recreated for every hand; joined to the room member by id.
 */
class Player {
public:
    enum class Action {
        NONE,
        FOLD,
        CALL,
        RAISE,
        ALL_IN
    };

private:
    std::string id;
    int chips;
    int bet;              // Current bet in this round
    bool folded;
    bool allIn;
    HoleCards holeCards;
    int position;         // Seat position (0-indexed)

public:
    Player(std::string_view playerId, int startingChips, const HoleCards& cards, int seat);

    // Getters
    const std::string& getId() const noexcept { return id; }
    int getChips() const noexcept { return chips; }
    int getBet() const noexcept { return bet; }
    bool isFolded() const noexcept { return folded; }
    bool isAllIn() const noexcept { return allIn; }
    const HoleCards& getHoleCards() const noexcept { return holeCards; }
    int getPosition() const noexcept { return position; }

    /**
     * Performs a fold action
     */
    void fold();

    /**
     * Calls up to the current bet, capped by the stack
     * @return Chips moved into the pot (0 means a check)
     */
    int call(int currentBet);

    /**
     * Raises to a total bet amount for the round, capped by the stack
     * @return Chips moved into the pot
     */
    int raise(int totalAmount);

    /**
     * Commits every remaining chip
     * @return Chips moved into the pot
     */
    int goAllIn();

    /**
     * Checks if player can still act this hand
     */
    [[nodiscard]] bool canAct() const noexcept { return !folded && !allIn; }

private:
    /**
     * Moves chips from the stack to the bet, marking all-in on an empty stack
     */
    int commit(int amount);
};

#endif // PLAYER_H
