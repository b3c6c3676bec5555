#ifndef DECK_H
#define DECK_H

#include "Card.h"
#include <array>
#include <vector>
#include <random>
#include <stdexcept>

/**
 * Two private cards dealt to one player.
 */
using HoleCards = std::array<Card, 2>;

/**
 * Represents a standard 52-card deck with shuffle and deal operations.
 */
class Deck {
public:
    static constexpr size_t FULL_SIZE = Card::SUIT_COUNT * Card::RANK_COUNT;

private:
    std::vector<Card> cards;
    std::mt19937 rng;

public:
    /**
     * Unshuffled deck with a randomly seeded generator
     */
    Deck();

    /**
     * Constructor with seed for deterministic shuffles
     */
    explicit Deck(unsigned int seed);

    /**
     * Resets the deck to a full 52-card deck in canonical order
     * (hearts, diamonds, clubs, spades; 2 through ace within a suit)
     */
    void reset();

    /**
     * Shuffles the remaining cards using Fisher-Yates
     */
    void shuffle();

    /**
     * Shuffles with a specific seed
     */
    void shuffle(unsigned int seed);

    /**
     * Deals one pair per player from the end of the deck, in player order.
     * Throws std::invalid_argument if fewer than 2 * playerCount cards remain.
     */
    [[nodiscard]] std::vector<HoleCards> dealHands(size_t playerCount);

    /**
     * Cards still in the deck, bottom first
     */
    const std::vector<Card>& getCards() const noexcept { return cards; }

    size_t cardsRemaining() const noexcept {
        return cards.size();
    }
};

#endif // DECK_H
