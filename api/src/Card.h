#ifndef CARD_H
#define CARD_H

#include <string>

/**
 * Represents a single playing card with rank and suit.
 */
class Card {
public:
    enum class Rank {
        TWO = 2, THREE, FOUR, FIVE, SIX, SEVEN, EIGHT, NINE, TEN,
        JACK, QUEEN, KING, ACE
    };

    // Declaration order is the canonical deck order
    enum class Suit {
        HEARTS = 0, DIAMONDS, CLUBS, SPADES
    };

    static constexpr int SUIT_COUNT = 4;
    static constexpr int RANK_COUNT = 13;

private:
    Rank rank;
    Suit suit;

public:
    Card() : rank(Rank::TWO), suit(Suit::HEARTS) {}

    Card(Rank r, Suit s) : rank(r), suit(s) {}

    Rank getRank() const noexcept { return rank; }
    Suit getSuit() const noexcept { return suit; }

    int getRankValue() const noexcept { return static_cast<int>(rank); }
    int getSuitValue() const noexcept { return static_cast<int>(suit); }

    /**
     * Returns string representation like "AS" or "TH"
     */
    std::string toString() const;

    /**
     * Returns the rank as shown to players: "2".."10", "J", "Q", "K", "A"
     */
    std::string getRankName() const;

    /**
     * Returns the lower-case suit name: "hearts", "diamonds", "clubs", "spades"
     */
    std::string getSuitName() const;

    bool operator==(const Card& other) const noexcept {
        return rank == other.rank && suit == other.suit;
    }

    bool operator!=(const Card& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Card& other) const noexcept {
        if (suit != other.suit) {
            return suit < other.suit;
        }
        return rank < other.rank;
    }
};

#endif // CARD_H
