#include "Deck.h"
#include <string>
#include <utility>

Deck::Deck() : rng(std::random_device{}()) {
    reset();
}

Deck::Deck(unsigned int seed) : rng(seed) {
    reset();
}

void Deck::reset() {
    cards.clear();
    cards.reserve(FULL_SIZE);

    static constexpr int minRank = 2;
    static constexpr int maxRank = 14;

    for (int s = 0; s < Card::SUIT_COUNT; s++) {
        const Card::Suit suit = static_cast<Card::Suit>(s);
        for (int r = minRank; r <= maxRank; r++) {
            const Card::Rank rank = static_cast<Card::Rank>(r);
            cards.emplace_back(rank, suit);
        }
    }
}

void Deck::shuffle() {
    if (cards.size() < 2) {
        return;
    }

    // Each step draws from the inclusive range [0, i]
    for (size_t i = cards.size() - 1; i > 0; i--) {
        std::uniform_int_distribution<size_t> pick(0, i);
        std::swap(cards[i], cards[pick(rng)]);
    }
}

void Deck::shuffle(unsigned int seed) {
    rng.seed(seed);
    shuffle();
}

std::vector<HoleCards> Deck::dealHands(size_t playerCount) {
    if (cards.size() < playerCount * 2) {
        throw std::invalid_argument("Cannot deal " + std::to_string(playerCount) +
                                    " hands from " + std::to_string(cards.size()) + " cards");
    }

    std::vector<HoleCards> hands;
    hands.reserve(playerCount);

    for (size_t i = 0; i < playerCount; i++) {
        HoleCards hand;
        hand[0] = cards.back();
        cards.pop_back();
        hand[1] = cards.back();
        cards.pop_back();
        hands.push_back(hand);
    }

    return hands;
}
