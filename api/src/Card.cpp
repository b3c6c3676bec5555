#include "Card.h"

std::string Card::toString() const {
    static constexpr const char rankChars[] = "??23456789TJQKA";
    static constexpr const char suitChars[] = "HDCS";

    std::string result;
    result.reserve(2);
    result += rankChars[static_cast<int>(rank)];
    result += suitChars[static_cast<int>(suit)];

    return result;
}

std::string Card::getRankName() const {
    static constexpr const char* const rankNames[] = {
        "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"
    };
    return rankNames[static_cast<int>(rank) - static_cast<int>(Rank::TWO)];
}

std::string Card::getSuitName() const {
    static constexpr const char* const suitNames[] = {
        "hearts", "diamonds", "clubs", "spades"
    };
    return suitNames[static_cast<int>(suit)];
}
