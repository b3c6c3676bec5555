#include "Player.h"
#include <algorithm>

Player::Player(std::string_view playerId, int startingChips, const HoleCards& cards, int seat)
    : id(playerId), chips(startingChips), bet(0), folded(false), allIn(false),
      holeCards(cards), position(seat) {}

void Player::fold() {
    folded = true;
}

int Player::call(int currentBet) {
    return commit(std::max(0, std::min(currentBet - bet, chips)));
}

int Player::raise(int totalAmount) {
    return commit(std::min(totalAmount - bet, chips));
}

int Player::goAllIn() {
    int amount = chips;
    bet += chips;
    chips = 0;
    allIn = true;
    return amount;
}

int Player::commit(int amount) {
    chips -= amount;
    bet += amount;

    if (chips == 0) {
        allIn = true;
    }

    return amount;
}
