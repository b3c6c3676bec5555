#include "Game.h"
#include "JsonSerializer.h"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>

Game::Game(const GameConfig& cfg, const std::vector<std::string>& playerIds, int number)
    : pot(0), currentBet(0), currentPlayerIndex(0), phase(Phase::PREFLOP),
      smallBlind(cfg.smallBlind), bigBlind(cfg.bigBlind), handNumber(number),
      handComplete(false) {

    if (playerIds.empty()) {
        throw std::invalid_argument("Cannot start a hand without players");
    }

    if (cfg.startingChips <= 0 || cfg.startingChips > MAX_STARTING_CHIPS) {
        throw std::invalid_argument("Starting chips must be between 1 and " +
                                    std::to_string(MAX_STARTING_CHIPS));
    }

    unsigned int seed = cfg.seed;
    if (seed == 0) {
        seed = std::random_device{}();
    }

    Deck shuffled(seed);
    shuffled.shuffle();

    // Throws if there are more seats than two-card hands in the deck
    std::vector<HoleCards> hands = shuffled.dealHands(playerIds.size());

    players.reserve(playerIds.size());
    for (size_t i = 0; i < playerIds.size(); i++) {
        players.emplace_back(playerIds[i], cfg.startingChips, hands[i], static_cast<int>(i));
    }

    deck = shuffled.getCards();
}

void Game::recordEvent(const json& event) {
    if (history.size() >= MAX_HISTORY) {
        history.erase(history.begin());
    }
    history.push_back(event);
}

int Game::findSeat(std::string_view id) const {
    auto it = std::find_if(players.begin(), players.end(),
        [id](const Player& p) { return p.getId() == id; });
    return (it != players.end()) ? static_cast<int>(it - players.begin()) : -1;
}

const Player* Game::getPlayer(std::string_view id) const {
    int seat = findSeat(id);
    return (seat >= 0) ? &players[seat] : nullptr;
}

Result<Game::TurnStatus> Game::processAction(std::string_view playerId, Player::Action action, int amount) {
    const int seat = findSeat(playerId);
    if (seat < 0) {
        return Result<TurnStatus>::failure(ErrorCode::NOT_FOUND, "Player not found");
    }

    if (seat != currentPlayerIndex) {
        return Result<TurnStatus>::failure(ErrorCode::OUT_OF_TURN, "Not your turn");
    }

    Player& player = players[seat];
    if (!player.canAct()) {
        return Result<TurnStatus>::failure(ErrorCode::ILLEGAL_ACTION, "Player cannot act");
    }

    int moved = 0;

    switch (action) {
        case Player::Action::FOLD:
            player.fold();
            break;

        case Player::Action::CALL:
            moved = player.call(currentBet);
            pot += moved;
            break;

        case Player::Action::RAISE:
            if (amount <= currentBet) {
                return Result<TurnStatus>::failure(ErrorCode::INVALID_AMOUNT, "Raise amount too small");
            }
            moved = player.raise(amount);
            pot += moved;
            currentBet = player.getBet();
            break;

        case Player::Action::ALL_IN:
            moved = player.goAllIn();
            pot += moved;
            if (player.getBet() > currentBet) {
                currentBet = player.getBet();
            }
            break;

        default:
            return Result<TurnStatus>::failure(ErrorCode::INVALID_ACTION, "Invalid action");
    }

    recordEvent({
        {"type", "playerAction"},
        {"playerId", std::string(playerId)},
        {"action", JsonSerializer::actionToString(action)},
        {"amount", moved}
    });

    return Result<TurnStatus>::success(advanceToNextPlayer());
}

std::string Game::getPhaseName() const {
    static constexpr const char* const phaseNames[] = {
        "preflop", "flop", "turn", "river"
    };
    static constexpr size_t nameCount = sizeof(phaseNames) / sizeof(phaseNames[0]);

    const auto idx = static_cast<size_t>(phase);
    if (idx < nameCount) {
        return phaseNames[idx];
    }
    return "unknown";
}

Game::TurnStatus Game::advanceToNextPlayer() {
    const int seatCount = static_cast<int>(players.size());
    int candidate = currentPlayerIndex;

    // The last step of the cycle lands back on the acting seat
    for (int step = 0; step < seatCount; step++) {
        candidate = (candidate + 1) % seatCount;

        if (players[candidate].canAct()) {
            currentPlayerIndex = candidate;
            return TurnStatus::NEXT_PLAYER;
        }
    }

    handComplete = true;
    return TurnStatus::NO_ELIGIBLE_ACTOR;
}
