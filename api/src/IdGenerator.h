#ifndef ID_GENERATOR_H
#define ID_GENERATOR_H

#include <mutex>
#include <random>
#include <string>

/**
 * Source of room codes and player ids. The registry retries on room code
 * collisions, so implementations only need to be unlikely to repeat.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /**
     * Six upper-case base-36 characters, e.g. "K3X9QZ"
     */
    virtual std::string newRoomCode() = 0;

    /**
     * Opaque unique token
     */
    virtual std::string newPlayerId() = 0;
};

/**
 * Random codes and RFC 4122 version 4 UUIDs from a Mersenne Twister
 */
class RandomIdGenerator : public IdGenerator {
private:
    std::mt19937_64 rng;
    std::mutex rngMutex;

public:
    RandomIdGenerator();
    explicit RandomIdGenerator(unsigned long long seed);

    std::string newRoomCode() override;
    std::string newPlayerId() override;
};

#endif // ID_GENERATOR_H
