#include "IdGenerator.h"

RandomIdGenerator::RandomIdGenerator() : rng(std::random_device{}()) {}

RandomIdGenerator::RandomIdGenerator(unsigned long long seed) : rng(seed) {}

std::string RandomIdGenerator::newRoomCode() {
    static constexpr const char alphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    static constexpr size_t codeLength = 6;

    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::lock_guard<std::mutex> lock(rngMutex);
    std::string code;
    code.reserve(codeLength);
    for (size_t i = 0; i < codeLength; i++) {
        code += alphabet[pick(rng)];
    }
    return code;
}

std::string RandomIdGenerator::newPlayerId() {
    static constexpr const char hexDigits[] = "0123456789abcdef";

    std::uniform_int_distribution<int> nibble(0, 15);

    std::lock_guard<std::mutex> lock(rngMutex);
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; i++) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id += '-';
        }
        int value = nibble(rng);
        if (i == 12) {
            value = 4;                    // version
        } else if (i == 16) {
            value = 8 | (value & 0x3);    // variant 10xx
        }
        id += hexDigits[value];
    }
    return id;
}
