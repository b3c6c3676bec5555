#include "ServerConfig.h"
#include <cstdlib>
#include <stdexcept>

namespace {

/**
 * Parses a whole string as a positive integer no larger than `max`
 */
bool parsePositive(const std::string& text, long long max, long long& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value <= 0 || value > max) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}

Result<ServerConfig> ServerConfig::load(int argc, const char* const argv[], const EnvLookup& env) {
    EnvLookup lookup = env ? env : EnvLookup([](const char* name) -> const char* { return std::getenv(name); });

    static constexpr long long maxPort = 65535;
    static constexpr long long maxSeconds = 10LL * 365 * 24 * 60 * 60;

    ServerConfig config;
    long long value = 0;

    if (const char* port = lookup("PORT")) {
        if (!parsePositive(port, maxPort, value)) {
            return Result<ServerConfig>::failure(ErrorCode::VALIDATION, "Invalid PORT: " + std::string(port));
        }
        config.port = static_cast<int>(value);
    }

    if (const char* interval = lookup("CHIPME_SWEEP_INTERVAL_SECONDS")) {
        if (!parsePositive(interval, maxSeconds, value)) {
            return Result<ServerConfig>::failure(ErrorCode::VALIDATION,
                "Invalid CHIPME_SWEEP_INTERVAL_SECONDS: " + std::string(interval));
        }
        config.sweepInterval = std::chrono::seconds(value);
    }

    if (const char* retention = lookup("CHIPME_ROOM_RETENTION_SECONDS")) {
        if (!parsePositive(retention, maxSeconds, value)) {
            return Result<ServerConfig>::failure(ErrorCode::VALIDATION,
                "Invalid CHIPME_ROOM_RETENTION_SECONDS: " + std::string(retention));
        }
        config.roomRetention = std::chrono::seconds(value);
    }

    if (argc > 1) {
        if (!parsePositive(argv[1], maxPort, value)) {
            return Result<ServerConfig>::failure(ErrorCode::VALIDATION, "Invalid port: " + std::string(argv[1]));
        }
        config.port = static_cast<int>(value);
    }

    return Result<ServerConfig>::success(config);
}
