#ifndef SERVER_CONFIG_H
#define SERVER_CONFIG_H

#include "Result.h"
#include <chrono>
#include <functional>
#include <string>

/**
 * Process-level settings for the room server.
 *
 * Sources, later ones winning:
 *   defaults -> PORT, CHIPME_SWEEP_INTERVAL_SECONDS, CHIPME_ROOM_RETENTION_SECONDS -> argv[1] (port)
 */
struct ServerConfig {
    using EnvLookup = std::function<const char*(const char*)>;

    int port;
    std::chrono::seconds sweepInterval;
    std::chrono::seconds roomRetention;

    ServerConfig()
        : port(3001), sweepInterval(std::chrono::hours(1)), roomRetention(std::chrono::hours(24)) {}

    /**
     * Builds the configuration, rejecting values that are not positive integers
     * @param env Environment lookup, std::getenv when empty
     */
    [[nodiscard]] static Result<ServerConfig> load(int argc, const char* const argv[], const EnvLookup& env = {});
};

#endif // SERVER_CONFIG_H
