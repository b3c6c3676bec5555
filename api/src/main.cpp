#include <iostream>
#include "HTTPServer.h"
#include "RoomRegistry.h"
#include "RoomSweeper.h"
#include "ServerConfig.h"

/**
 * Poker Room Server - Entry Point
 *
 * Hosts rooms in memory and expires them after the retention window.
 * Usage: ./chipme_server [port]
 * Default port: 3001 (or $PORT)
 */
int main(int argc, char* argv[]) {
    Result<ServerConfig> loaded = ServerConfig::load(argc, argv);
    if (!loaded.ok()) {
        std::cerr << loaded.error().message << std::endl;
        std::cerr << "Usage: " << argv[0] << " [port]" << std::endl;
        return 1;
    }
    const ServerConfig& config = loaded.value();

    RoomRegistry registry;

    RoomSweeper sweeper(registry, config.sweepInterval, config.roomRetention);
    sweeper.start();

    HTTPServer server(registry, config.port);

    if (!server.start()) {
        return 1;
    }

    server.handleRequests();

    return 0;
}
