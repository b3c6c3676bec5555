#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <atomic>
#include <string>
#include "RoomAPI.h"
#include "RoomRegistry.h"

/**
 * HTTPServer - Simple HTTP server for the room API
 *
 * Handles HTTP requests and routes them to the RoomAPI.
 * Each connection is served on its own thread; the registry does the locking.
 * Supports CORS for cross-origin requests
 */
class HTTPServer {
public:
    static constexpr int DEFAULT_MAX_CONNECTIONS = 256;

    /**
     * Constructor
     * @param rooms Registry shared with the expiry sweeper
     * @param port The port to listen on, 0 for any free port
     * @param maxConnections Connections served at once; extra clients get 503
     */
    HTTPServer(RoomRegistry& rooms, int port, int maxConnections = DEFAULT_MAX_CONNECTIONS);

    /**
     * Destructor - cleans up socket resources
     */
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    /**
     * Start the HTTP server
     * @return true if server started successfully, false otherwise
     */
    bool start();

    /**
     * Port actually bound, valid after start()
     */
    int getPort() const noexcept { return port; }

    /**
     * Handle incoming requests (blocking call)
     */
    void handleRequests();

    /**
     * Process a single HTTP request
     * @param request The raw HTTP request string
     * @return The HTTP response string
     */
    [[nodiscard]] std::string processRequest(const std::string& request);

private:
    int serverSocket;
    int port;
    int maxConnections;
    std::atomic<int> activeConnections;
    RoomAPI roomAPI;

    /**
     * Reads one request from a connected socket, honouring Content-Length
     */
    static std::string readRequest(int clientSocket);

    /**
     * Writes the whole response, retrying short writes
     */
    static bool writeResponse(int clientSocket, const std::string& response);

    /**
     * Serves one connection, closes it and releases its slot
     */
    void serveConnection(int clientSocket);

    /**
     * Extract the body from an HTTP request
     */
    static std::string extractBody(const std::string& request);

    /**
     * Create an HTTP response
     */
    static std::string createResponse(int statusCode, const std::string& body,
                                      const std::string& contentType = "application/json");
};

#endif // HTTP_SERVER_H
