#include "HTTPServer.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iostream>
#include <sstream>
#include <string_view>
#include <cstring>
#include <thread>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr size_t maxRequestBytes = 1 << 20;

/**
 * Value of Content-Length in the header block, or 0
 */
size_t contentLength(const std::string& headers) {
    std::string lowered(headers);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static constexpr std::string_view key = "content-length:";
    size_t clPos = lowered.find(key);
    if (clPos == std::string::npos) {
        return 0;
    }
    size_t clEnd = lowered.find("\r\n", clPos);
    std::string value = lowered.substr(clPos + key.size(), clEnd - clPos - key.size());
    try {
        return static_cast<size_t>(std::stoul(value));
    } catch (const std::exception&) {
        return 0;
    }
}

}

HTTPServer::HTTPServer(RoomRegistry& rooms, int p, int maxConn)
    : serverSocket(-1), port(p), maxConnections(maxConn), activeConnections(0), roomAPI(rooms) {}

HTTPServer::~HTTPServer() {
    if (serverSocket >= 0) {
        close(serverSocket);
    }
}

bool HTTPServer::start() {
    serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket < 0) {
        std::cerr << "Error creating socket" << std::endl;
        return false;
    }

    int opt = 1;
    if (setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "Error setting socket options" << std::endl;
        return false;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);

    if (bind(serverSocket, (struct sockaddr*)&address, sizeof(address)) < 0) {
        std::cerr << "Error binding socket to port " << port << std::endl;
        close(serverSocket);
        serverSocket = -1;
        return false;
    }

    if (listen(serverSocket, 64) < 0) {
        std::cerr << "Error listening on socket" << std::endl;
        close(serverSocket);
        serverSocket = -1;
        return false;
    }

    socklen_t boundLen = sizeof(address);
    if (getsockname(serverSocket, (struct sockaddr*)&address, &boundLen) == 0) {
        port = ntohs(address.sin_port);
    }

    std::cout << "🚀 Poker room server running on http://localhost:" << port << std::endl;
    std::cout << "Health check: http://localhost:" << port << "/api/health" << std::endl;

    return true;
}

void HTTPServer::handleRequests() {
    while (true) {
        struct sockaddr_in clientAddress;
        socklen_t clientLen = sizeof(clientAddress);

        int clientSocket = accept(serverSocket, (struct sockaddr*)&clientAddress, &clientLen);
        if (clientSocket < 0) {
            std::cerr << "Error accepting connection: " << std::strerror(errno) << std::endl;
            continue;
        }

        if (activeConnections.load() >= maxConnections) {
            json errorResponse = {{"error", "Server busy"}};
            if (!writeResponse(clientSocket, createResponse(503, errorResponse.dump()))) {
                std::cerr << "Error writing response: " << std::strerror(errno) << std::endl;
            }
            close(clientSocket);
            continue;
        }

        // Rooms lock independently, so connections can run side by side
        activeConnections++;
        std::thread(&HTTPServer::serveConnection, this, clientSocket).detach();
    }
}

void HTTPServer::serveConnection(int clientSocket) {
    std::string request = readRequest(clientSocket);

    if (!request.empty()) {
        std::string response = processRequest(request);
        if (!writeResponse(clientSocket, response)) {
            std::cerr << "Error writing response: " << std::strerror(errno) << std::endl;
        }
    }

    close(clientSocket);
    activeConnections--;
}

std::string HTTPServer::readRequest(int clientSocket) {
    std::string request;
    char buffer[16384];
    ssize_t bytesRead;

    while ((bytesRead = read(clientSocket, buffer, sizeof(buffer))) > 0) {
        request.append(buffer, bytesRead);

        size_t headerEnd = request.find("\r\n\r\n");
        if (headerEnd != std::string::npos) {
            // Check Content-Length to see if we need to read more
            size_t bodyLength = contentLength(request.substr(0, headerEnd));
            if (request.length() >= headerEnd + 4 + bodyLength) {
                break;
            }
        }

        if (request.length() > maxRequestBytes) {
            std::cerr << "Request too large, dropping connection" << std::endl;
            return "";
        }
    }

    return request;
}

bool HTTPServer::writeResponse(int clientSocket, const std::string& response) {
    size_t written = 0;
    while (written < response.length()) {
        ssize_t n = send(clientSocket, response.data() + written, response.length() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::string HTTPServer::processRequest(const std::string& request) {
    // Request line: METHOD SP TARGET SP VERSION
    size_t lineEnd = request.find("\r\n");
    std::istringstream requestLine(request.substr(0, lineEnd));
    std::string method;
    std::string target;
    requestLine >> method >> target;

    if (method.empty() || target.empty()) {
        json errorResponse = {{"error", "Malformed request line"}};
        return createResponse(400, errorResponse.dump());
    }

    // Handle OPTIONS for CORS
    if (method == "OPTIONS") {
        return createResponse(200, "");
    }

    try {
        json requestData = nullptr;

        if (method == "POST") {
            std::string body = extractBody(request);

            if (body.empty()) {
                json errorResponse = {{"error", "Empty request body"}};
                return createResponse(400, errorResponse.dump());
            }

            requestData = json::parse(body);
        }

        ApiResponse response = roomAPI.processRequest(method, target, requestData);
        return createResponse(response.status, response.body.dump());

    } catch (const json::exception& e) {
        json errorResponse = {
            {"error", "Invalid JSON"},
            {"details", e.what()}
        };
        return createResponse(400, errorResponse.dump());
    } catch (const std::exception& e) {
        std::cerr << "[http] " << method << " " << target << " failed: " << e.what() << std::endl;
        json errorResponse = {{"error", "Internal server error"}};
        return createResponse(httpStatus(ErrorCode::INTERNAL), errorResponse.dump());
    }
}

std::string HTTPServer::extractBody(const std::string& request) {
    size_t bodyPos = request.find("\r\n\r\n");
    if (bodyPos != std::string::npos) {
        return request.substr(bodyPos + 4);
    }
    return "";
}

std::string HTTPServer::createResponse(int statusCode, const std::string& body,
                                       const std::string& contentType) {
    std::ostringstream response;

    std::string statusText = (statusCode == 200) ? "OK" :
                            (statusCode == 400) ? "Bad Request" :
                            (statusCode == 403) ? "Forbidden" :
                            (statusCode == 404) ? "Not Found" :
                            (statusCode == 500) ? "Internal Server Error" :
                            (statusCode == 503) ? "Service Unavailable" : "Error";

    response << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    response << "Content-Type: " << contentType << "\r\n";
    response << "Content-Length: " << body.length() << "\r\n";
    response << "Access-Control-Allow-Origin: *\r\n";
    response << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
    response << "Access-Control-Allow-Headers: Content-Type\r\n";
    response << "Connection: close\r\n";
    response << "\r\n";
    response << body;

    return response.str();
}
