#pragma once

#include <map>
#include <string>

namespace VoiceGuard {
namespace Server {

struct HttpResponse {
    int status = 200;
    std::string body;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Plain HTTP routes served next to the WebSocket endpoint
 *
 * - GET /            index.html from the static root, else a JSON banner
 * - GET /health      liveness with active connection count
 * - GET|POST /api/analyze   points clients at the WebSocket
 * - GET /api/test    API smoke check
 * - GET /<file>      static file from the static root
 *
 * All responses allow any origin.
 */
class HttpRoutes {
public:
    explicit HttpRoutes(std::string staticRoot = "");

    HttpResponse handle(const std::string& method,
                        const std::string& resource,
                        size_t activeConnections) const;

    /**
     * @brief MIME type for a file name, application/octet-stream if unknown
     */
    static std::string contentTypeFor(const std::string& filename);

private:
    HttpResponse jsonResponse(int status, const std::string& body) const;
    bool serveStatic(const std::string& relativePath, HttpResponse& response) const;

    std::string staticRoot_;
};

} // namespace Server
} // namespace VoiceGuard
