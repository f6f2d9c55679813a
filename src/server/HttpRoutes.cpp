#include "server/HttpRoutes.h"
#include "utils/Time.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace VoiceGuard {
namespace Server {

HttpRoutes::HttpRoutes(std::string staticRoot)
    : staticRoot_(std::move(staticRoot)) {
}

HttpResponse HttpRoutes::handle(const std::string& method,
                                const std::string& resource,
                                size_t activeConnections) const {
    // Query string is irrelevant to every route
    std::string path = resource.substr(0, resource.find('?'));
    if (path.empty()) {
        path = "/";
    }

    if (method == "OPTIONS") {
        HttpResponse preflight;
        preflight.status = 204;
        preflight.headers["Access-Control-Allow-Origin"] = "*";
        preflight.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
        preflight.headers["Access-Control-Allow-Headers"] = "*";
        return preflight;
    }

    if (path == "/api/analyze" && (method == "GET" || method == "POST")) {
        return jsonResponse(200, nlohmann::json{
            {"message", "Use WebSocket for real-time analysis"}
        }.dump());
    }

    if (method != "GET") {
        return jsonResponse(405, nlohmann::json{{"error", "Method not allowed"}}.dump());
    }

    if (path == "/health") {
        return jsonResponse(200, nlohmann::json{
            {"status", "healthy"},
            {"timestamp", Utils::isoTimestamp()},
            {"active_connections", activeConnections}
        }.dump());
    }

    if (path == "/api/test") {
        return jsonResponse(200, nlohmann::json{{"message", "API is working"}}.dump());
    }

    HttpResponse file;
    if (path == "/") {
        if (serveStatic("index.html", file)) {
            return file;
        }
        return jsonResponse(200, nlohmann::json{
            {"message", "Voice Fraud Detection API"},
            {"status", "running"}
        }.dump());
    }

    if (serveStatic(path.substr(1), file)) {
        return file;
    }

    return jsonResponse(404, nlohmann::json{{"error", "Not found"}}.dump());
}

HttpResponse HttpRoutes::jsonResponse(int status, const std::string& body) const {
    HttpResponse response;
    response.status = status;
    response.body = body;
    response.headers["Content-Type"] = "application/json";
    response.headers["Access-Control-Allow-Origin"] = "*";
    return response;
}

bool HttpRoutes::serveStatic(const std::string& relativePath, HttpResponse& response) const {
    if (staticRoot_.empty() || relativePath.empty()) {
        return false;
    }

    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::path(staticRoot_), ec);
    if (ec) {
        return false;
    }
    if (root.filename().empty()) {
        root = root.parent_path();
    }

    fs::path target = fs::weakly_canonical(root / fs::path(relativePath).relative_path(), ec);
    if (ec) {
        return false;
    }

    // Reject anything that resolves outside the root (../, symlinks)
    auto rootIt = root.begin();
    auto targetIt = target.begin();
    for (; rootIt != root.end(); ++rootIt, ++targetIt) {
        if (targetIt == target.end() || *rootIt != *targetIt) {
            return false;
        }
    }

    if (fs::is_directory(target, ec)) {
        target /= "index.html";
    }
    if (!fs::is_regular_file(target, ec)) {
        return false;
    }

    std::ifstream in(target, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    response.status = 200;
    response.body = contents.str();
    response.headers["Content-Type"] = contentTypeFor(target.filename().string());
    response.headers["Access-Control-Allow-Origin"] = "*";
    return true;
}

std::string HttpRoutes::contentTypeFor(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, std::string> kTypes = {
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".js", "application/javascript"},
        {".css", "text/css"},
        {".json", "application/json"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".svg", "image/svg+xml"},
        {".ico", "image/x-icon"},
        {".wav", "audio/wav"},
        {".txt", "text/plain; charset=utf-8"}
    };

    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "application/octet-stream";
}

} // namespace Server
} // namespace VoiceGuard
