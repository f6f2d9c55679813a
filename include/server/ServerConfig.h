#pragma once

#include "analysis/VoiceAnalyzer.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace VoiceGuard {
namespace Server {

/**
 * @brief Configuration for the voice analysis server
 *
 * Defaults match the stock deployment (ws://0.0.0.0:8000/ws). Values can
 * be loaded from a JSON file and then overridden from the command line.
 */
struct ServerConfig {
    static constexpr int kMaxIoThreads = 256;

    std::string host = "0.0.0.0";
    uint16_t port = 8000;               // 0 picks an ephemeral port
    std::string path = "/ws";           // WebSocket endpoint

    int ioThreads = 1;                  // Threads running the I/O service, 1..kMaxIoThreads
    size_t maxMessageSize = 16 * 1024 * 1024;

    std::string staticRoot;             // Directory served on plain GET, empty to disable
    bool quiet = false;                 // Silence per-connection access logging

    Analysis::AnalyzerConfig analyzer;

    /**
     * @brief Throw std::invalid_argument if any value is unusable
     */
    void validate() const;

    /**
     * @brief Apply keys from a JSON document, unknown keys are ignored
     * @throws std::invalid_argument on wrongly typed or out-of-range values
     */
    void applyJson(const std::string& document);

    /**
     * @brief Load defaults overlaid with a JSON config file
     * @throws std::runtime_error if the file cannot be read
     */
    static ServerConfig loadFromFile(const std::string& path);

    /**
     * @brief Build a validated config from command-line flags
     *
     * A --config file is applied first wherever it appears, then the
     * remaining flags override it. argv[0] is skipped.
     * @throws std::invalid_argument on unknown flags, missing or malformed values
     * @throws std::runtime_error if the config file cannot be read
     */
    static ServerConfig fromArgs(int argc, const char* const argv[]);

    /**
     * @brief Effective configuration as JSON (for startup logging)
     */
    std::string toJson() const;
};

} // namespace Server
} // namespace VoiceGuard
