#include "server/ServerConfig.h"
#include "server/VoiceServer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#ifndef VOICEGUARD_VERSION
#define VOICEGUARD_VERSION "1.0.0"
#endif

namespace {

std::atomic<bool> g_shutdownRequested{false};

void handleSignal(int) {
    g_shutdownRequested = true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE       Load settings from a JSON file\n";
    std::cout << "  --host HOST         Address to bind (default 0.0.0.0)\n";
    std::cout << "  --port N            Port to bind, 0 for any (default 8000)\n";
    std::cout << "  --path PATH         WebSocket endpoint (default /ws)\n";
    std::cout << "  --static-root DIR   Serve dashboard files from DIR\n";
    std::cout << "  --threads N         I/O threads (default 1)\n";
    std::cout << "  --seed N            Fixed seed for the analyzer jitter\n";
    std::cout << "  --quiet             Do not log connections\n";
    std::cout << "  --version           Show version\n";
    std::cout << "  --help              Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using VoiceGuard::Server::ServerConfig;
    using VoiceGuard::Server::VoiceServer;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "VoiceGuard server version " << VOICEGUARD_VERSION << "\n";
            return 0;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    ServerConfig config;
    try {
        config = ServerConfig::fromArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[Main] " << e.what() << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage\n";
        return 1;
    }

    std::cout << "VoiceGuard v" << VOICEGUARD_VERSION << "\n";
    std::cout << "Real-time voice fraud scoring over WebSocket\n\n";
    if (!config.quiet) {
        std::cout << "[Main] Configuration:\n" << config.toJson() << "\n";
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    try {
        VoiceServer server(config);
        if (!server.start()) {
            std::cerr << "[Main] Failed to start server\n";
            return 1;
        }

        while (!g_shutdownRequested.load() && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        server.stop();

        auto stats = server.getStats();
        std::cout << "[Main] Served " << stats.connectionsOpened << " connections, "
                  << stats.framesReceived << " frames, "
                  << stats.httpRequests << " HTTP requests\n";
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
