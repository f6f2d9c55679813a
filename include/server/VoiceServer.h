/**
 * @file VoiceServer.h
 * @brief WebSocket + HTTP front end for the voice analyzer, built on websocketpp
 *
 * - One JSON text frame in, one JSON text frame out, per connection
 * - Malformed frames get an error reply; the connection stays open
 * - Plain HTTP routes share the listening port (see HttpRoutes)
 *
 * Dependencies: websocketpp (header-only), asio (standalone)
 */

#pragma once

// Use standalone Asio (no Boost dependency)
#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#ifndef _WEBSOCKETPP_CPP11_STL_
#define _WEBSOCKETPP_CPP11_STL_
#endif

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "analysis/VoiceAnalyzer.h"
#include "protocol/MessageDispatcher.h"
#include "server/HttpRoutes.h"
#include "server/ServerConfig.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace VoiceGuard {
namespace Server {

// WebSocket++ type aliases
using WsServer = websocketpp::server<websocketpp::config::asio>;
using ConnectionHdl = websocketpp::connection_hdl;
using WsMessage = WsServer::message_ptr;

class VoiceServer {
public:
    explicit VoiceServer(ServerConfig config);
    ~VoiceServer();

    // Non-copyable, non-movable
    VoiceServer(const VoiceServer&) = delete;
    VoiceServer& operator=(const VoiceServer&) = delete;

    /**
     * @brief Bind and start accepting, then run the I/O service on
     *        background threads
     * @return false if the address could not be bound
     */
    bool start();

    /**
     * @brief Stop listening, close open connections and join I/O threads
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Port actually bound (differs from config when it asked for 0)
     */
    uint16_t port() const { return boundPort_.load(); }

    size_t activeConnections() const;

    struct Stats {
        uint64_t connectionsOpened = 0;
        uint64_t connectionsClosed = 0;
        uint64_t framesReceived = 0;
        uint64_t sendErrors = 0;
        uint64_t httpRequests = 0;
    };
    Stats getStats() const;

    const ServerConfig& getConfig() const { return config_; }

private:
    // WebSocket++ event handlers
    bool onValidate(ConnectionHdl hdl);
    void onOpen(ConnectionHdl hdl);
    void onClose(ConnectionHdl hdl);
    void onFail(ConnectionHdl hdl);
    void onMessage(ConnectionHdl hdl, WsMessage msg);
    void onHttp(ConnectionHdl hdl);

    bool listen();
    void runIoService();
    void closeAllConnections();
    void dropConnection(ConnectionHdl hdl);

    ServerConfig config_;
    Analysis::VoiceAnalyzer analyzer_;
    Protocol::MessageDispatcher dispatcher_;
    HttpRoutes routes_;

    WsServer server_;
    std::vector<std::thread> ioThreads_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> boundPort_{0};

    // Active connection registry
    mutable std::mutex connectionsMutex_;
    std::set<ConnectionHdl, std::owner_less<ConnectionHdl>> connections_;

    // Statistics
    mutable std::mutex statsMutex_;
    Stats stats_;
};

} // namespace Server
} // namespace VoiceGuard
