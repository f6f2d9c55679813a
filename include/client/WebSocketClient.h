/**
 * @file WebSocketClient.h
 * @brief WebSocket client for talking to a VoiceServer, using websocketpp
 *
 * - Plain ws:// connections carrying JSON text frames (binary on request)
 * - Thread-safe outgoing queue drained by a sender thread
 * - Callback-driven receive path
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

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>

namespace VoiceGuard {
namespace Net {

/**
 * @brief Connection state machine states
 */
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

const char* toString(ConnectionState state);

/**
 * @brief Configuration for WebSocket connection
 */
struct WebSocketConfig {
    int connectTimeoutMs = 10000;
    size_t maxMessageSize = 16 * 1024 * 1024;
    size_t maxQueuedMessages = 1000;
    bool verbose = false;               // Enable websocketpp connect/disconnect logging
};

/**
 * @brief Callbacks for WebSocket events
 */
struct WebSocketCallbacks {
    std::function<void(ConnectionState)> onStateChange;
    std::function<void(const std::string&)> onTextMessage;
    std::function<void(const std::string&)> onError;
    std::function<void()> onConnected;
    std::function<void()> onDisconnected;
};

// WebSocket++ type aliases
using WsClient = websocketpp::client<websocketpp::config::asio_client>;
using WsConnectionHdl = websocketpp::connection_hdl;
using WsMessage = WsClient::message_ptr;

class WebSocketClient {
public:
    explicit WebSocketClient(WebSocketConfig config = WebSocketConfig());
    ~WebSocketClient();

    // Non-copyable, non-movable
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    /**
     * @brief Set event callbacks (before connect)
     */
    void setCallbacks(WebSocketCallbacks callbacks);

    /**
     * @brief Start connecting to a ws:// URI
     * @return true if the connection attempt was queued
     */
    bool connect(const std::string& uri);

    /**
     * @brief Block until connected, failed, or the timeout expires
     * @return true if connected
     */
    bool waitUntilConnected(std::chrono::milliseconds timeout);

    /**
     * @brief Close gracefully and join worker threads
     */
    void disconnect();

    /**
     * @brief Queue a text frame
     * @return false if not connected or the queue is full
     */
    bool sendText(const std::string& payload);

    /**
     * @brief Queue a binary frame
     * @return false if not connected or the queue is full
     */
    bool sendBinary(const std::string& payload);

    ConnectionState getState() const { return state_.load(); }
    bool isConnected() const { return state_.load() == ConnectionState::Connected; }

    struct Stats {
        uint64_t messagesSent = 0;
        uint64_t messagesReceived = 0;
        uint64_t bytesSent = 0;
        uint64_t bytesReceived = 0;
        uint64_t errorCount = 0;
    };
    Stats getStats() const;

private:
    // WebSocket++ event handlers
    void onOpen(WsConnectionHdl hdl);
    void onClose(WsConnectionHdl hdl);
    void onFail(WsConnectionHdl hdl);
    void onMessage(WsConnectionHdl hdl, WsMessage msg);

    void setState(ConnectionState newState);
    void reportError(const std::string& message);
    bool enqueue(std::string payload, websocketpp::frame::opcode::value opcode);
    void processOutgoingQueue();
    void runIoService();

    std::unique_ptr<WsClient> client_;
    WsConnectionHdl connectionHdl_;

    WebSocketConfig config_;
    WebSocketCallbacks callbacks_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::mutex stateMutex_;
    std::condition_variable stateCv_;

    struct OutgoingFrame {
        std::string payload;
        websocketpp::frame::opcode::value opcode = websocketpp::frame::opcode::text;
    };

    std::queue<OutgoingFrame> outgoingQueue_;
    std::mutex queueMutex_;
    std::condition_variable queueCv_;

    std::thread ioThread_;
    std::thread sendThread_;
    std::atomic<bool> running_{false};

    mutable std::mutex statsMutex_;
    Stats stats_;
};

} // namespace Net
} // namespace VoiceGuard
