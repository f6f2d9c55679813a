/**
 * @file WebSocketClient.cpp
 * @brief WebSocket client for talking to a VoiceServer
 */

#include "client/WebSocketClient.h"
#include <iostream>

namespace VoiceGuard {
namespace Net {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

WebSocketClient::WebSocketClient(WebSocketConfig config)
    : client_(std::make_unique<WsClient>())
    , config_(config)
{
    client_->clear_access_channels(websocketpp::log::alevel::all);
    client_->clear_error_channels(websocketpp::log::elevel::all);

    if (config_.verbose) {
        client_->set_access_channels(websocketpp::log::alevel::connect);
        client_->set_access_channels(websocketpp::log::alevel::disconnect);
    }
    client_->set_error_channels(websocketpp::log::elevel::rerror);
    client_->set_error_channels(websocketpp::log::elevel::fatal);

    client_->init_asio();
    client_->set_max_message_size(config_.maxMessageSize);

    client_->set_open_handler([this](WsConnectionHdl hdl) {
        onOpen(hdl);
    });

    client_->set_close_handler([this](WsConnectionHdl hdl) {
        onClose(hdl);
    });

    client_->set_fail_handler([this](WsConnectionHdl hdl) {
        onFail(hdl);
    });

    client_->set_message_handler([this](WsConnectionHdl hdl, WsMessage msg) {
        onMessage(hdl, msg);
    });
}

WebSocketClient::~WebSocketClient() {
    disconnect();
}

void WebSocketClient::setCallbacks(WebSocketCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

//=============================================================================
// Connection Management
//=============================================================================

bool WebSocketClient::connect(const std::string& uri) {
    ConnectionState current = state_.load();
    if (current == ConnectionState::Connected || current == ConnectionState::Connecting) {
        return false;
    }

    // A previous session left the I/O service stopped
    if (ioThread_.joinable() || sendThread_.joinable()) {
        disconnect();
    }
    client_->reset();

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = client_->get_connection(uri, ec);
    if (ec) {
        reportError("Connection creation failed: " + ec.message());
        setState(ConnectionState::Failed);
        return false;
    }

    con->set_open_handshake_timeout(config_.connectTimeoutMs);
    connectionHdl_ = con->get_handle();

    setState(ConnectionState::Connecting);
    running_ = true;
    client_->connect(con);

    ioThread_ = std::thread(&WebSocketClient::runIoService, this);
    sendThread_ = std::thread(&WebSocketClient::processOutgoingQueue, this);
    return true;
}

bool WebSocketClient::waitUntilConnected(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateCv_.wait_for(lock, timeout, [this] {
        ConnectionState s = state_.load();
        return s == ConnectionState::Connected ||
               s == ConnectionState::Failed ||
               s == ConnectionState::Disconnected;
    });
    return state_.load() == ConnectionState::Connected;
}

void WebSocketClient::disconnect() {
    running_ = false;

    if (state_.load() == ConnectionState::Connected) {
        websocketpp::lib::error_code ec;
        client_->close(connectionHdl_, websocketpp::close::status::normal, "Client disconnect", ec);
        if (ec) {
            reportError("Close failed: " + ec.message());
        }
    }

    // Wake up send thread
    queueCv_.notify_all();
    if (sendThread_.joinable()) {
        sendThread_.join();
    }

    // The close handshake finishes on the I/O thread; stop it if it lingers
    if (ioThread_.joinable()) {
        if (state_.load() != ConnectionState::Connected) {
            client_->stop();
        } else {
            std::unique_lock<std::mutex> lock(stateMutex_);
            stateCv_.wait_for(lock, std::chrono::seconds(2), [this] {
                return state_.load() != ConnectionState::Connected;
            });
            lock.unlock();
            client_->stop();
        }
        ioThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        std::queue<OutgoingFrame>().swap(outgoingQueue_);
    }

    if (state_.load() != ConnectionState::Failed) {
        setState(ConnectionState::Disconnected);
    }
}

//=============================================================================
// Message Sending
//=============================================================================

bool WebSocketClient::sendText(const std::string& payload) {
    return enqueue(payload, websocketpp::frame::opcode::text);
}

bool WebSocketClient::sendBinary(const std::string& payload) {
    return enqueue(payload, websocketpp::frame::opcode::binary);
}

bool WebSocketClient::enqueue(std::string payload, websocketpp::frame::opcode::value opcode) {
    if (state_.load() != ConnectionState::Connected) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (outgoingQueue_.size() >= config_.maxQueuedMessages) {
            reportError("Outgoing queue full - message dropped");
            return false;
        }
        outgoingQueue_.push(OutgoingFrame{std::move(payload), opcode});
    }
    queueCv_.notify_one();
    return true;
}

void WebSocketClient::processOutgoingQueue() {
    while (running_) {
        OutgoingFrame frame;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] {
                return !outgoingQueue_.empty() || !running_;
            });

            if (!running_) break;

            frame = std::move(outgoingQueue_.front());
            outgoingQueue_.pop();
        }

        if (state_.load() != ConnectionState::Connected) {
            continue;
        }

        websocketpp::lib::error_code ec;
        client_->send(connectionHdl_, frame.payload, frame.opcode, ec);

        std::lock_guard<std::mutex> lock(statsMutex_);
        if (ec) {
            stats_.errorCount++;
        } else {
            stats_.messagesSent++;
            stats_.bytesSent += frame.payload.size();
        }
    }
}

void WebSocketClient::runIoService() {
    try {
        client_->run();
    } catch (const std::exception& e) {
        reportError(std::string("I/O error: ") + e.what());
    }
}

//=============================================================================
// WebSocket++ Event Handlers
//=============================================================================

void WebSocketClient::onOpen(WsConnectionHdl hdl) {
    connectionHdl_ = hdl;
    setState(ConnectionState::Connected);

    if (callbacks_.onConnected) {
        callbacks_.onConnected();
    }
}

void WebSocketClient::onClose(WsConnectionHdl) {
    setState(ConnectionState::Disconnected);

    if (callbacks_.onDisconnected) {
        callbacks_.onDisconnected();
    }
}

void WebSocketClient::onFail(WsConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = client_->get_con_from_hdl(hdl, ec);
    std::string reason = ec ? ec.message() : con->get_ec().message();

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.errorCount++;
    }

    reportError("Connection failed: " + reason);
    setState(ConnectionState::Failed);
}

void WebSocketClient::onMessage(WsConnectionHdl, WsMessage msg) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.messagesReceived++;
        stats_.bytesReceived += msg->get_payload().size();
    }

    if (callbacks_.onTextMessage) {
        callbacks_.onTextMessage(msg->get_payload());
    }
}

//=============================================================================
// Internal Helpers
//=============================================================================

void WebSocketClient::setState(ConnectionState newState) {
    ConnectionState oldState;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        oldState = state_.exchange(newState);
    }
    stateCv_.notify_all();

    if (oldState != newState && callbacks_.onStateChange) {
        callbacks_.onStateChange(newState);
    }
}

void WebSocketClient::reportError(const std::string& message) {
    if (callbacks_.onError) {
        callbacks_.onError(message);
    } else {
        std::cerr << "[WebSocketClient] " << message << std::endl;
    }
}

WebSocketClient::Stats WebSocketClient::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

} // namespace Net
} // namespace VoiceGuard
