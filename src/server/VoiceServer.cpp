/**
 * @file VoiceServer.cpp
 * @brief WebSocket + HTTP front end for the voice analyzer
 */

#include "server/VoiceServer.h"
#include "protocol/Messages.h"
#include <iostream>

namespace VoiceGuard {
namespace Server {

namespace {

std::string stripQuery(const std::string& resource) {
    return resource.substr(0, resource.find('?'));
}

ServerConfig validated(ServerConfig config) {
    config.validate();
    return config;
}

} // namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

VoiceServer::VoiceServer(ServerConfig config)
    : config_(validated(std::move(config)))
    , analyzer_(config_.analyzer)
    , dispatcher_(analyzer_)
    , routes_(config_.staticRoot)
{
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.clear_error_channels(websocketpp::log::elevel::all);

    // Connection lifecycle only, unless quiet
    if (!config_.quiet) {
        server_.set_access_channels(websocketpp::log::alevel::connect);
        server_.set_access_channels(websocketpp::log::alevel::disconnect);
    }
    server_.set_error_channels(websocketpp::log::elevel::rerror);
    server_.set_error_channels(websocketpp::log::elevel::fatal);

    server_.init_asio();
    server_.set_reuse_addr(true);
    server_.set_max_message_size(config_.maxMessageSize);
    server_.set_close_handshake_timeout(1000);

    server_.set_validate_handler([this](ConnectionHdl hdl) {
        return onValidate(hdl);
    });

    server_.set_open_handler([this](ConnectionHdl hdl) {
        onOpen(hdl);
    });

    server_.set_close_handler([this](ConnectionHdl hdl) {
        onClose(hdl);
    });

    server_.set_fail_handler([this](ConnectionHdl hdl) {
        onFail(hdl);
    });

    server_.set_message_handler([this](ConnectionHdl hdl, WsMessage msg) {
        onMessage(hdl, msg);
    });

    server_.set_http_handler([this](ConnectionHdl hdl) {
        onHttp(hdl);
    });
}

VoiceServer::~VoiceServer() {
    stop();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool VoiceServer::start() {
    if (running_.load()) {
        return false;
    }

    if (!listen()) {
        return false;
    }

    running_ = true;
    for (int i = 0; i < config_.ioThreads; ++i) {
        ioThreads_.emplace_back(&VoiceServer::runIoService, this);
    }
    return true;
}

void VoiceServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::cout << "[VoiceServer] Shutting down" << std::endl;

    // Runs on an I/O thread so it never races the handlers
    asio::post(server_.get_io_service(), [this]() {
        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
        if (ec) {
            std::cerr << "[VoiceServer] stop_listening failed: " << ec.message() << std::endl;
        }
        closeAllConnections();
    });

    for (auto& thread : ioThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    ioThreads_.clear();

    std::cout << "[VoiceServer] Stopped" << std::endl;
}

bool VoiceServer::listen() {
    websocketpp::lib::error_code ec;
    server_.listen(config_.host, std::to_string(config_.port), ec);
    if (ec) {
        std::cerr << "[VoiceServer] Failed to listen on " << config_.host << ":"
                  << config_.port << ": " << ec.message() << std::endl;
        return false;
    }

    server_.start_accept(ec);
    if (ec) {
        std::cerr << "[VoiceServer] Failed to start accepting: " << ec.message() << std::endl;
        websocketpp::lib::error_code ignored;
        server_.stop_listening(ignored);
        return false;
    }

    websocketpp::lib::asio::error_code endpointEc;
    auto endpoint = server_.get_local_endpoint(endpointEc);
    boundPort_ = endpointEc ? config_.port : endpoint.port();

    std::cout << "[VoiceServer] Listening on " << config_.host << ":" << boundPort_.load()
              << " (WebSocket at " << config_.path << ", "
              << config_.ioThreads << " I/O thread"
              << (config_.ioThreads == 1 ? "" : "s") << ")" << std::endl;
    return true;
}

void VoiceServer::runIoService() {
    try {
        server_.run();
    } catch (const std::exception& e) {
        std::cerr << "[VoiceServer] I/O error: " << e.what() << std::endl;
    }
}

void VoiceServer::closeAllConnections() {
    std::vector<ConnectionHdl> open;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        open.assign(connections_.begin(), connections_.end());
    }

    for (auto& hdl : open) {
        websocketpp::lib::error_code ec;
        server_.close(hdl, websocketpp::close::status::going_away, "Server shutdown", ec);
        if (ec) {
            std::cerr << "[VoiceServer] Close failed: " << ec.message() << std::endl;
        }
    }
}

//=============================================================================
// WebSocket++ Event Handlers
//=============================================================================

bool VoiceServer::onValidate(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    WsServer::connection_ptr con = server_.get_con_from_hdl(hdl, ec);
    if (ec) {
        return false;
    }

    const std::string path = stripQuery(con->get_resource());
    if (path != config_.path) {
        std::cerr << "[VoiceServer] Rejected WebSocket upgrade for " << path << std::endl;
        con->set_status(websocketpp::http::status_code::not_found);
        return false;
    }
    return true;
}

void VoiceServer::onOpen(ConnectionHdl hdl) {
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        connections_.insert(hdl);
        active = connections_.size();
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.connectionsOpened++;
    }

    if (!config_.quiet) {
        std::cout << "[VoiceServer] Client connected (" << active << " active)" << std::endl;
    }
}

void VoiceServer::onClose(ConnectionHdl hdl) {
    dropConnection(hdl);
}

void VoiceServer::onFail(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    WsServer::connection_ptr con = server_.get_con_from_hdl(hdl, ec);
    if (!ec) {
        std::cerr << "[VoiceServer] Connection failed: " << con->get_ec().message() << std::endl;
    }
    dropConnection(hdl);
}

void VoiceServer::dropConnection(ConnectionHdl hdl) {
    size_t active = 0;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        removed = connections_.erase(hdl) > 0;
        active = connections_.size();
    }

    if (!removed) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.connectionsClosed++;
    }

    if (!config_.quiet) {
        std::cout << "[VoiceServer] Client disconnected (" << active << " active)" << std::endl;
    }
}

void VoiceServer::onMessage(ConnectionHdl hdl, WsMessage msg) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.framesReceived++;
    }

    std::string reply;
    if (msg->get_opcode() == websocketpp::frame::opcode::text) {
        reply = dispatcher_.handle(msg->get_payload());
    } else {
        reply = Protocol::makeErrorReply("Binary frames are not supported").dump();
    }

    websocketpp::lib::error_code ec;
    server_.send(hdl, reply, websocketpp::frame::opcode::text, ec);
    if (ec) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.sendErrors++;
        std::cerr << "[VoiceServer] Send failed: " << ec.message() << std::endl;
    }
}

void VoiceServer::onHttp(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    WsServer::connection_ptr con = server_.get_con_from_hdl(hdl, ec);
    if (ec) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.httpRequests++;
    }

    HttpResponse response = routes_.handle(con->get_request().get_method(),
                                           con->get_resource(),
                                           activeConnections());

    con->set_status(static_cast<websocketpp::http::status_code::value>(response.status));
    con->set_body(response.body);
    for (const auto& header : response.headers) {
        con->replace_header(header.first, header.second);
    }
}

//=============================================================================
// Queries
//=============================================================================

size_t VoiceServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    return connections_.size();
}

VoiceServer::Stats VoiceServer::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

} // namespace Server
} // namespace VoiceGuard
