#include <gtest/gtest.h>
#include "server/VoiceServer.h"
#include "client/WebSocketClient.h"
#include "utils/Base64.h"
#include <nlohmann/json.hpp>
#include <asio.hpp>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

using VoiceGuard::Net::WebSocketCallbacks;
using VoiceGuard::Net::WebSocketClient;
using VoiceGuard::Server::ServerConfig;
using VoiceGuard::Server::VoiceServer;
using json = nlohmann::json;

namespace {

bool waitFor(const std::function<bool()>& condition,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

std::string pcm16Sine(int numSamples, double frequency, double amplitude) {
    std::vector<uint8_t> bytes;
    bytes.reserve(numSamples * 2);
    for (int i = 0; i < numSamples; ++i) {
        auto value = static_cast<int16_t>(amplitude * 32767.0 * std::sin(2.0 * M_PI * frequency * i / 16000.0));
        bytes.push_back(static_cast<uint8_t>(value & 0xFF));
        bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }
    return VoiceGuard::Utils::Base64::encode(bytes);
}

} // namespace

class VoiceServerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.quiet = true;
        config.analyzer.randomSeed = 42;

        server = std::make_unique<VoiceServer>(config);
        ASSERT_TRUE(server->start());
        ASSERT_NE(server->port(), 0);

        WebSocketCallbacks callbacks;
        callbacks.onTextMessage = [this](const std::string& payload) {
            {
                std::lock_guard<std::mutex> lock(repliesMutex);
                replies.push_back(payload);
            }
            repliesCv.notify_all();
        };
        callbacks.onError = [](const std::string&) {};
        client.setCallbacks(callbacks);
    }

    void TearDown() override {
        client.disconnect();
        server->stop();
    }

    std::string uri(const std::string& path = "/ws") const {
        return "ws://127.0.0.1:" + std::to_string(server->port()) + path;
    }

    void connectClient() {
        ASSERT_TRUE(client.connect(uri()));
        ASSERT_TRUE(client.waitUntilConnected(std::chrono::milliseconds(5000)));
    }

    json request(const json& message) {
        EXPECT_TRUE(client.sendText(message.dump()));
        return nextReply();
    }

    json requestRaw(const std::string& frame) {
        EXPECT_TRUE(client.sendText(frame));
        return nextReply();
    }

    json nextReply() {
        std::unique_lock<std::mutex> lock(repliesMutex);
        if (!repliesCv.wait_for(lock, std::chrono::seconds(5), [this] { return !replies.empty(); })) {
            ADD_FAILURE() << "Timed out waiting for reply";
            return json();
        }
        std::string payload = replies.front();
        replies.pop_front();
        return json::parse(payload);
    }

    std::string httpGet(const std::string& resource) {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), server->port());
        socket.connect(endpoint);

        std::string request = "GET " + resource + " HTTP/1.1\r\n"
                              "Host: 127.0.0.1\r\n"
                              "Connection: close\r\n\r\n";
        asio::write(socket, asio::buffer(request));

        std::string response;
        asio::error_code ec;
        char chunk[1024];
        for (;;) {
            size_t n = socket.read_some(asio::buffer(chunk), ec);
            response.append(chunk, n);
            if (ec) break;
        }
        return response;
    }

    std::unique_ptr<VoiceServer> server;
    WebSocketClient client;

    std::mutex repliesMutex;
    std::condition_variable repliesCv;
    std::deque<std::string> replies;
};

TEST_F(VoiceServerIntegrationTest, PingPong) {
    connectClient();

    json reply = request({{"type", "ping"}});
    EXPECT_EQ(reply["type"], "pong");
    EXPECT_TRUE(reply["timestamp"].is_string());
}

TEST_F(VoiceServerIntegrationTest, TestMessage) {
    connectClient();

    json reply = request({{"type", "test"}});
    EXPECT_EQ(reply["message"], "Test successful");
    EXPECT_DOUBLE_EQ(reply["fraud_score"].get<double>(), 0.3);
    EXPECT_EQ(reply["breakdown"]["spectral"], "Normal");
}

TEST_F(VoiceServerIntegrationTest, AudioIsAnalyzed) {
    connectClient();

    json reply = request({
        {"type", "audio"},
        {"data", pcm16Sine(8000, 440.0, 0.3)},
        {"sensitivity", 5},
        {"model", "fast"}
    });

    ASSERT_FALSE(reply.contains("error")) << reply.dump();
    EXPECT_DOUBLE_EQ(reply["audio_length"].get<double>(), 0.5);
    EXPECT_EQ(reply["model_used"], "fast");

    double fraud = reply["fraud_score"];
    EXPECT_GE(fraud, 0.0);
    EXPECT_LE(fraud, 1.0);
    EXPECT_NEAR(reply["replay_risk"].get<double>(), fraud * 0.7, 1e-9);
    EXPECT_GE(reply["confidence"].get<double>(), 0.7);
}

TEST_F(VoiceServerIntegrationTest, MalformedFramesKeepConnectionOpen) {
    connectClient();

    json reply = requestRaw("this is not json");
    EXPECT_EQ(reply["error"], "Invalid JSON");

    reply = request({{"type", "audio"}, {"data", "!!!not base64!!!"}});
    EXPECT_EQ(reply["error"], "Failed to decode audio");
    EXPECT_DOUBLE_EQ(reply["fraud_score"].get<double>(), 0.5);
    EXPECT_EQ(reply["alert"]["type"], "danger");

    reply = request({{"type", "bogus"}});
    EXPECT_EQ(reply["error"], "Unknown message type: bogus");

    // Still usable
    reply = request({{"type", "ping"}});
    EXPECT_EQ(reply["type"], "pong");
    EXPECT_TRUE(client.isConnected());
}

TEST_F(VoiceServerIntegrationTest, BinaryFrameGetsErrorReplyAndConnectionStaysOpen) {
    connectClient();

    std::string raw("\x01\x02\x03\x04", 4);
    ASSERT_TRUE(client.sendBinary(raw));
    json reply = nextReply();
    EXPECT_EQ(reply["error"], "Binary frames are not supported");
    EXPECT_DOUBLE_EQ(reply["fraud_score"].get<double>(), 0.5);

    reply = request({{"type", "ping"}});
    EXPECT_EQ(reply["type"], "pong");
    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(server->activeConnections(), 1u);
}

TEST_F(VoiceServerIntegrationTest, RepliesArriveInOrder) {
    connectClient();

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(client.sendText(json{{"type", i % 2 == 0 ? "ping" : "test"}}.dump()));
    }
    for (int i = 0; i < 5; ++i) {
        json reply = nextReply();
        if (i % 2 == 0) {
            EXPECT_EQ(reply["type"], "pong");
        } else {
            EXPECT_EQ(reply["message"], "Test successful");
        }
    }
}

TEST_F(VoiceServerIntegrationTest, TracksActiveConnections) {
    EXPECT_EQ(server->activeConnections(), 0u);

    connectClient();
    EXPECT_TRUE(waitFor([this] { return server->activeConnections() == 1; }));

    client.disconnect();
    EXPECT_TRUE(waitFor([this] { return server->activeConnections() == 0; }));

    auto stats = server->getStats();
    EXPECT_EQ(stats.connectionsOpened, 1u);
    EXPECT_EQ(stats.connectionsClosed, 1u);
}

TEST_F(VoiceServerIntegrationTest, RejectsUnknownWebSocketPath) {
    ASSERT_TRUE(client.connect(uri("/elsewhere")));
    EXPECT_FALSE(client.waitUntilConnected(std::chrono::milliseconds(5000)));
    EXPECT_EQ(server->activeConnections(), 0u);
}

TEST_F(VoiceServerIntegrationTest, HealthEndpoint) {
    connectClient();
    ASSERT_TRUE(waitFor([this] { return server->activeConnections() == 1; }));

    std::string response = httpGet("/health");
    EXPECT_NE(response.find("200"), std::string::npos);
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos);

    size_t bodyStart = response.find("\r\n\r\n");
    ASSERT_NE(bodyStart, std::string::npos);
    json body = json::parse(response.substr(bodyStart + 4));
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["active_connections"], 1);
}

TEST_F(VoiceServerIntegrationTest, StopIsIdempotent) {
    connectClient();
    server->stop();
    EXPECT_FALSE(server->isRunning());
    EXPECT_TRUE(waitFor([this] { return !client.isConnected(); }));
    server->stop();
}
