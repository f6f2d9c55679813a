#include "client/WebSocketClient.h"
#include "dsp/AudioFile.h"
#include "utils/Base64.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef VOICEGUARD_VERSION
#define VOICEGUARD_VERSION "1.0.0"
#endif

using json = nlohmann::json;

namespace {

constexpr int kStreamSampleRate = 16000;
constexpr int kMaxChunkMs = 60000;

struct ProbeOptions {
    std::string uri = "ws://127.0.0.1:8000/ws";
    bool ping = false;
    bool test = false;
    std::string wavPath;
    int chunkMs = 500;
    double sensitivity = 6.0;
    std::string model;
    int replyTimeoutMs = 10000;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --uri URI           Server endpoint (default ws://127.0.0.1:8000/ws)\n";
    std::cout << "  --ping              Send a ping\n";
    std::cout << "  --test              Request the canned test result\n";
    std::cout << "  --wav FILE          Stream a WAV file as 16 kHz mono PCM16 chunks\n";
    std::cout << "  --chunk-ms N        Chunk length in milliseconds, up to 60000 (default 500)\n";
    std::cout << "  --sensitivity N     Sensitivity 0-10 (default 6)\n";
    std::cout << "  --model NAME        Model name echoed in results\n";
    std::cout << "  --version           Show version\n";
    std::cout << "  --help              Show this help\n";
}

/**
 * @brief Sends one frame at a time and waits for its reply
 */
class ReplyWaiter {
public:
    void push(const std::string& reply) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            replies_.push_back(reply);
        }
        cv_.notify_all();
    }

    void fail() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool next(std::string& reply, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !replies_.empty() || closed_; })) {
            return false;
        }
        if (replies_.empty()) {
            return false;
        }
        reply = replies_.front();
        replies_.erase(replies_.begin());
        return true;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> replies_;
    bool closed_ = false;
};

bool exchange(VoiceGuard::Net::WebSocketClient& client,
              ReplyWaiter& waiter,
              const json& request,
              int timeoutMs) {
    if (!client.sendText(request.dump())) {
        std::cerr << "[Probe] Send failed" << std::endl;
        return false;
    }

    std::string reply;
    if (!waiter.next(reply, std::chrono::milliseconds(timeoutMs))) {
        std::cerr << "[Probe] No reply within " << timeoutMs << " ms" << std::endl;
        return false;
    }

    json parsed = json::parse(reply, nullptr, false);
    if (parsed.is_discarded()) {
        std::cout << reply << std::endl;
    } else {
        std::cout << parsed.dump(2) << std::endl;
    }
    return true;
}

ProbeOptions parseArgs(int argc, char* argv[]) {
    ProbeOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--ping") {
            options.ping = true;
            continue;
        } else if (arg == "--test") {
            options.test = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Unknown option or missing value: " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--uri") {
            options.uri = value;
        } else if (arg == "--wav") {
            options.wavPath = value;
        } else if (arg == "--chunk-ms") {
            size_t consumed = 0;
            long chunkMs = std::stol(value, &consumed);
            if (consumed != value.size() || chunkMs <= 0 || chunkMs > kMaxChunkMs) {
                throw std::invalid_argument("--chunk-ms must be between 1 and " +
                                            std::to_string(kMaxChunkMs));
            }
            options.chunkMs = static_cast<int>(chunkMs);
        } else if (arg == "--sensitivity") {
            options.sensitivity = std::stod(value);
        } else if (arg == "--model") {
            options.model = value;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (!options.ping && !options.test && options.wavPath.empty()) {
        options.ping = true;
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    using VoiceGuard::Net::ConnectionState;
    using VoiceGuard::Net::WebSocketCallbacks;
    using VoiceGuard::Net::WebSocketClient;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "VoiceGuard probe version " << VOICEGUARD_VERSION << "\n";
            return 0;
        }
    }

    ProbeOptions options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[Probe] " << e.what() << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage\n";
        return 1;
    }

    // Load the audio before connecting so a bad file fails fast
    std::unique_ptr<VoiceGuard::Core::AudioBuffer> mono;
    if (!options.wavPath.empty()) {
        VoiceGuard::DSP::AudioFile file;
        if (!file.load(options.wavPath)) {
            return 1;
        }
        try {
            mono = VoiceGuard::DSP::AudioFile::toMono(file.getBuffer(),
                                                      file.getInfo().sampleRate,
                                                      kStreamSampleRate);
        } catch (const std::exception& e) {
            std::cerr << "[Probe] " << e.what() << std::endl;
            return 1;
        }
    }

    ReplyWaiter waiter;
    WebSocketClient client;

    WebSocketCallbacks callbacks;
    callbacks.onTextMessage = [&waiter](const std::string& payload) {
        waiter.push(payload);
    };
    callbacks.onError = [](const std::string& error) {
        std::cerr << "[Probe] " << error << std::endl;
    };
    callbacks.onStateChange = [&waiter](ConnectionState state) {
        if (state == ConnectionState::Failed || state == ConnectionState::Disconnected) {
            waiter.fail();
        }
    };
    client.setCallbacks(callbacks);

    if (!client.connect(options.uri) ||
        !client.waitUntilConnected(std::chrono::milliseconds(10000))) {
        std::cerr << "[Probe] Could not connect to " << options.uri << std::endl;
        return 1;
    }
    std::cout << "[Probe] Connected to " << options.uri << std::endl;

    bool ok = true;

    if (options.ping) {
        ok = exchange(client, waiter, json{{"type", "ping"}}, options.replyTimeoutMs) && ok;
    }

    if (ok && options.test) {
        ok = exchange(client, waiter, json{{"type", "test"}}, options.replyTimeoutMs) && ok;
    }

    if (ok && mono) {
        const int chunkSamples =
            VoiceGuard::DSP::AudioFile::samplesForDuration(kStreamSampleRate, options.chunkMs);
        const int totalSamples = mono->getNumSamples();
        int chunkIndex = 0;

        for (int start = 0; start < totalSamples && ok; start += chunkSamples) {
            std::vector<uint8_t> pcm = VoiceGuard::DSP::AudioFile::toPcm16(*mono, start, chunkSamples);

            json request = {
                {"type", "audio"},
                {"data", VoiceGuard::Utils::Base64::encode(pcm)},
                {"sensitivity", options.sensitivity},
                {"format", "pcm16"}
            };
            if (!options.model.empty()) {
                request["model"] = options.model;
            }

            std::cout << "[Probe] Chunk " << ++chunkIndex << " ("
                      << pcm.size() / 2 << " samples)" << std::endl;
            ok = exchange(client, waiter, request, options.replyTimeoutMs);
        }
    }

    auto stats = client.getStats();
    client.disconnect();

    std::cout << "[Probe] Sent " << stats.messagesSent << " frames, received "
              << stats.messagesReceived << std::endl;

    return ok ? 0 : 1;
}
