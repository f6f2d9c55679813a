#include "server/ServerConfig.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace VoiceGuard {
namespace Server {

namespace {

template <typename T>
void readField(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Config key '") + key + "': " + e.what());
    }
}

long long parseNumber(const std::string& flag, const std::string& value,
                      long long minValue, long long maxValue) {
    size_t consumed = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (number < minValue || number > maxValue) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(minValue) +
                                    " and " + std::to_string(maxValue));
    }
    return number;
}

} // namespace

void ServerConfig::validate() const {
    if (host.empty()) {
        throw std::invalid_argument("Host must not be empty");
    }
    if (path.empty() || path[0] != '/') {
        throw std::invalid_argument("WebSocket path must start with '/': " + path);
    }
    if (ioThreads < 1 || ioThreads > kMaxIoThreads) {
        throw std::invalid_argument("ioThreads must be between 1 and " + std::to_string(kMaxIoThreads));
    }
    if (maxMessageSize == 0) {
        throw std::invalid_argument("maxMessageSize must be positive");
    }
    if (analyzer.sampleRate <= 0) {
        throw std::invalid_argument("Analyzer sample rate must be positive");
    }
    if (analyzer.minSamples < 1) {
        throw std::invalid_argument("Analyzer minimum sample count must be at least 1");
    }
    if (analyzer.labelThreshold < 0.0 || analyzer.labelThreshold > 1.0) {
        throw std::invalid_argument("Analyzer label threshold must be within [0, 1]");
    }
}

void ServerConfig::applyJson(const std::string& document) {
    json j = json::parse(document, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::invalid_argument("Config is not a JSON object");
    }

    readField(j, "host", host);

    int portValue = port;
    readField(j, "port", portValue);
    if (portValue < 0 || portValue > 65535) {
        throw std::invalid_argument("Port out of range: " + std::to_string(portValue));
    }
    port = static_cast<uint16_t>(portValue);

    readField(j, "path", path);
    readField(j, "io_threads", ioThreads);
    readField(j, "max_message_size", maxMessageSize);
    readField(j, "static_root", staticRoot);
    readField(j, "quiet", quiet);

    auto section = j.find("analyzer");
    if (section != j.end() && section->is_object()) {
        const json& a = *section;
        readField(a, "sample_rate", analyzer.sampleRate);
        readField(a, "min_samples", analyzer.minSamples);
        readField(a, "rms_weight", analyzer.rmsWeight);
        readField(a, "zcr_weight", analyzer.zcrWeight);
        readField(a, "jitter_min", analyzer.jitterMin);
        readField(a, "jitter_span", analyzer.jitterSpan);
        readField(a, "replay_ratio", analyzer.replayRatio);
        readField(a, "label_threshold", analyzer.labelThreshold);
        readField(a, "silence_rms", analyzer.silenceRms);

        auto seed = a.find("seed");
        if (seed != a.end() && !seed->is_null()) {
            uint32_t value = 0;
            readField(a, "seed", value);
            analyzer.randomSeed = value;
        }
    }
}

ServerConfig ServerConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::stringstream contents;
    contents << file.rdbuf();

    ServerConfig config;
    config.applyJson(contents.str());
    return config;
}

ServerConfig ServerConfig::fromArgs(int argc, const char* const argv[]) {
    ServerConfig config;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a value");
            }
            config = loadFromFile(argv[i + 1]);
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--quiet") {
            config.quiet = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Unknown option or missing value: " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            // Already applied
        } else if (arg == "--host") {
            config.host = value;
        } else if (arg == "--port") {
            config.port = static_cast<uint16_t>(parseNumber(arg, value, 0, 65535));
        } else if (arg == "--path") {
            config.path = value;
        } else if (arg == "--static-root") {
            config.staticRoot = value;
        } else if (arg == "--threads") {
            config.ioThreads = static_cast<int>(parseNumber(arg, value, 1, kMaxIoThreads));
        } else if (arg == "--seed") {
            config.analyzer.randomSeed =
                static_cast<uint32_t>(parseNumber(arg, value, 0, std::numeric_limits<uint32_t>::max()));
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    config.validate();
    return config;
}

std::string ServerConfig::toJson() const {
    json j{
        {"host", host},
        {"port", port},
        {"path", path},
        {"io_threads", ioThreads},
        {"max_message_size", maxMessageSize},
        {"static_root", staticRoot},
        {"quiet", quiet},
        {"analyzer", {
            {"sample_rate", analyzer.sampleRate},
            {"min_samples", analyzer.minSamples},
            {"rms_weight", analyzer.rmsWeight},
            {"zcr_weight", analyzer.zcrWeight},
            {"jitter_min", analyzer.jitterMin},
            {"jitter_span", analyzer.jitterSpan},
            {"replay_ratio", analyzer.replayRatio},
            {"label_threshold", analyzer.labelThreshold},
            {"silence_rms", analyzer.silenceRms}
        }}
    };
    if (analyzer.randomSeed) {
        j["analyzer"]["seed"] = *analyzer.randomSeed;
    }
    return j.dump(2);
}

} // namespace Server
} // namespace VoiceGuard
