#include "protocol/Messages.h"
#include "utils/Time.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace VoiceGuard {
namespace Protocol {

namespace {

json breakdownToJson(const Analysis::Breakdown& breakdown) {
    return json{
        {"spectral", breakdown.spectral},
        {"pitch", breakdown.pitch},
        {"noise", breakdown.noise},
        {"prosody", breakdown.prosody}
    };
}

std::string trimmed(const std::string& text) {
    const char* kSpace = " \t\r\n\f\v";
    size_t first = text.find_first_not_of(kSpace);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

// Numbers, numeric strings with surrounding whitespace, and booleans (1 or 0)
double parseSensitivity(const json& value) {
    double raw = kDefaultSensitivity;

    if (value.is_boolean()) {
        raw = value.get<bool>() ? 1.0 : 0.0;
    } else if (value.is_number()) {
        raw = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = trimmed(value.get<std::string>());
        try {
            size_t consumed = 0;
            raw = std::stod(text, &consumed);
            if (consumed != text.size()) {
                raw = kDefaultSensitivity;
            }
        } catch (const std::exception&) {
            raw = kDefaultSensitivity;
        }
    }

    if (!std::isfinite(raw)) {
        raw = kDefaultSensitivity;
    }
    return raw / kSensitivityScale;
}

} // namespace

MessageType parseMessageType(const std::string& type) {
    if (type == "audio") return MessageType::Audio;
    if (type == "ping") return MessageType::Ping;
    if (type == "test") return MessageType::Test;
    return MessageType::Unknown;
}

AudioRequest parseAudioRequest(const json& message) {
    AudioRequest request;

    auto data = message.find("data");
    if (data != message.end() && data->is_string()) {
        request.data = data->get<std::string>();
    }

    auto sensitivity = message.find("sensitivity");
    request.sensitivity = (sensitivity != message.end())
        ? parseSensitivity(*sensitivity)
        : kDefaultSensitivity / kSensitivityScale;

    auto model = message.find("model");
    if (model != message.end() && model->is_string()) {
        request.model = model->get<std::string>();
    }

    auto format = message.find("format");
    if (format != message.end() && format->is_string()) {
        auto parsed = DSP::PcmDecoder::parseFormat(format->get<std::string>());
        if (parsed) {
            request.format = *parsed;
        }
    }

    return request;
}

json toJson(const Analysis::AnalysisResult& result) {
    json j;
    if (result.error) {
        j["error"] = *result.error;
    }
    j["fraud_score"] = result.fraudScore;
    j["replay_risk"] = result.replayRisk;
    j["confidence"] = result.confidence;
    j["breakdown"] = breakdownToJson(result.breakdown);
    j["transcription"] = result.transcription;
    j["timestamp"] = result.timestamp;
    j["audio_length"] = result.audioLengthSeconds;
    if (!result.modelUsed.empty()) {
        j["model_used"] = result.modelUsed;
    }
    return j;
}

json makeErrorReply(const std::string& error, bool withAlert) {
    json j = toJson(Analysis::VoiceAnalyzer::fallback(error));
    if (withAlert) {
        j["alert"] = json{
            {"message", "Error processing audio"},
            {"type", "danger"}
        };
    }
    return j;
}

json makePongReply() {
    return json{
        {"type", "pong"},
        {"timestamp", Utils::isoTimestamp()}
    };
}

json makeTestReply() {
    Analysis::AnalysisResult canned;
    canned.fraudScore = 0.3;
    canned.replayRisk = 0.2;
    canned.confidence = 0.9;
    canned.breakdown.spectral = "Normal";
    canned.breakdown.pitch = "Natural";
    canned.breakdown.noise = "Clean";
    canned.breakdown.prosody = "Human-like";
    canned.transcription = "System is working correctly";
    canned.timestamp = Utils::isoTimestamp();

    json j = toJson(canned);
    j["message"] = "Test successful";
    return j;
}

} // namespace Protocol
} // namespace VoiceGuard
