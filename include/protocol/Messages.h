/**
 * @file Messages.h
 * @brief JSON frames exchanged over the /ws channel
 *
 * Inbound frames are JSON objects with a "type" discriminator:
 * - "audio": base64 "data", optional "sensitivity", "model", "format"
 * - "ping":  heartbeat
 * - "test":  canned reply for checking the pipeline end to end
 *
 * Outbound analysis frames always carry fraud_score, replay_risk,
 * confidence, audio_length and a breakdown object.
 */

#pragma once

#include "analysis/VoiceAnalyzer.h"
#include "dsp/PcmDecoder.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace VoiceGuard {
namespace Protocol {

using json = nlohmann::json;

/**
 * @brief Inbound message type codes
 */
enum class MessageType {
    Audio,
    Ping,
    Test,
    Unknown
};

MessageType parseMessageType(const std::string& type);

/**
 * @brief Fields of an "audio" frame after defaulting
 */
struct AudioRequest {
    std::string data;                               // base64, possibly a data URL
    double sensitivity = 0.6;                       // already divided by 10
    std::string model = Analysis::VoiceAnalyzer::kDefaultModel;
    DSP::SampleFormat format = DSP::SampleFormat::Auto;
};

// Client sensitivity scale is 0-10; the analyzer works on 0-1
constexpr double kDefaultSensitivity = 6.0;
constexpr double kSensitivityScale = 10.0;

/**
 * @brief Extract an audio request from a parsed frame
 *
 * "sensitivity" may be a number or a numeric string; anything else falls
 * back to the default. An unrecognized "format" leaves Auto in place.
 */
AudioRequest parseAudioRequest(const json& message);

/**
 * @brief Serialize an analysis record
 */
json toJson(const Analysis::AnalysisResult& result);

/**
 * @brief Fallback record with an "error" field
 * @param withAlert Attach the dashboard alert used for audio processing errors
 */
json makeErrorReply(const std::string& error, bool withAlert = false);

json makePongReply();
json makeTestReply();

} // namespace Protocol
} // namespace VoiceGuard
