#include "protocol/MessageDispatcher.h"
#include "utils/Base64.h"
#include <iostream>

namespace VoiceGuard {
namespace Protocol {

MessageDispatcher::MessageDispatcher(Analysis::VoiceAnalyzer& analyzer)
    : analyzer_(analyzer) {
}

std::string MessageDispatcher::handle(const std::string& frame) {
    return dispatch(frame).dump(-1, ' ', false, json::error_handler_t::replace);
}

json MessageDispatcher::dispatch(const std::string& frame) {
    framesHandled_++;

    json message = json::parse(frame, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        errorReplies_++;
        return makeErrorReply("Invalid JSON");
    }

    std::string type;
    auto typeField = message.find("type");
    if (typeField != message.end() && typeField->is_string()) {
        type = typeField->get<std::string>();
    }

    try {
        switch (parseMessageType(type)) {
            case MessageType::Audio:
                return handleAudio(message);

            case MessageType::Ping:
                return makePongReply();

            case MessageType::Test:
                return makeTestReply();

            case MessageType::Unknown:
                break;
        }
    } catch (const std::exception& e) {
        // Serialization or allocation failure inside a handler
        std::cerr << "[MessageDispatcher] Handler error: " << e.what() << std::endl;
        errorReplies_++;
        return makeErrorReply(e.what(), true);
    }

    errorReplies_++;
    return makeErrorReply("Unknown message type: " + type);
}

json MessageDispatcher::handleAudio(const json& message) {
    AudioRequest request = parseAudioRequest(message);

    if (request.data.empty()) {
        errorReplies_++;
        return makeErrorReply("No audio data");
    }

    auto bytes = Utils::Base64::decode(request.data);
    if (!bytes) {
        std::cerr << "[MessageDispatcher] Audio payload is not valid base64" << std::endl;
        errorReplies_++;
        return makeErrorReply("Failed to decode audio", true);
    }

    auto decoded = decoder_.decode(*bytes, request.format);
    if (!decoded) {
        errorReplies_++;
        return makeErrorReply("Failed to decode audio", true);
    }

    Analysis::AnalysisResult result =
        analyzer_.analyze(*decoded->buffer, request.sensitivity, request.model);
    if (result.isFallback()) {
        errorReplies_++;
    } else {
        audioAnalyzed_++;
    }

    return toJson(result);
}

MessageDispatcher::Stats MessageDispatcher::getStats() const {
    Stats stats;
    stats.framesHandled = framesHandled_.load();
    stats.audioAnalyzed = audioAnalyzed_.load();
    stats.errorReplies = errorReplies_.load();
    return stats;
}

} // namespace Protocol
} // namespace VoiceGuard
