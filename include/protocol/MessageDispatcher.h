#pragma once

#include "analysis/VoiceAnalyzer.h"
#include "dsp/PcmDecoder.h"
#include "protocol/Messages.h"
#include <atomic>
#include <cstdint>
#include <string>

namespace VoiceGuard {
namespace Protocol {

/**
 * @brief Turns one inbound text frame into exactly one reply frame
 *
 * Every failure (bad JSON, missing payload, undecodable audio, unknown
 * type) becomes an error reply; nothing is thrown to the caller, so the
 * connection stays open.
 */
class MessageDispatcher {
public:
    explicit MessageDispatcher(Analysis::VoiceAnalyzer& analyzer);

    /**
     * @brief Handle a raw frame and return the serialized reply
     */
    std::string handle(const std::string& frame);

    /**
     * @brief Handle a frame and return the reply as JSON
     */
    json dispatch(const std::string& frame);

    struct Stats {
        uint64_t framesHandled = 0;
        uint64_t audioAnalyzed = 0;
        uint64_t errorReplies = 0;
    };
    Stats getStats() const;

private:
    json handleAudio(const json& message);

    Analysis::VoiceAnalyzer& analyzer_;
    DSP::PcmDecoder decoder_;

    std::atomic<uint64_t> framesHandled_{0};
    std::atomic<uint64_t> audioAnalyzed_{0};
    std::atomic<uint64_t> errorReplies_{0};
};

} // namespace Protocol
} // namespace VoiceGuard
