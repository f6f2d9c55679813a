#pragma once

#include "core/AudioBuffer.h"
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace VoiceGuard {
namespace DSP {

/**
 * @brief Raw sample layouts accepted from clients (all little-endian, mono)
 */
enum class SampleFormat {
    Auto,       // Probe Pcm16, then Float32, then Pcm8
    Pcm16,      // signed 16-bit, scaled by 1/32768
    Float32,    // IEEE-754 single precision, unscaled
    Pcm8        // signed 8-bit, scaled by 1/128
};

struct DecodedAudio {
    std::unique_ptr<Core::AudioBuffer> buffer;
    SampleFormat format = SampleFormat::Auto;   // Layout actually used
};

/**
 * @brief Turns an undescribed byte payload into normalized float samples
 *
 * Clients send bare sample bytes with no header, so in Auto mode the
 * decoder guesses. A layout is rejected when the byte count is not a
 * multiple of its sample size or when every decoded sample is NaN.
 * Non-finite samples that survive are zeroed.
 */
class PcmDecoder {
public:
    /**
     * @brief Decode bytes into a single-channel buffer
     * @param bytes Raw payload
     * @param requested Layout to use, or Auto to probe
     * @return Decoded audio, or std::nullopt if the payload is empty or does
     *         not fit a pinned layout
     */
    std::optional<DecodedAudio> decode(const std::vector<uint8_t>& bytes,
                                       SampleFormat requested = SampleFormat::Auto) const;

    /**
     * @brief Parse a client format hint ("auto", "pcm16", "float32", "pcm8")
     */
    static std::optional<SampleFormat> parseFormat(const std::string& name);

    static const char* formatName(SampleFormat format);
    static size_t bytesPerSample(SampleFormat format);

private:
    std::unique_ptr<Core::AudioBuffer> decodeAs(const std::vector<uint8_t>& bytes,
                                                SampleFormat format) const;
};

} // namespace DSP
} // namespace VoiceGuard
