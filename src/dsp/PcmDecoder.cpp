#include "dsp/PcmDecoder.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <iostream>

namespace VoiceGuard {
namespace DSP {

namespace {

int16_t readInt16LE(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                (static_cast<uint16_t>(p[1]) << 8));
}

float readFloat32LE(const uint8_t* p) {
    uint32_t bits = static_cast<uint32_t>(p[0]) |
                    (static_cast<uint32_t>(p[1]) << 8) |
                    (static_cast<uint32_t>(p[2]) << 16) |
                    (static_cast<uint32_t>(p[3]) << 24);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace

size_t PcmDecoder::bytesPerSample(SampleFormat format) {
    switch (format) {
        case SampleFormat::Pcm16: return 2;
        case SampleFormat::Float32: return 4;
        case SampleFormat::Pcm8: return 1;
        case SampleFormat::Auto: break;
    }
    return 0;
}

const char* PcmDecoder::formatName(SampleFormat format) {
    switch (format) {
        case SampleFormat::Auto: return "auto";
        case SampleFormat::Pcm16: return "pcm16";
        case SampleFormat::Float32: return "float32";
        case SampleFormat::Pcm8: return "pcm8";
    }
    return "unknown";
}

std::optional<SampleFormat> PcmDecoder::parseFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "auto") return SampleFormat::Auto;
    if (lower == "pcm16" || lower == "int16" || lower == "s16le") return SampleFormat::Pcm16;
    if (lower == "float32" || lower == "f32le") return SampleFormat::Float32;
    if (lower == "pcm8" || lower == "int8" || lower == "s8") return SampleFormat::Pcm8;
    return std::nullopt;
}

std::optional<DecodedAudio> PcmDecoder::decode(const std::vector<uint8_t>& bytes,
                                               SampleFormat requested) const {
    if (bytes.empty()) {
        std::cerr << "[PcmDecoder] Empty audio data received" << std::endl;
        return std::nullopt;
    }

    if (requested != SampleFormat::Auto) {
        auto buffer = decodeAs(bytes, requested);
        if (!buffer) {
            std::cerr << "[PcmDecoder] Payload of " << bytes.size()
                      << " bytes does not fit " << formatName(requested) << std::endl;
            return std::nullopt;
        }
        DecodedAudio result;
        result.buffer = std::move(buffer);
        result.format = requested;
        return result;
    }

    static const SampleFormat kProbeOrder[] = {
        SampleFormat::Pcm16, SampleFormat::Float32
    };

    for (SampleFormat candidate : kProbeOrder) {
        auto buffer = decodeAs(bytes, candidate);
        if (buffer) {
            DecodedAudio result;
            result.buffer = std::move(buffer);
            result.format = candidate;
            return result;
        }
    }

    // Pcm8 accepts every non-empty payload
    DecodedAudio result;
    result.buffer = decodeAs(bytes, SampleFormat::Pcm8);
    result.format = SampleFormat::Pcm8;
    return result;
}

std::unique_ptr<Core::AudioBuffer> PcmDecoder::decodeAs(const std::vector<uint8_t>& bytes,
                                                        SampleFormat format) const {
    const size_t width = bytesPerSample(format);
    if (width == 0 || bytes.size() % width != 0) {
        return nullptr;
    }

    const size_t numSamples = bytes.size() / width;
    if (numSamples == 0) {
        return nullptr;
    }

    auto buffer = std::make_unique<Core::AudioBuffer>(1, static_cast<int>(numSamples));
    float* out = buffer->getWritePointer(0);
    const uint8_t* in = bytes.data();

    bool allNaN = true;
    for (size_t i = 0; i < numSamples; ++i) {
        float sample = 0.0f;
        switch (format) {
            case SampleFormat::Pcm16:
                sample = readInt16LE(in + i * 2) / 32768.0f;
                break;
            case SampleFormat::Float32:
                sample = readFloat32LE(in + i * 4);
                break;
            case SampleFormat::Pcm8:
                sample = static_cast<int8_t>(in[i]) / 128.0f;
                break;
            case SampleFormat::Auto:
                return nullptr;
        }
        if (!std::isnan(sample)) {
            allNaN = false;
        }
        out[i] = sample;
    }

    if (allNaN) {
        return nullptr;
    }

    for (size_t i = 0; i < numSamples; ++i) {
        if (!std::isfinite(out[i])) {
            out[i] = 0.0f;
        }
    }

    return buffer;
}

} // namespace DSP
} // namespace VoiceGuard
