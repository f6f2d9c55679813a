#pragma once

#include "core/AudioBuffer.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace VoiceGuard {
namespace DSP {

/**
 * @brief WAV reader/writer used by the probe client and the tests
 *
 * Reads 8/16/24-bit integer PCM and 32-bit float RIFF files, skipping
 * chunks other than "fmt " and "data".
 */
class AudioFile {
public:
    enum class Format {
        WAV,
        Unknown
    };

    struct FileInfo {
        Format format = Format::Unknown;
        int sampleRate = 0;
        int numChannels = 0;
        int bitDepth = 0;
        int64_t numSamples = 0;
        double durationSeconds = 0.0;
    };

    AudioFile() = default;
    ~AudioFile() = default;

    /**
     * @brief Load an audio file
     * @return true if successful
     */
    bool load(const std::string& filepath);

    /**
     * @brief Save audio buffer to file
     * @param bitDepth 16, 24, or 32 (float)
     * @return true if successful
     */
    bool save(const std::string& filepath,
              const Core::AudioBuffer& buffer,
              int sampleRate,
              int bitDepth = 16);

    const FileInfo& getInfo() const { return info_; }

    const Core::AudioBuffer& getBuffer() const { return *buffer_; }
    Core::AudioBuffer& getBuffer() { return *buffer_; }

    bool isLoaded() const { return buffer_ != nullptr; }

    /**
     * @brief Detect file format from extension
     */
    static Format detectFormat(const std::string& filepath);

    /**
     * @brief Average all channels into one and linearly resample
     */
    static std::unique_ptr<Core::AudioBuffer> toMono(const Core::AudioBuffer& buffer,
                                                     int sourceRate,
                                                     int targetRate);

    /**
     * @brief Little-endian signed 16-bit bytes for a range of channel 0
     */
    static std::vector<uint8_t> toPcm16(const Core::AudioBuffer& buffer,
                                        int startSample,
                                        int numSamples);

    /**
     * @brief Samples in a span of milliseconds, at least 1 and at most INT_MAX
     */
    static int samplesForDuration(int sampleRate, int milliseconds);

private:
    FileInfo info_;
    std::unique_ptr<Core::AudioBuffer> buffer_;

    bool loadWAV(const std::string& filepath);
    bool saveWAV(const std::string& filepath, const Core::AudioBuffer& buffer, int sampleRate, int bitDepth);
};

} // namespace DSP
} // namespace VoiceGuard
