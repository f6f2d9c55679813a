#pragma once

#include <vector>
#include <memory>

namespace VoiceGuard {
namespace Core {

/**
 * @brief Multi-channel float sample buffer with RAII ownership
 *
 * Decoded client audio lands here before analysis. Samples are stored
 * planar (one contiguous block per channel) and normalized to [-1, 1].
 */
class AudioBuffer {
public:
    /**
     * @brief Construct audio buffer with specified channels and size
     * @throws std::invalid_argument if either dimension is not positive
     */
    AudioBuffer(int numChannels, int numSamples);

    ~AudioBuffer();

    // Move semantics
    AudioBuffer(AudioBuffer&& other) noexcept;
    AudioBuffer& operator=(AudioBuffer&& other) noexcept;

    // Disable copying
    AudioBuffer(const AudioBuffer&) = delete;
    AudioBuffer& operator=(const AudioBuffer&) = delete;

    int getNumChannels() const { return numChannels_; }
    int getNumSamples() const { return numSamples_; }

    /**
     * @brief Get read pointer for a channel
     * @throws std::out_of_range for an invalid channel index
     */
    const float* getReadPointer(int channel) const;

    /**
     * @brief Get write pointer for a channel
     * @throws std::out_of_range for an invalid channel index
     */
    float* getWritePointer(int channel);

    /**
     * @brief Get RMS (Root Mean Square) level for a channel
     */
    float getRMSLevel(int channel) const;

    /**
     * @brief Fraction of adjacent sample pairs whose sign differs
     *
     * Signs are taken as -1, 0 or +1, so leaving or entering exact silence
     * counts as a crossing. The count is divided by the number of samples.
     */
    float getZeroCrossingRate(int channel) const;

private:
    int numChannels_;
    int numSamples_;
    std::vector<float*> channels_;
    std::unique_ptr<float[]> data_;

    void allocate();
    void deallocate();
};

} // namespace Core
} // namespace VoiceGuard
