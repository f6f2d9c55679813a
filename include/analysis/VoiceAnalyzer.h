/**
 * @file VoiceAnalyzer.h
 * @brief Placeholder voice spoofing scorer
 *
 * Produces a synthetic fraud score from two signal statistics:
 * - RMS energy
 * - Zero-crossing rate
 *
 * The score is jittered to imitate model uncertainty, scaled by the
 * client-supplied sensitivity and clamped to [0, 1]. There is no trained
 * model behind it.
 */

#pragma once

#include "core/AudioBuffer.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace VoiceGuard {
namespace Analysis {

/**
 * @brief Categorical labels derived from the fraud score
 */
struct Breakdown {
    std::string spectral = "Unknown";   // Normal / Suspicious
    std::string pitch = "Unknown";      // Natural / Anomalous
    std::string noise = "Unknown";      // Clean / Noisy
    std::string prosody = "Unknown";    // Human-like / Robotic
};

/**
 * @brief One analysis record, lives for a single message
 */
struct AnalysisResult {
    double fraudScore = 0.5;            // [0, 1]
    double replayRisk = 0.5;            // [0, 1], replayRatio * fraudScore
    double confidence = 0.0;            // [0, 1]
    Breakdown breakdown;
    std::string transcription = "Analysis failed";
    std::string timestamp;              // ISO-8601 local time
    double audioLengthSeconds = 0.0;
    std::string modelUsed;
    std::optional<std::string> error;   // Set on fallback records only

    bool isFallback() const { return error.has_value(); }
};

/**
 * @brief Scoring constants
 */
struct AnalyzerConfig {
    int sampleRate = 16000;             // Assumed rate of client audio
    int minSamples = 100;               // Shorter chunks are rejected

    double rmsWeight = 3.0;
    double zcrWeight = 2.0;

    // Jitter factor drawn from [jitterMin, jitterMin + jitterSpan)
    double jitterMin = 0.8;
    double jitterSpan = 0.4;

    double replayRatio = 0.7;

    // Confidence drawn from [confidenceFloor, confidenceFloor + confidenceSpan)
    double confidenceFloor = 0.7;
    double confidenceSpan = 0.3;

    double labelThreshold = 0.5;        // Score at which labels flip to the suspicious side
    double silenceRms = 0.001;          // Below this the chunk is reported as silence

    std::optional<uint32_t> randomSeed; // Fixed seed for reproducible runs
};

class VoiceAnalyzer {
public:
    static constexpr const char* kDefaultModel = "balanced";

    explicit VoiceAnalyzer(AnalyzerConfig config = AnalyzerConfig());

    /**
     * @brief Score one chunk of mono audio
     * @param audio Decoded samples (channel 0 is analyzed)
     * @param sensitivity Multiplier applied before clamping (client value / 10)
     * @param model Model label, echoed back unchanged
     * @return Analysis record; a fallback record if the chunk is unusable
     */
    AnalysisResult analyze(const Core::AudioBuffer& audio,
                           double sensitivity,
                           const std::string& model = kDefaultModel);

    /**
     * @brief Constant-shaped record returned on any failure
     */
    static AnalysisResult fallback(const std::string& error);

    /**
     * @brief Canned text describing the score
     */
    static std::string describe(double fraudScore, double rms, double silenceRms = 0.001);

    const AnalyzerConfig& getConfig() const { return config_; }

private:
    AnalysisResult score(const Core::AudioBuffer& audio, double sensitivity,
                         const std::string& model);
    double uniform();
    Breakdown classify(double fraudScore) const;

    AnalyzerConfig config_;

    std::mutex rngMutex_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace Analysis
} // namespace VoiceGuard
