/**
 * @file VoiceAnalyzer.cpp
 * @brief Placeholder voice spoofing scorer
 */

#include "analysis/VoiceAnalyzer.h"
#include "utils/Time.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace VoiceGuard {
namespace Analysis {

VoiceAnalyzer::VoiceAnalyzer(AnalyzerConfig config)
    : config_(std::move(config))
    , rng_(config_.randomSeed ? *config_.randomSeed : std::random_device{}())
{
    if (config_.sampleRate <= 0) {
        throw std::invalid_argument("Analyzer sample rate must be positive");
    }
    if (config_.minSamples < 1) {
        throw std::invalid_argument("Analyzer minimum sample count must be at least 1");
    }
}

AnalysisResult VoiceAnalyzer::analyze(const Core::AudioBuffer& audio,
                                      double sensitivity,
                                      const std::string& model) {
    try {
        if (audio.getNumSamples() < config_.minSamples) {
            return fallback("Audio too short");
        }
        return score(audio, sensitivity, model);
    } catch (const std::exception& e) {
        std::cerr << "[VoiceAnalyzer] Analysis error: " << e.what() << std::endl;
        return fallback(e.what());
    }
}

AnalysisResult VoiceAnalyzer::score(const Core::AudioBuffer& audio, double sensitivity,
                                    const std::string& model) {
    const double rms = audio.getRMSLevel(0);
    const double zcr = audio.getZeroCrossingRate(0);

    double fraudScore = std::min((rms * config_.rmsWeight + zcr * config_.zcrWeight) / 2.0, 1.0);

    // Simulated model uncertainty
    fraudScore *= config_.jitterMin + uniform() * config_.jitterSpan;
    fraudScore = std::min(fraudScore, 1.0);

    if (!std::isfinite(sensitivity)) {
        sensitivity = 0.0;
    }
    fraudScore = std::clamp(fraudScore * sensitivity, 0.0, 1.0);

    AnalysisResult result;
    result.fraudScore = fraudScore;
    result.replayRisk = std::clamp(fraudScore * config_.replayRatio, 0.0, 1.0);
    result.confidence = std::clamp(config_.confidenceFloor + uniform() * config_.confidenceSpan, 0.0, 1.0);
    result.breakdown = classify(fraudScore);
    result.transcription = describe(fraudScore, rms, config_.silenceRms);
    result.timestamp = Utils::isoTimestamp();
    result.audioLengthSeconds = static_cast<double>(audio.getNumSamples()) / config_.sampleRate;
    result.modelUsed = model;
    return result;
}

AnalysisResult VoiceAnalyzer::fallback(const std::string& error) {
    AnalysisResult result;
    result.error = error;
    result.timestamp = Utils::isoTimestamp();
    return result;
}

std::string VoiceAnalyzer::describe(double fraudScore, double rms, double silenceRms) {
    if (rms < silenceRms) {
        return "[Background noise or silence]";
    }
    if (fraudScore < 0.3) {
        return "Voice appears genuine and natural";
    }
    if (fraudScore < 0.6) {
        return "Voice shows some unusual characteristics";
    }
    return "Voice shows significant anomalies";
}

Breakdown VoiceAnalyzer::classify(double fraudScore) const {
    const bool suspicious = fraudScore >= config_.labelThreshold;

    Breakdown breakdown;
    breakdown.spectral = suspicious ? "Suspicious" : "Normal";
    breakdown.pitch = suspicious ? "Anomalous" : "Natural";
    breakdown.noise = suspicious ? "Noisy" : "Clean";
    breakdown.prosody = suspicious ? "Robotic" : "Human-like";
    return breakdown;
}

double VoiceAnalyzer::uniform() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    return unit_(rng_);
}

} // namespace Analysis
} // namespace VoiceGuard
