#include "core/AudioBuffer.h"
#include <stdexcept>
#include <cmath>
#include <algorithm>

namespace VoiceGuard {
namespace Core {

namespace {

int signOf(float value) {
    if (value > 0.0f) return 1;
    if (value < 0.0f) return -1;
    return 0;
}

} // namespace

AudioBuffer::AudioBuffer(int numChannels, int numSamples)
    : numChannels_(numChannels), numSamples_(numSamples) {
    if (numChannels <= 0 || numSamples <= 0) {
        throw std::invalid_argument("Invalid buffer dimensions");
    }
    allocate();
}

AudioBuffer::~AudioBuffer() {
    deallocate();
}

AudioBuffer::AudioBuffer(AudioBuffer&& other) noexcept
    : numChannels_(other.numChannels_),
      numSamples_(other.numSamples_),
      channels_(std::move(other.channels_)),
      data_(std::move(other.data_)) {
    other.numChannels_ = 0;
    other.numSamples_ = 0;
}

AudioBuffer& AudioBuffer::operator=(AudioBuffer&& other) noexcept {
    if (this != &other) {
        deallocate();
        numChannels_ = other.numChannels_;
        numSamples_ = other.numSamples_;
        channels_ = std::move(other.channels_);
        data_ = std::move(other.data_);
        other.numChannels_ = 0;
        other.numSamples_ = 0;
    }
    return *this;
}

const float* AudioBuffer::getReadPointer(int channel) const {
    if (channel < 0 || channel >= numChannels_) {
        throw std::out_of_range("Channel index out of range");
    }
    return channels_[channel];
}

float* AudioBuffer::getWritePointer(int channel) {
    if (channel < 0 || channel >= numChannels_) {
        throw std::out_of_range("Channel index out of range");
    }
    return channels_[channel];
}

float AudioBuffer::getRMSLevel(int channel) const {
    const float* data = getReadPointer(channel);
    double sum = 0.0;

    for (int i = 0; i < numSamples_; ++i) {
        sum += static_cast<double>(data[i]) * data[i];
    }

    return static_cast<float>(std::sqrt(sum / numSamples_));
}

float AudioBuffer::getZeroCrossingRate(int channel) const {
    const float* data = getReadPointer(channel);
    int crossings = 0;

    for (int i = 1; i < numSamples_; ++i) {
        if (signOf(data[i]) != signOf(data[i - 1])) {
            ++crossings;
        }
    }

    return static_cast<float>(crossings) / numSamples_;
}

void AudioBuffer::allocate() {
    size_t totalSamples = static_cast<size_t>(numChannels_) * numSamples_;
    data_ = std::make_unique<float[]>(totalSamples);
    std::fill_n(data_.get(), totalSamples, 0.0f);

    channels_.resize(numChannels_);
    for (int i = 0; i < numChannels_; ++i) {
        channels_[i] = data_.get() + (static_cast<size_t>(i) * numSamples_);
    }
}

void AudioBuffer::deallocate() {
    channels_.clear();
    data_.reset();
}

} // namespace Core
} // namespace VoiceGuard
