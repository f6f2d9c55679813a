#include "dsp/AudioFile.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace VoiceGuard {
namespace DSP {

namespace {

// Canonical 44-byte header written by saveWAV
struct WAVHeader {
    char riff[4];           // "RIFF"
    uint32_t fileSize;      // Total file size - 8
    char wave[4];           // "WAVE"
    char fmt[4];            // "fmt "
    uint32_t fmtSize;       // Format chunk size
    uint16_t audioFormat;   // Audio format (1 = PCM, 3 = float)
    uint16_t numChannels;   // Number of channels
    uint32_t sampleRate;    // Sample rate
    uint32_t byteRate;      // Byte rate
    uint16_t blockAlign;    // Block align
    uint16_t bitsPerSample; // Bits per sample
    char data[4];           // "data"
    uint32_t dataSize;      // Data chunk size
};

uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

bool AudioFile::load(const std::string& filepath) {
    Format format = detectFormat(filepath);

    if (format == Format::WAV) {
        return loadWAV(filepath);
    }

    std::cerr << "[AudioFile] Unsupported format: " << filepath << std::endl;
    return false;
}

bool AudioFile::save(const std::string& filepath,
                     const Core::AudioBuffer& buffer,
                     int sampleRate,
                     int bitDepth) {
    Format format = detectFormat(filepath);

    if (format == Format::WAV) {
        return saveWAV(filepath, buffer, sampleRate, bitDepth);
    }

    std::cerr << "[AudioFile] Unsupported format: " << filepath << std::endl;
    return false;
}

AudioFile::Format AudioFile::detectFormat(const std::string& filepath) {
    size_t dotPos = filepath.find_last_of('.');
    if (dotPos == std::string::npos) {
        return Format::Unknown;
    }

    std::string ext = filepath.substr(dotPos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    if (ext == "wav" || ext == "wave") return Format::WAV;

    return Format::Unknown;
}

bool AudioFile::loadWAV(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[AudioFile] Failed to open: " << filepath << std::endl;
        return false;
    }

    uint8_t riff[12];
    if (!file.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
        std::memcmp(riff, "RIFF", 4) != 0 ||
        std::memcmp(riff + 8, "WAVE", 4) != 0) {
        std::cerr << "[AudioFile] Invalid WAV file: " << filepath << std::endl;
        return false;
    }

    uint16_t audioFormat = 0;
    uint16_t numChannels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    bool haveFmt = false;
    std::vector<uint8_t> data;
    bool haveData = false;

    // Walk chunks until both fmt and data are found
    uint8_t chunkHeader[8];
    while (!haveData && file.read(reinterpret_cast<char*>(chunkHeader), sizeof(chunkHeader))) {
        uint32_t chunkSize = readLE32(chunkHeader + 4);

        if (std::memcmp(chunkHeader, "fmt ", 4) == 0) {
            if (chunkSize < 16) {
                std::cerr << "[AudioFile] Truncated fmt chunk" << std::endl;
                return false;
            }
            std::vector<uint8_t> fmt(chunkSize);
            if (!file.read(reinterpret_cast<char*>(fmt.data()), chunkSize)) {
                break;
            }
            audioFormat = readLE16(&fmt[0]);
            numChannels = readLE16(&fmt[2]);
            sampleRate = readLE32(&fmt[4]);
            bitsPerSample = readLE16(&fmt[14]);
            // WAVE_FORMAT_EXTENSIBLE carries the real format in the sub-GUID
            if (audioFormat == 0xFFFE && chunkSize >= 26) {
                audioFormat = readLE16(&fmt[24]);
            }
            if (chunkSize & 1) {
                file.seekg(1, std::ios::cur);
            }
            haveFmt = true;
        } else if (std::memcmp(chunkHeader, "data", 4) == 0) {
            data.resize(chunkSize);
            file.read(reinterpret_cast<char*>(data.data()), chunkSize);
            // Tolerate a data size that overruns the file
            data.resize(static_cast<size_t>(file.gcount()));
            haveData = true;
        } else {
            file.seekg(chunkSize + (chunkSize & 1), std::ios::cur);
        }
    }

    if (!haveFmt || !haveData) {
        std::cerr << "[AudioFile] Missing fmt or data chunk: " << filepath << std::endl;
        return false;
    }

    const bool isFloat = audioFormat == 3 && bitsPerSample == 32;
    const bool isPcm = audioFormat == 1 &&
                       (bitsPerSample == 8 || bitsPerSample == 16 || bitsPerSample == 24 || bitsPerSample == 32);
    if ((!isFloat && !isPcm) || numChannels == 0 || sampleRate == 0) {
        std::cerr << "[AudioFile] Unsupported WAV encoding (format " << audioFormat
                  << ", " << bitsPerSample << " bit)" << std::endl;
        return false;
    }

    const int bytesPerSample = bitsPerSample / 8;
    const size_t frameSize = static_cast<size_t>(bytesPerSample) * numChannels;
    const int64_t numSamples = static_cast<int64_t>(data.size() / frameSize);
    if (numSamples == 0) {
        std::cerr << "[AudioFile] No samples in: " << filepath << std::endl;
        return false;
    }

    // Set file info
    info_.format = Format::WAV;
    info_.sampleRate = static_cast<int>(sampleRate);
    info_.numChannels = numChannels;
    info_.bitDepth = bitsPerSample;
    info_.numSamples = numSamples;
    info_.durationSeconds = static_cast<double>(numSamples) / sampleRate;

    buffer_ = std::make_unique<Core::AudioBuffer>(numChannels, static_cast<int>(numSamples));

    // Convert to float and deinterleave
    for (int ch = 0; ch < numChannels; ++ch) {
        float* channelData = buffer_->getWritePointer(ch);
        for (int64_t i = 0; i < numSamples; ++i) {
            const uint8_t* p = &data[i * frameSize + ch * bytesPerSample];
            float sample = 0.0f;

            if (isFloat) {
                uint32_t bits = readLE32(p);
                std::memcpy(&sample, &bits, sizeof(sample));
                if (!std::isfinite(sample)) sample = 0.0f;
            } else if (bitsPerSample == 8) {
                // 8-bit WAV is unsigned
                sample = (static_cast<int>(p[0]) - 128) / 128.0f;
            } else if (bitsPerSample == 16) {
                sample = static_cast<int16_t>(readLE16(p)) / 32768.0f;
            } else if (bitsPerSample == 24) {
                int32_t value = (p[2] << 16) | (p[1] << 8) | p[0];
                // Sign extend
                if (value & 0x800000) {
                    value |= ~0xFFFFFF;
                }
                sample = value / 8388608.0f;
            } else {
                sample = static_cast<float>(static_cast<int32_t>(readLE32(p)) / 2147483648.0);
            }

            channelData[i] = sample;
        }
    }

    std::cout << "[AudioFile] Loaded: " << filepath << " ("
              << info_.numChannels << " ch, "
              << info_.sampleRate << " Hz, "
              << info_.bitDepth << " bit, "
              << info_.durationSeconds << " sec)" << std::endl;

    return true;
}

bool AudioFile::saveWAV(const std::string& filepath,
                        const Core::AudioBuffer& buffer,
                        int sampleRate,
                        int bitDepth) {
    if (bitDepth != 16 && bitDepth != 24 && bitDepth != 32) {
        std::cerr << "[AudioFile] Unsupported bit depth: " << bitDepth << std::endl;
        return false;
    }

    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[AudioFile] Failed to create: " << filepath << std::endl;
        return false;
    }

    int numChannels = buffer.getNumChannels();
    int numSamples = buffer.getNumSamples();
    int bytesPerSample = bitDepth / 8;
    uint32_t dataSize = numSamples * numChannels * bytesPerSample;

    WAVHeader header;
    std::memcpy(header.riff, "RIFF", 4);
    header.fileSize = sizeof(WAVHeader) - 8 + dataSize;
    std::memcpy(header.wave, "WAVE", 4);
    std::memcpy(header.fmt, "fmt ", 4);
    header.fmtSize = 16;
    header.audioFormat = (bitDepth == 32) ? 3 : 1;
    header.numChannels = numChannels;
    header.sampleRate = sampleRate;
    header.byteRate = sampleRate * numChannels * bytesPerSample;
    header.blockAlign = numChannels * bytesPerSample;
    header.bitsPerSample = bitDepth;
    std::memcpy(header.data, "data", 4);
    header.dataSize = dataSize;

    file.write(reinterpret_cast<const char*>(&header), sizeof(WAVHeader));

    // Interleave into little-endian bytes
    std::vector<uint8_t> bytes(dataSize);
    for (int i = 0; i < numSamples; ++i) {
        for (int ch = 0; ch < numChannels; ++ch) {
            float sample = buffer.getReadPointer(ch)[i];
            uint8_t* out = &bytes[(static_cast<size_t>(i) * numChannels + ch) * bytesPerSample];

            if (bitDepth == 16) {
                int16_t value = static_cast<int16_t>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
                out[0] = value & 0xFF;
                out[1] = (value >> 8) & 0xFF;
            } else if (bitDepth == 24) {
                int32_t value = static_cast<int32_t>(std::clamp(sample, -1.0f, 1.0f) * 8388607.0f);
                out[0] = value & 0xFF;
                out[1] = (value >> 8) & 0xFF;
                out[2] = (value >> 16) & 0xFF;
            } else {
                uint32_t bits;
                std::memcpy(&bits, &sample, sizeof(bits));
                out[0] = bits & 0xFF;
                out[1] = (bits >> 8) & 0xFF;
                out[2] = (bits >> 16) & 0xFF;
                out[3] = (bits >> 24) & 0xFF;
            }
        }
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    if (!file) {
        std::cerr << "[AudioFile] Write failed: " << filepath << std::endl;
        return false;
    }

    std::cout << "[AudioFile] Saved: " << filepath << " ("
              << numChannels << " ch, "
              << sampleRate << " Hz, "
              << bitDepth << " bit)" << std::endl;

    return true;
}

std::unique_ptr<Core::AudioBuffer> AudioFile::toMono(const Core::AudioBuffer& buffer,
                                                     int sourceRate,
                                                     int targetRate) {
    if (sourceRate <= 0 || targetRate <= 0) {
        throw std::invalid_argument("Sample rates must be positive");
    }

    const int numChannels = buffer.getNumChannels();
    const int inSamples = buffer.getNumSamples();

    std::vector<float> mixed(inSamples, 0.0f);
    for (int ch = 0; ch < numChannels; ++ch) {
        const float* data = buffer.getReadPointer(ch);
        for (int i = 0; i < inSamples; ++i) {
            mixed[i] += data[i] / numChannels;
        }
    }

    const double ratio = static_cast<double>(sourceRate) / targetRate;
    const int outSamples = std::max(1, static_cast<int>(std::floor(inSamples / ratio)));

    auto mono = std::make_unique<Core::AudioBuffer>(1, outSamples);
    float* out = mono->getWritePointer(0);

    for (int i = 0; i < outSamples; ++i) {
        double position = i * ratio;
        int index = static_cast<int>(position);
        if (index >= inSamples - 1) {
            out[i] = mixed[inSamples - 1];
            continue;
        }
        double frac = position - index;
        out[i] = static_cast<float>(mixed[index] * (1.0 - frac) + mixed[index + 1] * frac);
    }

    return mono;
}

std::vector<uint8_t> AudioFile::toPcm16(const Core::AudioBuffer& buffer,
                                        int startSample,
                                        int numSamples) {
    const int total = buffer.getNumSamples();
    const int begin = std::clamp(startSample, 0, total);
    const int end = static_cast<int>(std::min<int64_t>(
        static_cast<int64_t>(begin) + std::max(0, numSamples), total));

    const float* data = buffer.getReadPointer(0);
    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<size_t>(end - begin) * 2);

    for (int i = begin; i < end; ++i) {
        int16_t value = static_cast<int16_t>(std::clamp(data[i], -1.0f, 1.0f) * 32767.0f);
        bytes.push_back(static_cast<uint8_t>(value & 0xFF));
        bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }

    return bytes;
}

int AudioFile::samplesForDuration(int sampleRate, int milliseconds) {
    const int64_t samples = static_cast<int64_t>(sampleRate) * milliseconds / 1000;
    return static_cast<int>(std::clamp<int64_t>(samples, 1, std::numeric_limits<int>::max()));
}

} // namespace DSP
} // namespace VoiceGuard
