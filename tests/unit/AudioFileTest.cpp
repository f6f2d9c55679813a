#include <gtest/gtest.h>
#include "dsp/AudioFile.h"
#include "core/AudioBuffer.h"
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace VoiceGuard::DSP;
using namespace VoiceGuard::Core;

class AudioFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        testFilePath = (std::filesystem::temp_directory_path() / "voiceguard_test.wav").string();
    }

    void TearDown() override {
        if (std::filesystem::exists(testFilePath)) {
            std::filesystem::remove(testFilePath);
        }
    }

    void writeBytes(const std::vector<uint8_t>& bytes) {
        std::ofstream out(testFilePath, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    static void appendLE(std::vector<uint8_t>& bytes, uint32_t value, int width) {
        for (int i = 0; i < width; ++i) {
            bytes.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    }

    static void appendTag(std::vector<uint8_t>& bytes, const char* tag) {
        bytes.insert(bytes.end(), tag, tag + 4);
    }

    std::string testFilePath;
};

TEST_F(AudioFileTest, DetectFormat) {
    EXPECT_EQ(AudioFile::detectFormat("test.wav"), AudioFile::Format::WAV);
    EXPECT_EQ(AudioFile::detectFormat("TEST.WAV"), AudioFile::Format::WAV);
    EXPECT_EQ(AudioFile::detectFormat("test.flac"), AudioFile::Format::Unknown);
    EXPECT_EQ(AudioFile::detectFormat("noextension"), AudioFile::Format::Unknown);
}

TEST_F(AudioFileTest, SaveAndLoad16Bit) {
    const int numChannels = 2;
    const int numSamples = 16000;
    AudioBuffer buffer(numChannels, numSamples);

    for (int ch = 0; ch < numChannels; ++ch) {
        float* data = buffer.getWritePointer(ch);
        for (int i = 0; i < numSamples; ++i) {
            data[i] = 0.5f * std::sin(2.0 * M_PI * 440.0 * i / 16000.0);
        }
    }

    AudioFile audioFile;
    EXPECT_TRUE(audioFile.save(testFilePath, buffer, 16000, 16));

    AudioFile loadedFile;
    ASSERT_TRUE(loadedFile.load(testFilePath));

    const auto& info = loadedFile.getInfo();
    EXPECT_EQ(info.format, AudioFile::Format::WAV);
    EXPECT_EQ(info.sampleRate, 16000);
    EXPECT_EQ(info.numChannels, 2);
    EXPECT_EQ(info.bitDepth, 16);
    EXPECT_EQ(info.numSamples, numSamples);
    EXPECT_DOUBLE_EQ(info.durationSeconds, 1.0);

    const AudioBuffer& loaded = loadedFile.getBuffer();
    for (int ch = 0; ch < numChannels; ++ch) {
        const float* original = buffer.getReadPointer(ch);
        const float* data = loaded.getReadPointer(ch);
        for (int i = 0; i < numSamples; ++i) {
            EXPECT_NEAR(data[i], original[i], 2.0f / 32768.0f);
        }
    }
}

TEST_F(AudioFileTest, SaveAndLoadFloat) {
    AudioBuffer buffer(1, 256);
    float* data = buffer.getWritePointer(0);
    for (int i = 0; i < 256; ++i) {
        data[i] = (i % 2 == 0) ? 0.25f : -0.75f;
    }

    AudioFile audioFile;
    ASSERT_TRUE(audioFile.save(testFilePath, buffer, 8000, 32));

    AudioFile loadedFile;
    ASSERT_TRUE(loadedFile.load(testFilePath));
    EXPECT_EQ(loadedFile.getInfo().bitDepth, 32);

    const float* loaded = loadedFile.getBuffer().getReadPointer(0);
    for (int i = 0; i < 256; ++i) {
        EXPECT_FLOAT_EQ(loaded[i], data[i]);
    }
}

TEST_F(AudioFileTest, SkipsUnknownChunks) {
    std::vector<uint8_t> bytes;
    appendTag(bytes, "RIFF");
    appendLE(bytes, 0, 4);
    appendTag(bytes, "WAVE");

    // Odd-sized LIST chunk with pad byte
    appendTag(bytes, "LIST");
    appendLE(bytes, 3, 4);
    bytes.insert(bytes.end(), {'a', 'b', 'c', 0});

    appendTag(bytes, "fmt ");
    appendLE(bytes, 16, 4);
    appendLE(bytes, 1, 2);       // PCM
    appendLE(bytes, 1, 2);       // mono
    appendLE(bytes, 16000, 4);
    appendLE(bytes, 32000, 4);
    appendLE(bytes, 2, 2);
    appendLE(bytes, 16, 2);

    appendTag(bytes, "data");
    appendLE(bytes, 4, 4);
    appendLE(bytes, 0x4000, 2);  // 0.5
    appendLE(bytes, 0xC000, 2);  // -0.5

    writeBytes(bytes);

    AudioFile audioFile;
    ASSERT_TRUE(audioFile.load(testFilePath));
    EXPECT_EQ(audioFile.getInfo().numSamples, 2);
    EXPECT_FLOAT_EQ(audioFile.getBuffer().getReadPointer(0)[0], 0.5f);
    EXPECT_FLOAT_EQ(audioFile.getBuffer().getReadPointer(0)[1], -0.5f);
}

TEST_F(AudioFileTest, RejectsInvalidFiles) {
    AudioFile audioFile;
    EXPECT_FALSE(audioFile.load("/nonexistent/file.wav"));
    EXPECT_FALSE(audioFile.load("clip.mp3"));

    writeBytes({'n', 'o', 't', ' ', 'a', ' ', 'w', 'a', 'v', 'e', '!', '!'});
    EXPECT_FALSE(audioFile.load(testFilePath));
    EXPECT_FALSE(audioFile.isLoaded());
}

TEST_F(AudioFileTest, RejectsUnsupportedBitDepth) {
    AudioBuffer buffer(1, 10);
    AudioFile audioFile;
    EXPECT_FALSE(audioFile.save(testFilePath, buffer, 16000, 12));
}

TEST_F(AudioFileTest, ToMonoAveragesChannels) {
    AudioBuffer stereo(2, 100);
    for (int i = 0; i < 100; ++i) {
        stereo.getWritePointer(0)[i] = 0.2f;
        stereo.getWritePointer(1)[i] = 0.6f;
    }

    auto mono = AudioFile::toMono(stereo, 16000, 16000);
    ASSERT_EQ(mono->getNumChannels(), 1);
    ASSERT_EQ(mono->getNumSamples(), 100);
    for (int i = 0; i < 100; ++i) {
        EXPECT_NEAR(mono->getReadPointer(0)[i], 0.4f, 1e-6f);
    }
}

TEST_F(AudioFileTest, ToMonoResamples) {
    AudioBuffer buffer(1, 48000);
    float* data = buffer.getWritePointer(0);
    for (int i = 0; i < 48000; ++i) {
        data[i] = static_cast<float>(i) / 48000.0f;
    }

    auto mono = AudioFile::toMono(buffer, 48000, 16000);
    ASSERT_EQ(mono->getNumSamples(), 16000);
    // Every third input sample
    EXPECT_NEAR(mono->getReadPointer(0)[100], 300.0f / 48000.0f, 1e-6f);

    EXPECT_THROW(AudioFile::toMono(buffer, 0, 16000), std::invalid_argument);
}

TEST_F(AudioFileTest, ToPcm16) {
    AudioBuffer buffer(1, 4);
    float* data = buffer.getWritePointer(0);
    data[0] = 0.0f;
    data[1] = 1.0f;
    data[2] = -2.0f;  // clamped
    data[3] = 0.5f;

    std::vector<uint8_t> bytes = AudioFile::toPcm16(buffer, 0, 4);
    ASSERT_EQ(bytes.size(), 8u);
    EXPECT_EQ(bytes[0], 0x00);
    EXPECT_EQ(bytes[1], 0x00);
    EXPECT_EQ(bytes[2], 0xFF);   // 32767
    EXPECT_EQ(bytes[3], 0x7F);
    EXPECT_EQ(bytes[4], 0x01);   // -32767
    EXPECT_EQ(bytes[5], 0x80);

    // Ranges past the end are truncated
    EXPECT_EQ(AudioFile::toPcm16(buffer, 3, 10).size(), 2u);
    EXPECT_TRUE(AudioFile::toPcm16(buffer, 4, 10).empty());

    // Lengths near INT_MAX must not overflow the end index
    EXPECT_EQ(AudioFile::toPcm16(buffer, 2, std::numeric_limits<int>::max()).size(), 4u);
}

TEST_F(AudioFileTest, SamplesForDuration) {
    EXPECT_EQ(AudioFile::samplesForDuration(16000, 500), 8000);
    EXPECT_EQ(AudioFile::samplesForDuration(16000, 60000), 960000);

    // Always at least one sample
    EXPECT_EQ(AudioFile::samplesForDuration(16000, 0), 1);
    EXPECT_EQ(AudioFile::samplesForDuration(100, 1), 1);

    // 16000 * 200000 overflows 32-bit arithmetic
    EXPECT_EQ(AudioFile::samplesForDuration(16000, 200000), 3200000);
    EXPECT_EQ(AudioFile::samplesForDuration(16000, std::numeric_limits<int>::max()),
              std::numeric_limits<int>::max());
}
