#include <gtest/gtest.h>
#include "audio/audio_utils.hpp"
#include "fixtures/test_data_generator.hpp"
#include "utils/error_handler.hpp"
#include <cmath>

using namespace meetscribe::audio;
using fixtures::TestDataGenerator;

class AudioUtilsTest : public ::testing::Test {
protected:
    TestDataGenerator generator;
};

TEST_F(AudioUtilsTest, FormatHelpers) {
    AudioFormat format(16000, 1, 16);
    EXPECT_TRUE(format.isValid());
    EXPECT_EQ(format.bytesPerSecond(), 32000u);
    EXPECT_EQ(format.toString(), "16000Hz, 1 channel(s), 16-bit");

    EXPECT_FALSE(AudioFormat(0, 1).isValid());
    EXPECT_FALSE(AudioFormat(16000, 1, 12).isValid());
}

TEST_F(AudioUtilsTest, EstimateDuration) {
    AudioFormat format(16000, 1, 16);
    EXPECT_DOUBLE_EQ(AudioUtils::estimateDurationMs(32000, format), 1000.0);
    EXPECT_DOUBLE_EQ(AudioUtils::estimateDurationMs(16384, format), 512.0);
    EXPECT_DOUBLE_EQ(AudioUtils::estimateDurationMs(0, format), 0.0);
}

TEST_F(AudioUtilsTest, DecodeRawPcm) {
    auto samples = generator.generateTone(440.0f, 0.1f);
    auto bytes = TestDataGenerator::toPcm16(samples);

    DecodedAudio decoded = AudioUtils::decode(bytes, AudioFormat(16000, 1));
    EXPECT_FALSE(decoded.wavContainer);
    EXPECT_EQ(decoded.samples.size(), samples.size());
    EXPECT_EQ(decoded.format.sampleRate, 16000);
    EXPECT_NEAR(decoded.samples[100], samples[100], 1e-3f);
    EXPECT_NEAR(decoded.durationSeconds(), 0.1, 1e-6);
}

TEST_F(AudioUtilsTest, TrailingOddByteIsIgnored) {
    std::vector<uint8_t> bytes = {0x00, 0x40, 0x00, 0xC0, 0x7F};
    auto samples = AudioUtils::pcm16ToFloat(bytes.data(), bytes.size());
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FLOAT_EQ(samples[0], 0.5f);
    EXPECT_FLOAT_EQ(samples[1], -0.5f);
}

TEST_F(AudioUtilsTest, DecodeWavContainer) {
    auto samples = generator.generateTone(300.0f, 0.05f, 22050);
    std::vector<float> stereo = AudioUtils::convertChannels(samples, 1, 2);
    auto wav = TestDataGenerator::toWav(stereo, 22050, 2);

    ASSERT_TRUE(AudioUtils::isWav(wav));
    DecodedAudio decoded = AudioUtils::decode(wav, AudioFormat());
    EXPECT_TRUE(decoded.wavContainer);
    EXPECT_EQ(decoded.format.sampleRate, 22050);
    EXPECT_EQ(decoded.format.channels, 2);
    EXPECT_EQ(decoded.samples.size(), stereo.size());
    EXPECT_EQ(decoded.frameCount(), samples.size());
}

TEST_F(AudioUtilsTest, RejectsUnsupportedWav) {
    auto wav = TestDataGenerator::toWav(generator.generateSilence(0.01f));
    wav[34] = 24; // bits per sample
    EXPECT_THROW(AudioUtils::decode(wav, AudioFormat()), meetscribe::utils::AudioProcessingException);

    std::vector<uint8_t> noData = {'R', 'I', 'F', 'F', 4, 0, 0, 0, 'W', 'A', 'V', 'E'};
    EXPECT_THROW(AudioUtils::decode(noData, AudioFormat()), meetscribe::utils::AudioProcessingException);
}

TEST_F(AudioUtilsTest, EncodeWavHeader) {
    std::vector<float> samples(100, 0.25f);
    auto wav = AudioUtils::encodeWav(samples, AudioFormat(8000, 1));
    EXPECT_EQ(wav.size(), 44u + 200u);

    DecodedAudio decoded = AudioUtils::decode(wav, AudioFormat());
    EXPECT_EQ(decoded.format.sampleRate, 8000);
    EXPECT_NEAR(decoded.samples[50], 0.25f, 1e-3f);
}

TEST_F(AudioUtilsTest, FloatToPcm16Clamps) {
    EXPECT_EQ(AudioUtils::floatToPcm16(2.0f), 32767);
    EXPECT_EQ(AudioUtils::floatToPcm16(-2.0f), -32767);
    EXPECT_EQ(AudioUtils::floatToPcm16(0.0f), 0);
}

TEST_F(AudioUtilsTest, ResampleChangesLength) {
    auto samples = generator.generateTone(200.0f, 1.0f, 16000);
    auto down = AudioUtils::resample(samples, 1, 16000, 8000);
    EXPECT_EQ(down.size(), 8000u);

    auto up = AudioUtils::resample(samples, 1, 16000, 48000);
    EXPECT_EQ(up.size(), 48000u);
    EXPECT_NEAR(AudioUtils::rms(up), AudioUtils::rms(samples), 0.01f);

    EXPECT_EQ(AudioUtils::resample(samples, 1, 16000, 16000).size(), samples.size());
}

TEST_F(AudioUtilsTest, ConvertChannels) {
    std::vector<float> stereo = {0.2f, 0.4f, -0.2f, -0.6f};
    auto mono = AudioUtils::convertChannels(stereo, 2, 1);
    ASSERT_EQ(mono.size(), 2u);
    EXPECT_FLOAT_EQ(mono[0], 0.3f);
    EXPECT_FLOAT_EQ(mono[1], -0.4f);

    auto back = AudioUtils::convertChannels(mono, 1, 2);
    ASSERT_EQ(back.size(), 4u);
    EXPECT_FLOAT_EQ(back[0], back[1]);
}

TEST_F(AudioUtilsTest, RmsAndPeak) {
    EXPECT_FLOAT_EQ(AudioUtils::rms({}), 0.0f);
    EXPECT_FLOAT_EQ(AudioUtils::rms({0.5f, -0.5f}), 0.5f);
    EXPECT_FLOAT_EQ(AudioUtils::peak({0.1f, -0.8f, 0.3f}), 0.8f);
}
