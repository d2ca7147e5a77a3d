#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fixtures {

struct AudioCharacteristics {
    float amplitude = 0.5f;
    float noiseLevel = 0.0f;
    float pitchVariation = 0.0f;
};

// Synthetic voice: a fundamental plus decaying harmonics
struct VoiceSpec {
    float fundamentalHz = 150.0f;
    size_t harmonics = 4;
};

class TestDataGenerator {
public:
    TestDataGenerator() = default;

    std::vector<float> generateTone(float frequencyHz, float duration, int sampleRate = 16000,
                                    float amplitude = 0.5f) const;

    std::vector<float> generateVoice(const VoiceSpec& voice, float duration, int sampleRate = 16000,
                                     const AudioCharacteristics& characteristics = {}) const;

    std::vector<float> generateNoise(float duration, float level, int sampleRate = 16000,
                                     unsigned int seed = 42) const;

    std::vector<float> generateSilence(float duration, int sampleRate = 16000) const;

    // Two voices alternating in turns of the given length
    std::vector<float> generateConversation(const VoiceSpec& first, const VoiceSpec& second,
                                            float turnDuration, size_t turns,
                                            int sampleRate = 16000) const;

    static std::vector<float> concatenate(const std::vector<std::vector<float>>& parts);

    // Raw little-endian PCM16 bytes
    static std::vector<uint8_t> toPcm16(const std::vector<float>& samples);

    // PCM16 RIFF/WAVE container
    static std::vector<uint8_t> toWav(const std::vector<float>& samples, int sampleRate = 16000,
                                      int channels = 1);

    // Silent PCM16 chunk of the given byte length
    static std::vector<uint8_t> silentChunk(size_t bytes);

    static float rms(const std::vector<float>& samples);
};

} // namespace fixtures
