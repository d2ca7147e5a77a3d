#pragma once

#include "audio/audio_utils.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace meetscribe {
namespace audio {

// Audio preprocessing configuration
struct PreprocessingConfig {
    bool enabled = true;
    bool enableFormatConversion = true;
    bool enableVolumeNormalization = true;
    bool enableNoiseReduction = true;
    bool enableEchoCancellation = false;

    int targetSampleRate = 16000;
    int targetChannels = 1;
    float targetRms = 0.1f;
    float highPassCutoffHz = 80.0f;
    float qualityThreshold = 0.6f;

    // Smaller inputs pass through untouched
    size_t minimumInputBytes = 64;

    static PreprocessingConfig fromJson(const nlohmann::json& j);
};

enum class EnhancementType {
    FORMAT_CONVERSION,
    VOLUME_NORMALIZATION,
    NOISE_REDUCTION,
    ECHO_CANCELLATION
};

std::string enhancementTypeToString(EnhancementType type);

struct AudioEnhancement {
    EnhancementType type;
    bool applied = true;
    float improvement = 0.0f;
    std::map<std::string, double> parameters;
};

// Preprocessing result
struct PreprocessingResult {
    std::vector<uint8_t> processedAudio;
    size_t originalSize = 0;
    size_t processedSize = 0;
    int sampleRate = 0;
    int channels = 0;
    double durationMs = 0.0;
    float qualityScore = 0.0f;
    std::vector<AudioEnhancement> enhancements;
};

struct AudioQualityReport {
    float signalToNoiseRatio = 0.0f;
    float volumeLevel = 0.0f;
    float clarity = 0.0f;
    float overallQuality = 0.0f;
    std::vector<std::string> recommendations;
};

// Single-pole high-pass filter used for low-frequency noise removal
class NoiseReductionFilter {
public:
    NoiseReductionFilter(int sampleRate, float cutoffHz);

    // Filters each channel of interleaved audio independently
    std::vector<float> process(const std::vector<float>& samples, int channels) const;

    float getAlpha() const { return alpha_; }

private:
    float alpha_;
};

class VolumeNormalizer {
public:
    explicit VolumeNormalizer(float targetRms = 0.1f);

    // gain = target / RMS, hard-clipped to [-1, 1]; silence is left unchanged
    std::vector<float> process(const std::vector<float>& samples) const;

    float computeGain(const std::vector<float>& samples) const;

private:
    float targetRms_;
};

/**
 * Single-reflection echo suppressor. Finds the strongest autocorrelation lag
 * between 20 ms and 200 ms and subtracts the scaled delayed signal.
 */
class EchoCanceller {
public:
    explicit EchoCanceller(int sampleRate);

    std::vector<float> process(const std::vector<float>& samples) const;

private:
    int sampleRate_;
};

/**
 * Audio preprocessor for incoming session chunks.
 *
 * Failures never escape preprocess(): undecodable or tiny inputs come back
 * unchanged with a zero quality score.
 */
class AudioPreprocessor {
public:
    /**
     * @param rawFormat Format assumed for chunks that are not WAV containers
     */
    explicit AudioPreprocessor(const AudioFormat& rawFormat = AudioFormat());

    /**
     * Run the enabled enhancement steps over a chunk
     * @param audioData WAV or raw PCM16 bytes
     * @param config Steps to apply and their parameters
     * @return Processed bytes in the input's container, quality score and
     *         the list of applied enhancements
     */
    PreprocessingResult preprocess(const std::vector<uint8_t>& audioData,
                                   const PreprocessingConfig& config) const;

    /**
     * Preprocess with every enhancement enabled
     */
    std::vector<uint8_t> enhanceAudioQuality(const std::vector<uint8_t>& audioData) const;

    /**
     * Measure SNR, volume and clarity of a chunk
     * @throws AudioProcessingException if the chunk cannot be decoded
     */
    AudioQualityReport detectAudioQuality(const std::vector<uint8_t>& audioData) const;

    // Quality of already-decoded samples
    static AudioQualityReport analyzeSamples(const std::vector<float>& samples);

    const AudioFormat& getRawFormat() const { return rawFormat_; }

    size_t getProcessedCount() const { return processedCount_; }
    size_t getPassthroughCount() const { return passthroughCount_; }

private:
    PreprocessingResult passthrough(const std::vector<uint8_t>& audioData) const;

    static float computeSnr(const std::vector<float>& samples);
    static float computeClarity(const std::vector<float>& samples);

    AudioFormat rawFormat_;
    mutable std::atomic<size_t> processedCount_;
    mutable std::atomic<size_t> passthroughCount_;
};

} // namespace audio
} // namespace meetscribe
