#include "audio/audio_preprocessor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace meetscribe {
namespace audio {

PreprocessingConfig PreprocessingConfig::fromJson(const nlohmann::json& j) {
    PreprocessingConfig config;
    if (!j.is_object()) {
        return config;
    }
    config.enabled = j.value("enabled", config.enabled);
    config.enableFormatConversion = j.value("enableFormatConversion", config.enableFormatConversion);
    config.enableVolumeNormalization = j.value("enableVolumeNormalization", config.enableVolumeNormalization);
    config.enableNoiseReduction = j.value("enableNoiseReduction", config.enableNoiseReduction);
    config.enableEchoCancellation = j.value("enableEchoCancellation", config.enableEchoCancellation);
    config.targetSampleRate = j.value("targetSampleRate", config.targetSampleRate);
    config.targetChannels = j.value("targetChannels", config.targetChannels);
    config.targetRms = j.value("targetRms", config.targetRms);
    config.highPassCutoffHz = j.value("highPassCutoffHz", config.highPassCutoffHz);
    config.qualityThreshold = j.value("qualityThreshold", config.qualityThreshold);
    config.minimumInputBytes = j.value("minimumInputBytes", config.minimumInputBytes);
    return config;
}

std::string enhancementTypeToString(EnhancementType type) {
    switch (type) {
        case EnhancementType::FORMAT_CONVERSION: return "format_conversion";
        case EnhancementType::VOLUME_NORMALIZATION: return "volume_normalization";
        case EnhancementType::NOISE_REDUCTION: return "noise_reduction";
        case EnhancementType::ECHO_CANCELLATION: return "echo_cancellation";
    }
    return "unknown";
}

// NoiseReductionFilter implementation
NoiseReductionFilter::NoiseReductionFilter(int sampleRate, float cutoffHz) {
    const double rc = 1.0 / (2.0 * M_PI * cutoffHz);
    const double dt = 1.0 / sampleRate;
    alpha_ = static_cast<float>(rc / (rc + dt));
}

std::vector<float> NoiseReductionFilter::process(const std::vector<float>& samples, int channels) const {
    std::vector<float> output(samples.size());
    if (channels <= 0) {
        return samples;
    }

    for (int c = 0; c < channels; ++c) {
        float prevInput = 0.0f;
        float prevOutput = 0.0f;
        for (size_t i = c; i < samples.size(); i += channels) {
            float y = alpha_ * (prevOutput + samples[i] - prevInput);
            prevInput = samples[i];
            prevOutput = y;
            output[i] = y;
        }
    }
    return output;
}

// VolumeNormalizer implementation
VolumeNormalizer::VolumeNormalizer(float targetRms) : targetRms_(targetRms) {}

float VolumeNormalizer::computeGain(const std::vector<float>& samples) const {
    float rms = AudioUtils::rms(samples);
    return rms > 0.0f ? targetRms_ / rms : 1.0f;
}

std::vector<float> VolumeNormalizer::process(const std::vector<float>& samples) const {
    const float gain = computeGain(samples);
    std::vector<float> output(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        output[i] = std::max(-1.0f, std::min(1.0f, samples[i] * gain));
    }
    return output;
}

// EchoCanceller implementation
EchoCanceller::EchoCanceller(int sampleRate) : sampleRate_(sampleRate) {}

std::vector<float> EchoCanceller::process(const std::vector<float>& samples) const {
    const size_t minLag = static_cast<size_t>(sampleRate_ * 0.02);
    const size_t maxLag = std::min(static_cast<size_t>(sampleRate_ * 0.2),
                                   samples.size() / 2);
    if (minLag == 0 || maxLag <= minLag) {
        return samples;
    }

    double energy = 0.0;
    for (float s : samples) {
        energy += static_cast<double>(s) * s;
    }
    if (energy <= 0.0) {
        return samples;
    }

    size_t bestLag = 0;
    double bestCorr = 0.0;
    for (size_t lag = minLag; lag <= maxLag; ++lag) {
        double corr = 0.0;
        for (size_t i = lag; i < samples.size(); ++i) {
            corr += static_cast<double>(samples[i]) * samples[i - lag];
        }
        corr /= energy;
        if (corr > bestCorr) {
            bestCorr = corr;
            bestLag = lag;
        }
    }

    // Weak correlation means no audible reflection
    if (bestLag == 0 || bestCorr < 0.3) {
        return samples;
    }

    std::vector<float> output(samples);
    const float gain = static_cast<float>(std::min(bestCorr, 0.9));
    for (size_t i = bestLag; i < samples.size(); ++i) {
        output[i] = samples[i] - gain * samples[i - bestLag];
    }
    return output;
}

// AudioPreprocessor implementation
AudioPreprocessor::AudioPreprocessor(const AudioFormat& rawFormat)
    : rawFormat_(rawFormat), processedCount_(0), passthroughCount_(0) {
}

PreprocessingResult AudioPreprocessor::passthrough(const std::vector<uint8_t>& audioData) const {
    passthroughCount_++;

    PreprocessingResult result;
    result.processedAudio = audioData;
    result.originalSize = audioData.size();
    result.processedSize = audioData.size();
    result.sampleRate = rawFormat_.sampleRate;
    result.channels = rawFormat_.channels;
    result.durationMs = AudioUtils::estimateDurationMs(audioData.size(), rawFormat_);
    result.qualityScore = 0.0f;
    return result;
}

PreprocessingResult AudioPreprocessor::preprocess(const std::vector<uint8_t>& audioData,
                                                  const PreprocessingConfig& config) const {
    if (!config.enabled || audioData.size() < config.minimumInputBytes) {
        return passthrough(audioData);
    }

    auto startTime = std::chrono::steady_clock::now();

    try {
        DecodedAudio decoded = AudioUtils::decode(audioData, rawFormat_);
        if (decoded.samples.empty()) {
            return passthrough(audioData);
        }

        PreprocessingResult result;
        result.originalSize = audioData.size();

        std::vector<float> samples = std::move(decoded.samples);
        AudioFormat format = decoded.format;

        // Format conversion
        if (config.enableFormatConversion &&
            (format.sampleRate != config.targetSampleRate || format.channels != config.targetChannels)) {
            samples = AudioUtils::convertChannels(samples, format.channels, config.targetChannels);
            samples = AudioUtils::resample(samples, config.targetChannels, format.sampleRate,
                                           config.targetSampleRate);

            AudioEnhancement enhancement;
            enhancement.type = EnhancementType::FORMAT_CONVERSION;
            enhancement.improvement = 0.1f;
            enhancement.parameters["fromSampleRate"] = format.sampleRate;
            enhancement.parameters["fromChannels"] = format.channels;
            enhancement.parameters["targetSampleRate"] = config.targetSampleRate;
            enhancement.parameters["targetChannels"] = config.targetChannels;
            result.enhancements.push_back(enhancement);

            format.sampleRate = config.targetSampleRate;
            format.channels = config.targetChannels;
        }

        // Volume normalization
        if (config.enableVolumeNormalization) {
            VolumeNormalizer normalizer(config.targetRms);
            float before = AudioUtils::rms(samples);
            std::vector<float> normalized = normalizer.process(samples);
            float after = AudioUtils::rms(normalized);

            AudioEnhancement enhancement;
            enhancement.type = EnhancementType::VOLUME_NORMALIZATION;
            enhancement.improvement = std::max(0.0f, after - before);
            enhancement.parameters["targetRms"] = config.targetRms;
            enhancement.parameters["gain"] = normalizer.computeGain(samples);
            result.enhancements.push_back(enhancement);

            samples = std::move(normalized);
        }

        // Noise reduction
        if (config.enableNoiseReduction) {
            NoiseReductionFilter filter(format.sampleRate, config.highPassCutoffHz);
            float before = computeSnr(samples);
            std::vector<float> filtered = filter.process(samples, format.channels);
            float after = computeSnr(filtered);

            AudioEnhancement enhancement;
            enhancement.type = EnhancementType::NOISE_REDUCTION;
            enhancement.improvement = std::max(0.0f, after - before);
            enhancement.parameters["cutoffHz"] = config.highPassCutoffHz;
            result.enhancements.push_back(enhancement);

            samples = std::move(filtered);
        }

        // Echo cancellation
        if (config.enableEchoCancellation) {
            std::vector<float> mono = AudioUtils::convertChannels(samples, format.channels, 1);
            EchoCanceller canceller(format.sampleRate);
            std::vector<float> cleaned = canceller.process(mono);
            samples = AudioUtils::convertChannels(cleaned, 1, format.channels);

            AudioEnhancement enhancement;
            enhancement.type = EnhancementType::ECHO_CANCELLATION;
            enhancement.improvement = 0.15f;
            result.enhancements.push_back(enhancement);
        }

        result.qualityScore = analyzeSamples(samples).overallQuality;
        result.processedAudio = decoded.wavContainer ? AudioUtils::encodeWav(samples, format)
                                                     : AudioUtils::encodePcm16(samples);
        result.processedSize = result.processedAudio.size();
        result.sampleRate = format.sampleRate;
        result.channels = format.channels;
        result.durationMs = format.channels > 0 && format.sampleRate > 0
            ? static_cast<double>(samples.size() / format.channels) / format.sampleRate * 1000.0
            : 0.0;

        processedCount_++;

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime).count();
        utils::Logger::debug("Audio preprocessing completed in " + std::to_string(elapsed / 1000.0) +
                             "ms, quality " + std::to_string(result.qualityScore));

        if (result.qualityScore < config.qualityThreshold) {
            utils::Logger::debug("Chunk quality below threshold: " + std::to_string(result.qualityScore));
        }

        return result;

    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(
            utils::ErrorInfo(utils::ErrorCategory::AUDIO_PROCESSING, utils::ErrorSeverity::WARNING,
                             "Audio preprocessing failed, using passthrough", e.what(),
                             "AudioPreprocessor::preprocess",
                             utils::ErrorContext::getCurrentSessionId()));
        return passthrough(audioData);
    }
}

std::vector<uint8_t> AudioPreprocessor::enhanceAudioQuality(const std::vector<uint8_t>& audioData) const {
    PreprocessingConfig config;
    config.enableFormatConversion = true;
    config.enableVolumeNormalization = true;
    config.enableNoiseReduction = true;
    config.enableEchoCancellation = true;
    return preprocess(audioData, config).processedAudio;
}

AudioQualityReport AudioPreprocessor::detectAudioQuality(const std::vector<uint8_t>& audioData) const {
    DecodedAudio decoded = AudioUtils::decode(audioData, rawFormat_);
    if (decoded.samples.empty()) {
        throw utils::AudioProcessingException("Cannot measure quality of empty audio",
                                              "AudioPreprocessor::detectAudioQuality");
    }
    return analyzeSamples(decoded.samples);
}

AudioQualityReport AudioPreprocessor::analyzeSamples(const std::vector<float>& samples) {
    AudioQualityReport report;
    if (samples.empty()) {
        return report;
    }

    report.signalToNoiseRatio = computeSnr(samples);
    report.volumeLevel = AudioUtils::rms(samples);
    report.clarity = computeClarity(samples);
    report.overallQuality = report.signalToNoiseRatio * 0.4f +
                            report.volumeLevel * 0.3f +
                            report.clarity * 0.3f;

    if (report.signalToNoiseRatio < 0.6f) report.recommendations.push_back("Consider noise reduction");
    if (report.volumeLevel < 0.3f) report.recommendations.push_back("Audio volume is too low");
    if (report.volumeLevel > 0.9f) report.recommendations.push_back("Audio volume is too high");
    if (report.clarity < 0.5f) report.recommendations.push_back("Audio clarity could be improved");

    return report;
}

float AudioPreprocessor::computeSnr(const std::vector<float>& samples) {
    if (samples.empty()) {
        return 0.0f;
    }

    std::vector<float> magnitudes(samples.size());
    std::transform(samples.begin(), samples.end(), magnitudes.begin(),
                   [](float s) { return std::fabs(s); });
    std::sort(magnitudes.begin(), magnitudes.end());

    // Noise floor from the quietest 10% of samples
    const size_t noiseCount = magnitudes.size() / 10;
    double noisePower = 0.0;
    for (size_t i = 0; i < noiseCount; ++i) {
        noisePower += static_cast<double>(magnitudes[i]) * magnitudes[i];
    }
    const double noiseRms = noiseCount > 0 ? std::sqrt(noisePower / noiseCount) : 0.0;
    if (noiseRms <= 0.0) {
        return 1.0f;
    }

    return static_cast<float>(std::min(1.0, AudioUtils::rms(samples) / noiseRms));
}

float AudioPreprocessor::computeClarity(const std::vector<float>& samples) {
    double diffSum = 0.0;
    double totalSum = 0.0;
    for (size_t i = 1; i < samples.size(); ++i) {
        diffSum += std::fabs(samples[i] - samples[i - 1]);
        totalSum += std::fabs(samples[i]);
    }
    return totalSum > 0.0 ? static_cast<float>(std::min(1.0, diffSum / totalSum)) : 0.0f;
}

} // namespace audio
} // namespace meetscribe
