#include "core/transcription_types.hpp"
#include "utils/error_handler.hpp"

namespace meetscribe {
namespace core {

std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::INITIALIZING: return "initializing";
        case SessionStatus::ACTIVE: return "active";
        case SessionStatus::PAUSED: return "paused";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::CANCELLED: return "cancelled";
        case SessionStatus::ERROR: return "error";
    }
    return "unknown";
}

bool isTerminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED ||
           status == SessionStatus::CANCELLED ||
           status == SessionStatus::ERROR;
}

std::string transcriptStatusToString(TranscriptStatus status) {
    switch (status) {
        case TranscriptStatus::PENDING: return "pending";
        case TranscriptStatus::PROCESSING: return "processing";
        case TranscriptStatus::COMPLETED: return "completed";
        case TranscriptStatus::FAILED: return "failed";
        case TranscriptStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

audio::AudioFormat TranscriptionConfig::audioFormat() const {
    return audio::AudioFormat(sampleRate, channels, bitDepth);
}

void TranscriptionConfig::applyDefaults() {
    if (modelName.empty()) {
        modelName = models::defaultModelOrder().front();
    }
    preprocessing.targetSampleRate = sampleRate;
    preprocessing.targetChannels = channels;
    preprocessing.qualityThreshold = confidenceThreshold;
}

void TranscriptionConfig::validate() const {
    using utils::ConfigurationException;

    if (chunkSize == 0) {
        throw ConfigurationException("chunkSize must be positive");
    }
    if (overlapSize >= chunkSize) {
        throw ConfigurationException("overlapSize must be smaller than chunkSize",
                                     std::to_string(overlapSize) + " >= " + std::to_string(chunkSize));
    }
    if (confidenceThreshold < 0.0f || confidenceThreshold > 1.0f) {
        throw ConfigurationException("confidenceThreshold must be within [0, 1]");
    }
    if (!audioFormat().isValid()) {
        throw ConfigurationException("Unsupported session audio format", audioFormat().toString());
    }
    if (bitDepth != 16) {
        throw ConfigurationException("Only 16-bit PCM sessions are supported");
    }
    if (language.empty()) {
        throw ConfigurationException("language must not be empty");
    }
    if (diarization.maxSpeakers < diarization.minSpeakers) {
        throw ConfigurationException("diarization.maxSpeakers must not be below minSpeakers");
    }
}

TranscriptionConfig TranscriptionConfig::fromJson(const nlohmann::json& j) {
    TranscriptionConfig config;
    if (!j.is_object()) {
        return config;
    }

    try {
        config.modelName = j.value("modelName", config.modelName);
        config.language = j.value("language", config.language);
        config.enableSpeakerDiarization = j.value("enableSpeakerDiarization", config.enableSpeakerDiarization);
        config.chunkSize = j.value("chunkSize", config.chunkSize);
        config.overlapSize = j.value("overlapSize", config.overlapSize);
        config.confidenceThreshold = j.value("confidenceThreshold", config.confidenceThreshold);
        config.sampleRate = j.value("sampleRate", config.sampleRate);
        config.channels = j.value("channels", config.channels);
        config.bitDepth = j.value("bitDepth", config.bitDepth);

        if (j.contains("fallbackModels") && !j["fallbackModels"].is_null()) {
            config.fallbackModels = j["fallbackModels"].get<std::vector<std::string>>();
        }
        if (j.contains("preprocessing")) {
            config.preprocessing = audio::PreprocessingConfig::fromJson(j["preprocessing"]);
        }
        if (j.contains("diarization")) {
            config.diarization = diarization::DiarizationConfig::fromJson(j["diarization"]);
        }
    } catch (const nlohmann::json::type_error& e) {
        throw utils::ConfigurationException("Invalid transcription settings", e.what());
    }

    return config;
}

} // namespace core
} // namespace meetscribe
