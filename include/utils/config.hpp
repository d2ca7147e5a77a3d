#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace utils {

struct InferenceSettings {
    std::string endpoint = "https://api-inference.huggingface.co/models/";
    std::string apiKeyEnv = "HUGGINGFACE_API_KEY";
    int timeoutMs = 30000;
    int connectTimeoutMs = 5000;
    bool preloadModels = false;
};

struct DistributionSettings {
    size_t maxQueuedMessages = 256;
    int64_t staleConnectionMs = 300000;
};

struct PostProcessingSettings {
    size_t workerThreads = 1;
};

/**
 * Service configuration loaded from a JSON file.
 *
 * Component sections (transcription, diarization, preprocessing) are kept
 * as raw JSON and parsed by the owning component's config type.
 */
class Config {
public:
    /**
     * Load configuration from a file
     * @param configPath Path to the JSON file
     * @return Loaded configuration, defaults if the file does not exist
     * @throws ConfigurationException if the file exists but cannot be parsed
     */
    static Config load(const std::string& configPath);

    /**
     * Build configuration from an in-memory JSON document
     */
    static Config fromJson(const nlohmann::json& root);

    int getPort() const { return port_; }
    std::string getLogLevel() const { return logLevel_; }
    void setPort(int port) { port_ = port; }

    // Unread audio frames a connection may queue before frames are refused
    size_t getMaxPendingAudioFrames() const { return maxPendingAudioFrames_; }

    const InferenceSettings& getInference() const { return inference_; }
    const DistributionSettings& getDistribution() const { return distribution_; }
    const PostProcessingSettings& getPostProcessing() const { return postProcessing_; }

    const nlohmann::json& getTranscriptionSection() const { return transcription_; }
    const nlohmann::json& getDiarizationSection() const { return diarization_; }
    const nlohmann::json& getPreprocessingSection() const { return preprocessing_; }

    // Value of the configured API key environment variable, empty if unset
    std::string resolveApiKey() const;

private:
    Config() = default;

    int port_ = 8080;
    std::string logLevel_ = "INFO";
    size_t maxPendingAudioFrames_ = 256;

    InferenceSettings inference_;
    DistributionSettings distribution_;
    PostProcessingSettings postProcessing_;

    nlohmann::json transcription_ = nlohmann::json::object();
    nlohmann::json diarization_ = nlohmann::json::object();
    nlohmann::json preprocessing_ = nlohmann::json::object();
};

} // namespace utils
} // namespace meetscribe
