#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace meetscribe {
namespace utils {

Config Config::load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::warn("Config file not found, using defaults: " + configPath);
        return Config();
    }

    std::string jsonStr((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException("Malformed configuration file", configPath + ": " + e.what());
    }

    Config config = fromJson(root);
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

Config Config::fromJson(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw ConfigurationException("Configuration root must be a JSON object");
    }

    Config config;

    try {
        if (root.contains("server")) {
            const auto& server = root["server"];
            config.port_ = server.value("port", config.port_);
            config.logLevel_ = server.value("logLevel", config.logLevel_);
            config.maxPendingAudioFrames_ = server.value("maxPendingAudioFrames", config.maxPendingAudioFrames_);
        }

        if (root.contains("inference")) {
            const auto& inf = root["inference"];
            config.inference_.endpoint = inf.value("endpoint", config.inference_.endpoint);
            config.inference_.apiKeyEnv = inf.value("apiKeyEnv", config.inference_.apiKeyEnv);
            config.inference_.timeoutMs = inf.value("timeoutMs", config.inference_.timeoutMs);
            config.inference_.connectTimeoutMs = inf.value("connectTimeoutMs", config.inference_.connectTimeoutMs);
            config.inference_.preloadModels = inf.value("preloadModels", config.inference_.preloadModels);
        }

        if (root.contains("distribution")) {
            const auto& dist = root["distribution"];
            config.distribution_.maxQueuedMessages =
                dist.value("maxQueuedMessages", config.distribution_.maxQueuedMessages);
            config.distribution_.staleConnectionMs =
                dist.value("staleConnectionMs", config.distribution_.staleConnectionMs);
        }

        if (root.contains("postProcessing")) {
            config.postProcessing_.workerThreads =
                root["postProcessing"].value("workerThreads", config.postProcessing_.workerThreads);
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationException("Invalid configuration value", e.what());
    }

    if (root.contains("transcription")) config.transcription_ = root["transcription"];
    if (root.contains("diarization")) config.diarization_ = root["diarization"];
    if (root.contains("preprocessing")) config.preprocessing_ = root["preprocessing"];

    if (config.port_ <= 0 || config.port_ > 65535) {
        throw ConfigurationException("Invalid server port", std::to_string(config.port_));
    }
    if (config.inference_.timeoutMs <= 0) {
        throw ConfigurationException("inference.timeoutMs must be positive");
    }
    if (config.maxPendingAudioFrames_ == 0) {
        throw ConfigurationException("server.maxPendingAudioFrames must be positive");
    }
    if (config.postProcessing_.workerThreads == 0) {
        config.postProcessing_.workerThreads = 1;
    }

    return config;
}

std::string Config::resolveApiKey() const {
    if (inference_.apiKeyEnv.empty()) {
        return "";
    }
    const char* value = std::getenv(inference_.apiKeyEnv.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace utils
} // namespace meetscribe
