#include "core/distribution_hub.hpp"
#include "core/post_processing.hpp"
#include "core/session_manager.hpp"
#include "core/websocket_server.hpp"
#include "diarization/speaker_diarization_engine.hpp"
#include "models/http_inference_backend.hpp"
#include "models/model_client.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>  Configuration file (default: config/server.json)\n"
              << "  --port <port>    Set server port (overrides the configuration)\n"
              << "  --help, -h       Show this help message\n";
}

// Transcription defaults with the top-level diarization and preprocessing sections folded in
nlohmann::json sessionDefaults(const meetscribe::utils::Config& config) {
    nlohmann::json defaults = config.getTranscriptionSection();
    if (!defaults.contains("diarization") && !config.getDiarizationSection().empty()) {
        defaults["diarization"] = config.getDiarizationSection();
    }
    if (!defaults.contains("preprocessing") && !config.getPreprocessingSection().empty()) {
        defaults["preprocessing"] = config.getPreprocessingSection();
    }
    return defaults;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace meetscribe;

    std::string configPath = "config/server.json";
    int portOverride = 0;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                portOverride = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exitCode = 0;

    try {
        utils::Logger::initialize();
        auto config = utils::Config::load(configPath);
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));
        if (portOverride > 0) {
            config.setPort(portOverride);
        }

        nlohmann::json defaultsJson = sessionDefaults(config);
        core::TranscriptionConfig defaults = core::TranscriptionConfig::fromJson(defaultsJson);
        defaults.applyDefaults();
        defaults.validate();

        models::HttpBackendConfig backendConfig;
        backendConfig.endpoint = config.getInference().endpoint;
        backendConfig.apiKey = config.resolveApiKey();
        backendConfig.timeoutMs = config.getInference().timeoutMs;
        backendConfig.connectTimeoutMs = config.getInference().connectTimeoutMs;
        backendConfig.rawFormat = defaults.audioFormat();
        if (backendConfig.apiKey.empty()) {
            utils::Logger::warn("No API key found in " + config.getInference().apiKeyEnv +
                                ", inference requests are sent without authorization");
        }

        models::ModelClientConfig clientConfig;
        clientConfig.callTimeout = std::chrono::milliseconds(config.getInference().timeoutMs);

        auto backend = std::make_shared<models::HttpInferenceBackend>(backendConfig);
        auto modelClient = std::make_shared<models::ModelTranscriptionClient>(backend, clientConfig);
        auto diarizationEngine = std::make_shared<diarization::SpeakerDiarizationEngine>(defaults.audioFormat());
        auto hub = std::make_shared<core::DistributionHub>(config.getDistribution());

        auto postProcessing = std::make_shared<core::QueuedPostProcessingScheduler>(
            config.getPostProcessing().workerThreads);
        postProcessing->addHandler([](const std::string& event, const core::PostProcessingRequest& request) {
            utils::Logger::info("Event " + event + ": " + request.toJson().dump());
        });

        auto sessionManager = std::make_shared<core::SessionManager>(
            modelClient, diarizationEngine, hub, postProcessing, defaults);

        if (config.getInference().preloadModels) {
            utils::Logger::info("Preloading default models...");
            modelClient->preloadDefaultModels();
        }

        core::WebSocketServer server(config.getPort(), sessionManager, hub, modelClient, defaultsJson);
        server.setMaxPendingAudioFrames(config.getMaxPendingAudioFrames());

        utils::Logger::info("Starting MeetScribe server on port " + std::to_string(config.getPort()));
        server.run();

        utils::Logger::info("Shutting down...");
        postProcessing->shutdown();
        hub->shutdown();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }

    curl_global_cleanup();
    return exitCode;
}
