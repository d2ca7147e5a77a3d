#include "models/model_client.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <future>
#include <thread>

namespace meetscribe {
namespace models {

namespace {
constexpr size_t SMOKE_TEST_BYTES = 1024;
}

std::string modelStateToString(ModelState state) {
    switch (state) {
        case ModelState::LOADING: return "loading";
        case ModelState::READY: return "ready";
        case ModelState::ERROR: return "error";
    }
    return "error";
}

std::string healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
    }
    return "unhealthy";
}

const std::vector<std::string>& defaultModelOrder() {
    static const std::vector<std::string> models = {
        "facebook/wav2vec2-large-960h-lv60-self",
        "facebook/wav2vec2-base-960h",
        "openai/whisper-base",
        "openai/whisper-small"
    };
    return models;
}

ModelTranscriptionClient::ModelTranscriptionClient(std::shared_ptr<InferenceBackend> backend,
                                                   const ModelClientConfig& config)
    : backend_(std::move(backend)), config_(config),
      taskQueue_(std::make_shared<core::TaskQueue>()),
      threadPool_(std::make_unique<core::ThreadPool>(config.workerThreads, "model-calls")) {
    if (!backend_) {
        throw utils::ConfigurationException("Model client requires an inference backend");
    }
    threadPool_->start(taskQueue_);
}

ModelTranscriptionClient::~ModelTranscriptionClient() {
    threadPool_->stop();
}

utils::TranscriptionException ModelTranscriptionClient::toTranscriptionException(const std::exception& e,
                                                                                const std::string& modelName) {
    if (auto* known = dynamic_cast<const utils::TranscriptionException*>(&e)) {
        return *known;
    }
    return utils::TranscriptionException(utils::classifyErrorMessage(e.what()), e.what(), modelName);
}

InferenceResult ModelTranscriptionClient::callWithTimeout(const std::vector<uint8_t>& audioData,
                                                          const std::string& modelName) {
    auto backend = backend_;
    auto future = taskQueue_->enqueueWithFuture(core::TaskPriority::NORMAL,
        [backend, audioData, modelName]() {
            return backend->transcribe(audioData, modelName);
        });

    if (future.wait_for(config_.callTimeout) == std::future_status::timeout) {
        throw utils::TranscriptionException(utils::TranscriptionErrorCode::MODEL_TIMEOUT,
                                            "Model " + modelName + " timed out after " +
                                            std::to_string(config_.callTimeout.count()) + "ms",
                                            modelName);
    }
    return future.get();
}

InferenceResult ModelTranscriptionClient::callWithBackoff(const std::vector<uint8_t>& audioData,
                                                          const std::string& modelName) {
    auto delay = config_.initialBackoff;
    for (int attemptNo = 1; ; ++attemptNo) {
        try {
            return callWithTimeout(audioData, modelName);
        } catch (const std::exception& e) {
            utils::TranscriptionException error = toTranscriptionException(e, modelName);
            if (error.getCode() != utils::TranscriptionErrorCode::RATE_LIMIT_EXCEEDED ||
                attemptNo >= config_.rateLimitAttempts) {
                throw error;
            }
            utils::Logger::warn("Rate limited by " + modelName + ", retrying in " +
                                std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
            delay = std::min(delay * 2, config_.maxBackoff);
        }
    }
}

bool ModelTranscriptionClient::isReady(const std::string& modelName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(modelName);
    return it != statuses_.end() && it->second.state == ModelState::READY;
}

ModelTranscription ModelTranscriptionClient::attempt(const std::vector<uint8_t>& audioData,
                                                     const std::string& modelName) {
    if (!isReady(modelName)) {
        auto status = getModelStatus(modelName);
        throw utils::TranscriptionException(utils::TranscriptionErrorCode::MODEL_UNAVAILABLE,
                                            "Model " + modelName + " is not ready. Status: " +
                                            (status ? modelStateToString(status->state) : "unknown"),
                                            modelName);
    }

    auto startTime = std::chrono::steady_clock::now();
    try {
        InferenceResult result = callWithBackoff(audioData, modelName);

        ModelTranscription transcription;
        transcription.text = result.text;
        transcription.confidence = std::max(0.0f, std::min(1.0f, result.confidence));
        transcription.processingTimeMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - startTime).count();
        transcription.modelUsed = modelName;

        recordPerformance(modelName, transcription.processingTimeMs, true, transcription.confidence);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            statuses_[modelName].lastUsed = std::chrono::system_clock::now();
        }
        return transcription;

    } catch (const std::exception&) {
        double elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - startTime).count();
        recordPerformance(modelName, elapsed, false, 0.0f);
        throw;
    }
}

ModelTranscription ModelTranscriptionClient::transcribe(const std::vector<uint8_t>& audioData,
                                                        const ModelCallOptions& options) {
    const std::string modelName = options.modelName.empty() ? defaultModelOrder().front() : options.modelName;

    try {
        return attempt(audioData, modelName);
    } catch (const std::exception& e) {
        utils::TranscriptionException error = toTranscriptionException(e, modelName);
        utils::Logger::error("Transcription failed for model " + modelName + ": " + error.what());

        std::vector<std::string> fallbacks = getFallbackModels(modelName);
        if (fallbacks.empty()) {
            throw error;
        }

        utils::Logger::info("Trying fallback model: " + fallbacks.front());
        try {
            return attempt(audioData, fallbacks.front());
        } catch (const std::exception& fallbackError) {
            throw toTranscriptionException(fallbackError, fallbacks.front());
        }
    }
}

ModelStatus ModelTranscriptionClient::loadModel(const std::string& modelName) {
    auto startTime = std::chrono::steady_clock::now();
    utils::Logger::info("Loading model: " + modelName);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ModelStatus& status = statuses_[modelName];
        status.modelName = modelName;
        status.state = ModelState::LOADING;
        status.errorMessage.clear();
        status.apiEndpoint = backend_->endpointFor(modelName);
    }

    try {
        // The smoke test bypasses the ready check; the model is not ready yet
        std::vector<uint8_t> testBuffer(SMOKE_TEST_BYTES, 0);
        callWithBackoff(testBuffer, modelName);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        ModelStatus& status = statuses_[modelName];
        status.state = ModelState::ERROR;
        status.errorMessage = e.what();
        utils::Logger::error("Failed to load model " + modelName + ": " + e.what());
        throw utils::TranscriptionException(utils::TranscriptionErrorCode::MODEL_UNAVAILABLE,
                                            "Failed to load model " + modelName + ": " + e.what(),
                                            modelName);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ModelStatus& status = statuses_[modelName];
    status.state = ModelState::READY;
    status.loadTimeMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();
    status.lastUsed = std::chrono::system_clock::now();

    if (performance_.find(modelName) == performance_.end()) {
        ModelPerformance perf;
        perf.modelName = modelName;
        performance_[modelName] = perf;
    }

    utils::Logger::info("Model " + modelName + " loaded successfully in " +
                        std::to_string(static_cast<int>(status.loadTimeMs)) + "ms");
    return status;
}

ModelStatus ModelTranscriptionClient::ensureModelLoaded(const std::string& modelName) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = statuses_.find(modelName);
        if (it != statuses_.end() && it->second.state == ModelState::READY) {
            return it->second;
        }
    }

    auto delay = config_.loadBackoff;
    std::string lastError;
    for (int attemptNo = 1; attemptNo <= config_.loadAttempts; ++attemptNo) {
        try {
            return loadModel(modelName);
        } catch (const utils::TranscriptionException& e) {
            lastError = e.what();
            if (attemptNo < config_.loadAttempts) {
                std::this_thread::sleep_for(delay);
                delay *= 2;
            }
        }
    }

    throw utils::TranscriptionException(utils::TranscriptionErrorCode::MODEL_UNAVAILABLE,
                                        "Model " + modelName + " unavailable after " +
                                        std::to_string(config_.loadAttempts) + " attempts: " + lastError,
                                        modelName);
}

void ModelTranscriptionClient::switchModel(const std::string& fromModel, const std::string& toModel) {
    utils::Logger::info("Switching from model " + fromModel + " to " + toModel);
    ensureModelLoaded(toModel);
    utils::Logger::info("Successfully switched to model " + toModel);
}

void ModelTranscriptionClient::preloadDefaultModels() {
    utils::Logger::info("Preloading speech models...");
    for (const auto& modelName : defaultModelOrder()) {
        try {
            loadModel(modelName);
        } catch (const utils::TranscriptionException& e) {
            utils::ErrorHandler::getInstance().reportError(e, "ModelTranscriptionClient::preloadDefaultModels");
        }
    }
}

void ModelTranscriptionClient::recordPerformance(const std::string& modelName, double processingTimeMs,
                                                 bool success, float confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = performance_.find(modelName);
    if (it == performance_.end()) {
        return;
    }

    ModelPerformance& perf = it->second;
    perf.usageCount++;
    perf.totalProcessingTime += processingTimeMs;
    perf.averageLatency = perf.totalProcessingTime / perf.usageCount;

    const double n = static_cast<double>(perf.usageCount);
    perf.successRate = (perf.successRate * (n - 1) + (success ? 1.0 : 0.0)) / n;
    perf.errorRate = (perf.errorRate * (n - 1) + (success ? 0.0 : 1.0)) / n;

    if (success) {
        perf.successCount++;
        const double s = static_cast<double>(perf.successCount);
        perf.averageConfidence = (perf.averageConfidence * (s - 1) + confidence) / s;
    }
}

std::optional<ModelStatus> ModelTranscriptionClient::getModelStatus(const std::string& modelName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(modelName);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ModelStatus> ModelTranscriptionClient::getAllModelStatuses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModelStatus> result;
    for (const auto& entry : statuses_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<ModelPerformance> ModelTranscriptionClient::getModelPerformance(const std::string& modelName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = performance_.find(modelName);
    if (it == performance_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ModelPerformance> ModelTranscriptionClient::getAllModelPerformance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModelPerformance> result;
    for (const auto& entry : performance_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<std::string> ModelTranscriptionClient::getAvailableModels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : statuses_) {
        if (entry.second.state == ModelState::READY) {
            result.push_back(entry.first);
        }
    }
    return result;
}

std::vector<std::string> ModelTranscriptionClient::getFallbackModels(const std::string& currentModel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& modelName : defaultModelOrder()) {
        if (modelName == currentModel) {
            continue;
        }
        auto it = statuses_.find(modelName);
        if (it != statuses_.end() && it->second.state == ModelState::READY) {
            result.push_back(modelName);
        }
    }
    return result;
}

std::string ModelTranscriptionClient::getBestPerformingModel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string bestModel = defaultModelOrder().front();
    double bestScore = 0.0;

    for (const auto& entry : performance_) {
        const ModelPerformance& perf = entry.second;
        double score = perf.successRate * 0.4 +
                       perf.averageConfidence * 0.4 +
                       (1000.0 / std::max(perf.averageLatency, 1.0)) * 0.2;
        if (score > bestScore) {
            bestScore = score;
            bestModel = entry.first;
        }
    }
    return bestModel;
}

ClientHealth ModelTranscriptionClient::healthCheck() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientHealth health;
    health.totalModels = statuses_.size();

    for (const auto& entry : statuses_) {
        if (entry.second.state == ModelState::READY) health.readyModels++;
        if (entry.second.state == ModelState::ERROR) health.errorModels++;
    }

    if (!performance_.empty()) {
        double sum = 0.0;
        for (const auto& entry : performance_) {
            sum += entry.second.averageLatency;
        }
        health.averageLatency = sum / performance_.size();
    }

    if (health.readyModels == 0) {
        health.status = HealthStatus::UNHEALTHY;
    } else if (health.errorModels > health.readyModels || health.averageLatency > 5000.0) {
        health.status = HealthStatus::DEGRADED;
    } else {
        health.status = HealthStatus::HEALTHY;
    }
    return health;
}

BackendHealth ModelTranscriptionClient::checkBackend() {
    try {
        return backend_->healthCheck();
    } catch (const std::exception& e) {
        BackendHealth health;
        health.reachable = false;
        health.detail = e.what();
        return health;
    }
}

} // namespace models
} // namespace meetscribe
