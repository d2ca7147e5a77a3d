#pragma once

#include "core/task_queue.hpp"
#include "models/inference_backend.hpp"
#include "utils/error_handler.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meetscribe {
namespace models {

enum class ModelState {
    LOADING,
    READY,
    ERROR
};

enum class HealthStatus {
    HEALTHY,
    DEGRADED,
    UNHEALTHY
};

std::string modelStateToString(ModelState state);
std::string healthStatusToString(HealthStatus status);

struct ModelStatus {
    std::string modelName;
    ModelState state = ModelState::LOADING;
    double loadTimeMs = 0.0;
    std::chrono::system_clock::time_point lastUsed;
    std::string errorMessage;
    std::string apiEndpoint;
    bool isLocal = false;
};

struct ModelPerformance {
    std::string modelName;
    double averageLatency = 0.0;      // ms
    double successRate = 0.0;
    double errorRate = 0.0;
    double averageConfidence = 0.0;
    size_t usageCount = 0;
    size_t successCount = 0;
    double totalProcessingTime = 0.0; // ms
};

struct ClientHealth {
    HealthStatus status = HealthStatus::UNHEALTHY;
    size_t totalModels = 0;
    size_t readyModels = 0;
    size_t errorModels = 0;
    double averageLatency = 0.0;
};

struct ModelCallOptions {
    std::string modelName;
    std::string language = "en";
};

struct ModelTranscription {
    std::string text;
    float confidence = 0.0f;
    double processingTimeMs = 0.0;
    std::string modelUsed;
};

struct ModelClientConfig {
    std::chrono::milliseconds callTimeout{30000};
    size_t workerThreads = 4;

    // RateLimitExceeded backoff
    int rateLimitAttempts = 3;
    std::chrono::milliseconds initialBackoff{100};
    std::chrono::milliseconds maxBackoff{2000};

    // Retry budget of ensureModelLoaded
    int loadAttempts = 3;
    std::chrono::milliseconds loadBackoff{100};
};

/**
 * Static fallback ordering of speech models
 */
const std::vector<std::string>& defaultModelOrder();

/**
 * Client for external speech-to-text models.
 *
 * Tracks per-model load status and performance, bounds every call with a
 * timeout and retries once on the next ready model of the static ordering
 * before surfacing a failure. Status and performance tables are shared by
 * all sessions and guarded by a single mutex.
 */
class ModelTranscriptionClient {
public:
    ModelTranscriptionClient(std::shared_ptr<InferenceBackend> backend,
                             const ModelClientConfig& config = ModelClientConfig());
    ~ModelTranscriptionClient();

    ModelTranscriptionClient(const ModelTranscriptionClient&) = delete;
    ModelTranscriptionClient& operator=(const ModelTranscriptionClient&) = delete;

    /**
     * Transcribe a chunk
     * @param audioData Audio bytes passed to the backend unchanged
     * @param options Model to use; empty selects the first static model
     * @return Text, confidence, latency and the model that answered
     * @throws TranscriptionException if the model and its fallback fail
     */
    ModelTranscription transcribe(const std::vector<uint8_t>& audioData, const ModelCallOptions& options);

    /**
     * Smoke-test a model with a 1024-byte zero buffer and mark it ready
     * @throws TranscriptionException (MODEL_UNAVAILABLE) if the test fails
     */
    ModelStatus loadModel(const std::string& modelName);

    /**
     * Load a model unless already ready, retrying with backoff
     * @throws TranscriptionException (MODEL_UNAVAILABLE) once the budget is spent
     */
    ModelStatus ensureModelLoaded(const std::string& modelName);

    /**
     * Make sure the target of a model switch is ready
     */
    void switchModel(const std::string& fromModel, const std::string& toModel);

    // Load every model of the static ordering, logging failures
    void preloadDefaultModels();

    std::optional<ModelStatus> getModelStatus(const std::string& modelName) const;
    std::vector<ModelStatus> getAllModelStatuses() const;
    std::optional<ModelPerformance> getModelPerformance(const std::string& modelName) const;
    std::vector<ModelPerformance> getAllModelPerformance() const;

    std::vector<std::string> getAvailableModels() const;

    // Ready models of the static ordering, excluding the given one
    std::vector<std::string> getFallbackModels(const std::string& currentModel) const;

    // successRate*0.4 + averageConfidence*0.4 + (1000/max(latency,1))*0.2
    std::string getBestPerformingModel() const;

    ClientHealth healthCheck() const;

    BackendHealth checkBackend();

    static utils::TranscriptionException toTranscriptionException(const std::exception& e,
                                                                  const std::string& modelName);

private:
    ModelTranscription attempt(const std::vector<uint8_t>& audioData, const std::string& modelName);
    InferenceResult callWithBackoff(const std::vector<uint8_t>& audioData, const std::string& modelName);
    InferenceResult callWithTimeout(const std::vector<uint8_t>& audioData, const std::string& modelName);

    bool isReady(const std::string& modelName) const;
    void recordPerformance(const std::string& modelName, double processingTimeMs,
                           bool success, float confidence);

    std::shared_ptr<InferenceBackend> backend_;
    ModelClientConfig config_;

    std::shared_ptr<core::TaskQueue> taskQueue_;
    std::unique_ptr<core::ThreadPool> threadPool_;

    std::map<std::string, ModelStatus> statuses_;
    std::map<std::string, ModelPerformance> performance_;
    mutable std::mutex mutex_;
};

} // namespace models
} // namespace meetscribe
