#pragma once

#include "audio/audio_preprocessor.hpp"
#include "audio/audio_utils.hpp"
#include "diarization/diarization_types.hpp"
#include "models/model_client.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

enum class SessionStatus {
    INITIALIZING,
    ACTIVE,
    PAUSED,
    COMPLETED,
    CANCELLED,
    ERROR
};

std::string sessionStatusToString(SessionStatus status);

// Completed, Cancelled and Error accept no further operations
bool isTerminal(SessionStatus status);

// Status reported in a finished transcript
enum class TranscriptStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string transcriptStatusToString(TranscriptStatus status);

/**
 * Per-session transcription settings
 */
struct TranscriptionConfig {
    std::string modelName;              // empty selects the first static model
    std::string language = "en";
    bool enableSpeakerDiarization = true;

    size_t chunkSize = 16384;           // bytes per pipeline window
    size_t overlapSize = 2048;          // bytes carried into the next window
    float confidenceThreshold = 0.7f;

    int sampleRate = 16000;
    int channels = 1;
    int bitDepth = 16;

    // Explicit fallback list; unset means the static ordering minus the model
    std::optional<std::vector<std::string>> fallbackModels;

    audio::PreprocessingConfig preprocessing;
    diarization::DiarizationConfig diarization;

    audio::AudioFormat audioFormat() const;

    /**
     * Fill unset values: default model name, preprocessing targets taken from
     * the session audio format
     */
    void applyDefaults();

    /**
     * @throws ConfigurationException on out-of-range values
     */
    void validate() const;

    static TranscriptionConfig fromJson(const nlohmann::json& j);
};

struct TranscriptionError {
    utils::TranscriptionErrorCode code = utils::TranscriptionErrorCode::UNKNOWN_ERROR;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string sessionId;
    std::string audioChunkId;
    std::string modelName;
    bool retryable = true;
};

struct AudioChunk {
    std::string id;
    std::string sessionId;
    std::vector<uint8_t> data;
    int64_t timestamp = 0;              // ms since session start
    double duration = 0.0;              // ms
    int sampleRate = 16000;
    int channels = 1;
    bool processed = false;
    std::string transcriptSegmentId;
};

struct TranscriptSegment {
    std::string id;
    int64_t timestamp = 0;              // ms since session start
    int64_t endTimestamp = 0;
    std::string speakerId;
    std::string text;
    float confidence = 0.0f;
    std::string modelUsed;
    double processingTime = 0.0;        // ms
    std::string audioChunkId;
    std::string language;
};

struct Session {
    std::string id;
    std::string meetingId;
    TranscriptionConfig config;
    SessionStatus status = SessionStatus::INITIALIZING;
    std::chrono::system_clock::time_point startTime;
    std::optional<std::chrono::system_clock::time_point> endTime;
    std::string currentModel;
    std::vector<std::string> fallbackModels;
    std::string channelId;
    std::vector<TranscriptSegment> segments;
    std::vector<diarization::Speaker> speakers;
    size_t errorCount = 0;
    std::optional<TranscriptionError> lastError;
    size_t chunksReceived = 0;
    size_t retryCount = 0;
};

struct ProcessingStats {
    size_t totalChunks = 0;
    double averageProcessingTime = 0.0;
    size_t modelSwitches = 0;
    size_t errorCount = 0;
    size_t retryCount = 0;
};

struct ModelMetadata {
    std::string primaryModel;
    std::vector<std::string> fallbackModelsUsed;
    double averageConfidence = 0.0;
    ProcessingStats processingStats;
    size_t totalTokensProcessed = 0;
    size_t apiCalls = 0;
    double totalCost = 0.0;
};

struct FullTranscript {
    std::string id;
    std::string meetingId;
    std::string sessionId;
    std::vector<TranscriptSegment> segments;
    std::vector<diarization::Speaker> speakers;
    int64_t duration = 0;               // ms from start to finalize
    std::string language;
    ModelMetadata modelMetadata;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    TranscriptStatus status = TranscriptStatus::COMPLETED;
};

struct SessionQualityMetrics {
    std::string sessionId;
    double averageConfidence = 0.0;
    double latency = 0.0;               // ms, halving running average
    double throughput = 0.0;            // audio seconds per pipeline second
    size_t totalChunks = 0;
    size_t successfulChunks = 0;
    size_t failedChunks = 0;
    std::vector<models::ModelPerformance> modelPerformance;
};

// Cost charged per inference call
constexpr double COST_PER_API_CALL = 0.001;

// Consecutive-failure budget above which no fallback is attempted
constexpr size_t MAX_SESSION_ERRORS = 3;

} // namespace core
} // namespace meetscribe
