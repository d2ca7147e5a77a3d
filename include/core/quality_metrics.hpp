#pragma once

#include "core/transcription_types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Running quality statistics of one session.
 *
 * Written by the session pipeline after every chunk attempt and read
 * concurrently through snapshot(). Latency and confidence are halving
 * running averages; failed attempts never touch confidence.
 */
class SessionMetricsTracker {
public:
    explicit SessionMetricsTracker(const std::string& sessionId);

    /**
     * Fold one chunk attempt into the statistics
     * @param latencyMs Wall-clock time of the attempt
     * @param success Whether a segment was produced
     * @param confidence Segment confidence, ignored on failure
     * @param audioDurationMs Audio length of the chunk
     */
    void recordAttempt(double latencyMs, bool success, float confidence, double audioDurationMs);

    SessionQualityMetrics snapshot() const;

    const std::string& getSessionId() const { return sessionId_; }

private:
    std::string sessionId_;

    double averageConfidence_ = 0.0;
    double latency_ = 0.0;
    double processedAudioMs_ = 0.0;
    double pipelineMs_ = 0.0;
    size_t totalChunks_ = 0;
    size_t successfulChunks_ = 0;
    size_t failedChunks_ = 0;

    mutable std::mutex mutex_;
};

// Aggregates reported with a finished transcript

// Models that produced segments other than the configured one, in first-use order
std::vector<std::string> fallbackModelsUsed(const Session& session);

// Times the answering model changed, starting from the configured model
size_t countModelSwitches(const Session& session);

// Space-separated word count over all segment texts
size_t countTokens(const std::vector<TranscriptSegment>& segments);

double averageConfidence(const std::vector<TranscriptSegment>& segments);
double averageProcessingTime(const std::vector<TranscriptSegment>& segments);

ModelMetadata buildModelMetadata(const Session& session, size_t totalChunks);

} // namespace core
} // namespace meetscribe
