#include "core/quality_metrics.hpp"
#include <algorithm>
#include <sstream>

namespace meetscribe {
namespace core {

SessionMetricsTracker::SessionMetricsTracker(const std::string& sessionId)
    : sessionId_(sessionId) {
}

void SessionMetricsTracker::recordAttempt(double latencyMs, bool success, float confidence,
                                          double audioDurationMs) {
    std::lock_guard<std::mutex> lock(mutex_);

    totalChunks_++;
    pipelineMs_ += latencyMs;
    latency_ = (latency_ + latencyMs) / 2.0;

    if (success) {
        successfulChunks_++;
        processedAudioMs_ += audioDurationMs;
        averageConfidence_ = (averageConfidence_ + confidence) / 2.0;
    } else {
        failedChunks_++;
    }
}

SessionQualityMetrics SessionMetricsTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionQualityMetrics metrics;
    metrics.sessionId = sessionId_;
    metrics.averageConfidence = averageConfidence_;
    metrics.latency = latency_;
    metrics.throughput = pipelineMs_ > 0.0 ? processedAudioMs_ / pipelineMs_ : 0.0;
    metrics.totalChunks = totalChunks_;
    metrics.successfulChunks = successfulChunks_;
    metrics.failedChunks = failedChunks_;
    return metrics;
}

std::vector<std::string> fallbackModelsUsed(const Session& session) {
    std::vector<std::string> used;
    for (const auto& segment : session.segments) {
        if (segment.modelUsed == session.config.modelName) {
            continue;
        }
        if (std::find(used.begin(), used.end(), segment.modelUsed) == used.end()) {
            used.push_back(segment.modelUsed);
        }
    }
    return used;
}

size_t countModelSwitches(const Session& session) {
    size_t switches = 0;
    std::string current = session.config.modelName;
    for (const auto& segment : session.segments) {
        if (segment.modelUsed != current) {
            switches++;
            current = segment.modelUsed;
        }
    }
    return switches;
}

size_t countTokens(const std::vector<TranscriptSegment>& segments) {
    size_t total = 0;
    for (const auto& segment : segments) {
        std::istringstream words(segment.text);
        std::string word;
        while (words >> word) {
            total++;
        }
    }
    return total;
}

double averageConfidence(const std::vector<TranscriptSegment>& segments) {
    if (segments.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& segment : segments) {
        sum += segment.confidence;
    }
    return sum / segments.size();
}

double averageProcessingTime(const std::vector<TranscriptSegment>& segments) {
    if (segments.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& segment : segments) {
        sum += segment.processingTime;
    }
    return sum / segments.size();
}

ModelMetadata buildModelMetadata(const Session& session, size_t totalChunks) {
    ModelMetadata meta;
    meta.primaryModel = session.currentModel;
    meta.fallbackModelsUsed = fallbackModelsUsed(session);
    meta.averageConfidence = averageConfidence(session.segments);

    meta.processingStats.totalChunks = totalChunks;
    meta.processingStats.averageProcessingTime = averageProcessingTime(session.segments);
    meta.processingStats.modelSwitches = countModelSwitches(session);
    meta.processingStats.errorCount = session.errorCount;
    meta.processingStats.retryCount = session.retryCount;

    meta.totalTokensProcessed = countTokens(session.segments);
    meta.apiCalls = session.segments.size();
    meta.totalCost = meta.apiCalls * COST_PER_API_CALL;
    return meta;
}

} // namespace core
} // namespace meetscribe
