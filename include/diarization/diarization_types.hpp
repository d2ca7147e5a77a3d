#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace diarization {

constexpr size_t EMBEDDING_DIMENSION = 128;
constexpr float IDENTIFICATION_THRESHOLD = 0.8f;
constexpr float PROFILE_UPDATE_WEIGHT = 0.1f;

struct DiarizationConfig {
    size_t minSpeakers = 1;
    size_t maxSpeakers = 10;
    double minSegmentLength = 1.0;     // seconds of total speech per speaker
    float similarityThreshold = 0.8f;
    float vadEnergyThreshold = 0.01f;
    std::string modelName = "spectral-clustering";

    static DiarizationConfig fromJson(const nlohmann::json& j);
};

/**
 * Fixed-length L2-normalized voice signature
 */
struct VoiceProfile {
    std::string id;
    std::vector<float> features;
    float confidence = 0.0f;
    size_t sampleCount = 0;
    std::chrono::system_clock::time_point lastUpdated;
};

/**
 * Speaker known to a session
 */
struct Speaker {
    std::string id;
    std::string name;
    VoiceProfile voiceProfile;
    double totalSpeakingTime = 0.0;    // seconds
    std::vector<std::string> segments;
    float averageConfidence = 0.0f;
    std::chrono::system_clock::time_point detectedAt;
};

// Speaker cluster found by a single diarization pass
struct DetectedSpeaker {
    std::string id;
    std::vector<float> voiceEmbedding;
    float confidence = 1.0f;
    double firstDetectedAt = 0.0;      // seconds from chunk start
    double lastDetectedAt = 0.0;
    double totalSpeakingTime = 0.0;
};

struct SpeakerSegment {
    std::string speakerId;
    double startTime = 0.0;
    double endTime = 0.0;
    float confidence = 0.0f;
};

struct DiarizationResult {
    std::vector<DetectedSpeaker> speakers;
    std::vector<SpeakerSegment> segments;
    float confidence = 0.0f;
    double processingTimeMs = 0.0;
    std::string modelUsed;
};

} // namespace diarization
} // namespace meetscribe
