#include "core/message_protocol.hpp"
#include "utils/logging.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace meetscribe {
namespace core {

namespace {

nlohmann::json envelope(MessageType type) {
    nlohmann::json root;
    root["type"] = MessageProtocol::messageTypeToString(type);
    return root;
}

bool isSessionCommand(MessageType type) {
    switch (type) {
        case MessageType::PAUSE:
        case MessageType::RESUME:
        case MessageType::FINALIZE:
        case MessageType::CANCEL:
        case MessageType::SUBSCRIBE:
        case MessageType::UNSUBSCRIBE:
            return true;
        default:
            return false;
    }
}

// sessionId may sit in "data" or at the top level
std::string extractSessionId(const nlohmann::json& root) {
    if (root.contains("data") && root["data"].is_object() && root["data"].contains("sessionId")) {
        return root["data"]["sessionId"].get<std::string>();
    }
    return root.value("sessionId", std::string());
}

} // namespace

// StartMessage implementation
std::string StartMessage::serialize() const {
    nlohmann::json root = envelope(type_);
    nlohmann::json data;
    data["config"] = config_;
    if (!meetingId_.empty()) {
        data["meetingId"] = meetingId_;
    }
    root["data"] = data;
    return root.dump();
}

// SessionCommandMessage implementation
std::string SessionCommandMessage::serialize() const {
    nlohmann::json root = envelope(type_);
    if (!sessionId_.empty()) {
        root["data"] = {{"sessionId", sessionId_}};
    }
    return root.dump();
}

// PingMessage implementation
std::string PingMessage::serialize() const {
    return envelope(type_).dump();
}

// SessionStartedMessage implementation
std::string SessionStartedMessage::serialize() const {
    nlohmann::json root = envelope(type_);
    root["data"] = {
        {"sessionId", sessionId_},
        {"channelId", channelId_},
        {"config", toJson(config_)}
    };
    return root.dump();
}

// AckMessage implementation
std::string AckMessage::serialize() const {
    nlohmann::json root = envelope(type_);
    nlohmann::json data;
    data["action"] = action_;
    data["sessionId"] = sessionId_;
    if (!data_.is_null()) {
        data["result"] = data_;
    }
    root["data"] = data;
    return root.dump();
}

// PongMessage implementation
std::string PongMessage::serialize() const {
    return envelope(type_).dump();
}

// ErrorMessage implementation
std::string ErrorMessage::serialize() const {
    nlohmann::json root = envelope(type_);
    nlohmann::json data;
    data["message"] = message_;
    if (!code_.empty()) {
        data["code"] = code_;
    }
    if (!sessionId_.empty()) {
        data["sessionId"] = sessionId_;
    }
    root["data"] = data;
    return root.dump();
}

// DistributionMessage implementation
std::string DistributionMessage::serialize() const {
    nlohmann::json root = envelope(type_);
    root["sessionId"] = sessionId_;
    root["timestamp"] = formatTimestamp(timestamp_);
    root["data"] = data_;
    return root.dump();
}

DistributionMessage DistributionMessage::segment(const std::string& sessionId, const TranscriptSegment& segment) {
    return DistributionMessage(MessageType::SEGMENT, sessionId, toJson(segment));
}

DistributionMessage DistributionMessage::speakerUpdate(const std::string& sessionId,
                                                       const diarization::Speaker& speaker) {
    return DistributionMessage(MessageType::SPEAKER_UPDATE, sessionId, toJson(speaker));
}

DistributionMessage DistributionMessage::status(const std::string& sessionId, SessionStatus status) {
    return DistributionMessage(MessageType::STATUS, sessionId, sessionStatusToString(status));
}

DistributionMessage DistributionMessage::error(const std::string& sessionId, const TranscriptionError& error) {
    return DistributionMessage(MessageType::ERROR, sessionId, toJson(error));
}

DistributionMessage DistributionMessage::complete(const std::string& sessionId, const FullTranscript& transcript) {
    return DistributionMessage(MessageType::COMPLETE, sessionId, toJson(transcript));
}

// MessageProtocol implementation
std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& json) {
    try {
        nlohmann::json root = nlohmann::json::parse(json);

        if (!root.is_object() || !root.contains("type") || !root["type"].is_string()) {
            utils::Logger::warn("Invalid message format: missing type field");
            return nullptr;
        }

        std::string typeStr = root["type"].get<std::string>();
        MessageType type = stringToMessageType(typeStr);

        if (type == MessageType::START) {
            auto message = std::make_unique<StartMessage>();
            if (root.contains("data") && root["data"].is_object()) {
                const auto& data = root["data"];
                if (data.contains("config")) {
                    if (!data["config"].is_object()) {
                        utils::Logger::warn("start message config must be an object");
                        return nullptr;
                    }
                    message->setConfig(data["config"]);
                }
                message->setMeetingId(data.value("meetingId", std::string()));
            }
            return std::move(message);
        }

        if (isSessionCommand(type)) {
            auto message = std::make_unique<SessionCommandMessage>(type, extractSessionId(root));
            if ((type == MessageType::SUBSCRIBE || type == MessageType::UNSUBSCRIBE) &&
                message->getSessionId().empty()) {
                utils::Logger::warn(typeStr + " message requires a sessionId");
                return nullptr;
            }
            return std::move(message);
        }

        if (type == MessageType::PING) {
            return std::make_unique<PingMessage>();
        }

        utils::Logger::warn("Unknown message type: " + typeStr);
        return nullptr;

    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Failed to parse message: " + std::string(e.what()));
        return nullptr;
    }
}

MessageType MessageProtocol::getMessageType(const std::string& json) {
    try {
        nlohmann::json root = nlohmann::json::parse(json);
        if (!root.is_object() || !root.contains("type") || !root["type"].is_string()) {
            return MessageType::UNKNOWN;
        }
        return stringToMessageType(root["type"].get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Failed to get message type: " + std::string(e.what()));
        return MessageType::UNKNOWN;
    }
}

bool MessageProtocol::validateMessage(const std::string& json) {
    try {
        nlohmann::json root = nlohmann::json::parse(json);

        // Must be an object with a type field
        if (!root.is_object() || !root.contains("type") || !root["type"].is_string()) {
            return false;
        }

        MessageType type = stringToMessageType(root["type"].get<std::string>());
        switch (type) {
            case MessageType::UNKNOWN:
                return false;

            case MessageType::SUBSCRIBE:
            case MessageType::UNSUBSCRIBE:
                return !extractSessionId(root).empty();

            case MessageType::SEGMENT:
            case MessageType::SPEAKER_UPDATE:
            case MessageType::STATUS:
            case MessageType::COMPLETE:
                return root.contains("sessionId") && root.contains("timestamp") && root.contains("data");

            case MessageType::ERROR:
                return root.contains("data");

            default:
                return true; // Simple messages without data
        }
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "start") return MessageType::START;
    if (typeStr == "pause") return MessageType::PAUSE;
    if (typeStr == "resume") return MessageType::RESUME;
    if (typeStr == "finalize") return MessageType::FINALIZE;
    if (typeStr == "cancel") return MessageType::CANCEL;
    if (typeStr == "subscribe") return MessageType::SUBSCRIBE;
    if (typeStr == "unsubscribe") return MessageType::UNSUBSCRIBE;
    if (typeStr == "ping") return MessageType::PING;
    if (typeStr == "session_started") return MessageType::SESSION_STARTED;
    if (typeStr == "ack") return MessageType::ACK;
    if (typeStr == "pong") return MessageType::PONG;
    if (typeStr == "error") return MessageType::ERROR;
    if (typeStr == "segment") return MessageType::SEGMENT;
    if (typeStr == "speaker_update") return MessageType::SPEAKER_UPDATE;
    if (typeStr == "status") return MessageType::STATUS;
    if (typeStr == "complete") return MessageType::COMPLETE;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::START: return "start";
        case MessageType::PAUSE: return "pause";
        case MessageType::RESUME: return "resume";
        case MessageType::FINALIZE: return "finalize";
        case MessageType::CANCEL: return "cancel";
        case MessageType::SUBSCRIBE: return "subscribe";
        case MessageType::UNSUBSCRIBE: return "unsubscribe";
        case MessageType::PING: return "ping";
        case MessageType::SESSION_STARTED: return "session_started";
        case MessageType::ACK: return "ack";
        case MessageType::PONG: return "pong";
        case MessageType::ERROR: return "error";
        case MessageType::SEGMENT: return "segment";
        case MessageType::SPEAKER_UPDATE: return "speaker_update";
        case MessageType::STATUS: return "status";
        case MessageType::COMPLETE: return "complete";
        default: return "unknown";
    }
}

std::string formatTimestamp(std::chrono::system_clock::time_point timePoint) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timePoint.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

nlohmann::json toJson(const TranscriptionConfig& config) {
    nlohmann::json j;
    j["modelName"] = config.modelName;
    j["language"] = config.language;
    j["enableSpeakerDiarization"] = config.enableSpeakerDiarization;
    j["chunkSize"] = config.chunkSize;
    j["overlapSize"] = config.overlapSize;
    j["confidenceThreshold"] = config.confidenceThreshold;
    j["sampleRate"] = config.sampleRate;
    j["channels"] = config.channels;
    j["bitDepth"] = config.bitDepth;
    if (config.fallbackModels) {
        j["fallbackModels"] = *config.fallbackModels;
    }
    return j;
}

nlohmann::json toJson(const TranscriptSegment& segment) {
    return {
        {"id", segment.id},
        {"timestamp", segment.timestamp},
        {"endTimestamp", segment.endTimestamp},
        {"speakerId", segment.speakerId},
        {"text", segment.text},
        {"confidence", segment.confidence},
        {"modelUsed", segment.modelUsed},
        {"processingTime", segment.processingTime},
        {"audioChunkId", segment.audioChunkId},
        {"language", segment.language}
    };
}

nlohmann::json toJson(const diarization::VoiceProfile& profile) {
    return {
        {"id", profile.id},
        {"features", profile.features},
        {"confidence", profile.confidence},
        {"sampleCount", profile.sampleCount},
        {"lastUpdated", formatTimestamp(profile.lastUpdated)}
    };
}

nlohmann::json toJson(const diarization::Speaker& speaker) {
    nlohmann::json j = {
        {"id", speaker.id},
        {"voiceProfile", toJson(speaker.voiceProfile)},
        {"segments", speaker.segments},
        {"totalSpeakingTime", speaker.totalSpeakingTime},
        {"averageConfidence", speaker.averageConfidence},
        {"detectedAt", formatTimestamp(speaker.detectedAt)}
    };
    if (!speaker.name.empty()) {
        j["name"] = speaker.name;
    }
    return j;
}

nlohmann::json toJson(const TranscriptionError& error) {
    nlohmann::json j = {
        {"code", utils::errorCodeToString(error.code)},
        {"message", error.message},
        {"timestamp", formatTimestamp(error.timestamp)},
        {"sessionId", error.sessionId},
        {"retryable", error.retryable}
    };
    if (!error.audioChunkId.empty()) {
        j["audioChunkId"] = error.audioChunkId;
    }
    if (!error.modelName.empty()) {
        j["modelName"] = error.modelName;
    }
    return j;
}

nlohmann::json toJson(const Session& session) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& segment : session.segments) {
        segments.push_back(toJson(segment));
    }
    nlohmann::json speakers = nlohmann::json::array();
    for (const auto& speaker : session.speakers) {
        speakers.push_back(toJson(speaker));
    }

    nlohmann::json j = {
        {"id", session.id},
        {"sessionId", session.id},
        {"meetingId", session.meetingId},
        {"config", toJson(session.config)},
        {"status", sessionStatusToString(session.status)},
        {"startTime", formatTimestamp(session.startTime)},
        {"currentModel", session.currentModel},
        {"fallbackModels", session.fallbackModels},
        {"channelId", session.channelId},
        {"segments", segments},
        {"speakers", speakers},
        {"errorCount", session.errorCount}
    };
    if (session.endTime) {
        j["endTime"] = formatTimestamp(*session.endTime);
    }
    if (session.lastError) {
        j["lastError"] = toJson(*session.lastError);
    }
    return j;
}

nlohmann::json toJson(const FullTranscript& transcript) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& segment : transcript.segments) {
        segments.push_back(toJson(segment));
    }
    nlohmann::json speakers = nlohmann::json::array();
    for (const auto& speaker : transcript.speakers) {
        speakers.push_back(toJson(speaker));
    }

    const ModelMetadata& meta = transcript.modelMetadata;
    const ProcessingStats& stats = meta.processingStats;

    return {
        {"id", transcript.id},
        {"meetingId", transcript.meetingId},
        {"sessionId", transcript.sessionId},
        {"segments", segments},
        {"speakers", speakers},
        {"duration", transcript.duration},
        {"language", transcript.language},
        {"modelMetadata", {
            {"primaryModel", meta.primaryModel},
            {"fallbackModelsUsed", meta.fallbackModelsUsed},
            {"averageConfidence", meta.averageConfidence},
            {"processingStats", {
                {"totalChunks", stats.totalChunks},
                {"averageProcessingTime", stats.averageProcessingTime},
                {"modelSwitches", stats.modelSwitches},
                {"errorCount", stats.errorCount},
                {"retryCount", stats.retryCount}
            }},
            {"totalTokensProcessed", meta.totalTokensProcessed},
            {"apiCalls", meta.apiCalls},
            {"totalCost", meta.totalCost}
        }},
        {"createdAt", formatTimestamp(transcript.createdAt)},
        {"updatedAt", formatTimestamp(transcript.updatedAt)},
        {"status", transcriptStatusToString(transcript.status)}
    };
}

nlohmann::json toJson(const SessionQualityMetrics& metrics) {
    nlohmann::json performance = nlohmann::json::array();
    for (const auto& entry : metrics.modelPerformance) {
        performance.push_back(toJson(entry));
    }
    return {
        {"sessionId", metrics.sessionId},
        {"averageConfidence", metrics.averageConfidence},
        {"latency", metrics.latency},
        {"throughput", metrics.throughput},
        {"totalChunks", metrics.totalChunks},
        {"successfulChunks", metrics.successfulChunks},
        {"failedChunks", metrics.failedChunks},
        {"modelPerformance", performance}
    };
}

nlohmann::json toJson(const diarization::DiarizationResult& result) {
    nlohmann::json speakers = nlohmann::json::array();
    for (const auto& speaker : result.speakers) {
        speakers.push_back({
            {"id", speaker.id},
            {"voiceEmbedding", speaker.voiceEmbedding},
            {"confidence", speaker.confidence},
            {"firstDetectedAt", speaker.firstDetectedAt},
            {"lastDetectedAt", speaker.lastDetectedAt},
            {"totalSpeakingTime", speaker.totalSpeakingTime}
        });
    }
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& segment : result.segments) {
        segments.push_back({
            {"speakerId", segment.speakerId},
            {"startTime", segment.startTime},
            {"endTime", segment.endTime},
            {"confidence", segment.confidence}
        });
    }
    return {
        {"speakers", speakers},
        {"segments", segments},
        {"confidence", result.confidence},
        {"processingTime", result.processingTimeMs},
        {"modelUsed", result.modelUsed}
    };
}

nlohmann::json toJson(const models::ModelStatus& status) {
    nlohmann::json j = {
        {"modelName", status.modelName},
        {"status", models::modelStateToString(status.state)},
        {"loadTime", status.loadTimeMs},
        {"apiEndpoint", status.apiEndpoint},
        {"isLocal", status.isLocal}
    };
    if (status.lastUsed.time_since_epoch().count() != 0) {
        j["lastUsed"] = formatTimestamp(status.lastUsed);
    }
    if (!status.errorMessage.empty()) {
        j["errorMessage"] = status.errorMessage;
    }
    return j;
}

nlohmann::json toJson(const models::ModelPerformance& performance) {
    return {
        {"modelName", performance.modelName},
        {"averageLatency", performance.averageLatency},
        {"successRate", performance.successRate},
        {"errorRate", performance.errorRate},
        {"averageConfidence", performance.averageConfidence},
        {"usageCount", performance.usageCount},
        {"totalProcessingTime", performance.totalProcessingTime}
    };
}

nlohmann::json toJson(const models::ClientHealth& health) {
    return {
        {"status", models::healthStatusToString(health.status)},
        {"totalModels", health.totalModels},
        {"readyModels", health.readyModels},
        {"errorModels", health.errorModels},
        {"averageLatency", health.averageLatency}
    };
}

} // namespace core
} // namespace meetscribe
