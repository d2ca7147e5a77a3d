#pragma once

#include "core/transcription_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace meetscribe {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    START,
    PAUSE,
    RESUME,
    FINALIZE,
    CANCEL,
    SUBSCRIBE,
    UNSUBSCRIBE,
    PING,
    // Server to Client
    SESSION_STARTED,
    ACK,
    PONG,
    ERROR,
    // Session distribution
    SEGMENT,
    SPEAKER_UPDATE,
    STATUS,
    COMPLETE
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;

    MessageType getType() const { return type_; }
    virtual std::string serialize() const = 0;

protected:
    MessageType type_;
};

// Client to Server Messages
class StartMessage : public Message {
public:
    StartMessage() : Message(MessageType::START), config_(nlohmann::json::object()) {}
    explicit StartMessage(const nlohmann::json& config)
        : Message(MessageType::START), config_(config) {}

    // Overrides merged over the server's default transcription settings
    const nlohmann::json& getConfig() const { return config_; }
    const std::string& getMeetingId() const { return meetingId_; }

    void setConfig(const nlohmann::json& config) { config_ = config; }
    void setMeetingId(const std::string& meetingId) { meetingId_ = meetingId; }

    std::string serialize() const override;

private:
    nlohmann::json config_;
    std::string meetingId_;
};

// pause, resume, finalize, cancel, subscribe and unsubscribe
class SessionCommandMessage : public Message {
public:
    SessionCommandMessage(MessageType type, const std::string& sessionId = "")
        : Message(type), sessionId_(sessionId) {}

    // Empty for commands addressed to the connection's own session
    const std::string& getSessionId() const { return sessionId_; }
    void setSessionId(const std::string& sessionId) { sessionId_ = sessionId; }

    std::string serialize() const override;

private:
    std::string sessionId_;
};

class PingMessage : public Message {
public:
    PingMessage() : Message(MessageType::PING) {}
    std::string serialize() const override;
};

// Server to Client Messages
class SessionStartedMessage : public Message {
public:
    SessionStartedMessage(const std::string& sessionId, const std::string& channelId,
                          const TranscriptionConfig& config)
        : Message(MessageType::SESSION_STARTED), sessionId_(sessionId), channelId_(channelId), config_(config) {}

    const std::string& getSessionId() const { return sessionId_; }
    const std::string& getChannelId() const { return channelId_; }

    std::string serialize() const override;

private:
    std::string sessionId_;
    std::string channelId_;
    TranscriptionConfig config_;
};

class AckMessage : public Message {
public:
    AckMessage(const std::string& action, const std::string& sessionId)
        : Message(MessageType::ACK), action_(action), sessionId_(sessionId) {}

    const std::string& getAction() const { return action_; }
    const std::string& getSessionId() const { return sessionId_; }

    void setData(const nlohmann::json& data) { data_ = data; }

    std::string serialize() const override;

private:
    std::string action_;
    std::string sessionId_;
    nlohmann::json data_;
};

class PongMessage : public Message {
public:
    PongMessage() : Message(MessageType::PONG) {}
    std::string serialize() const override;
};

class ErrorMessage : public Message {
public:
    ErrorMessage(const std::string& message, const std::string& code = "", const std::string& sessionId = "")
        : Message(MessageType::ERROR), message_(message), code_(code), sessionId_(sessionId) {}

    const std::string& getMessage() const { return message_; }
    const std::string& getCode() const { return code_; }

    std::string serialize() const override;

private:
    std::string message_;
    std::string code_;
    std::string sessionId_;
};

/**
 * Event fanned out to the subscribers of a session:
 * {"type", "sessionId", "timestamp", "data"}
 */
class DistributionMessage : public Message {
public:
    DistributionMessage(MessageType type, const std::string& sessionId, nlohmann::json data,
                        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now())
        : Message(type), sessionId_(sessionId), data_(std::move(data)), timestamp_(timestamp) {}

    const std::string& getSessionId() const { return sessionId_; }
    const nlohmann::json& getData() const { return data_; }
    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    std::string serialize() const override;

    static DistributionMessage segment(const std::string& sessionId, const TranscriptSegment& segment);
    static DistributionMessage speakerUpdate(const std::string& sessionId, const diarization::Speaker& speaker);
    static DistributionMessage status(const std::string& sessionId, SessionStatus status);
    static DistributionMessage error(const std::string& sessionId, const TranscriptionError& error);
    static DistributionMessage complete(const std::string& sessionId, const FullTranscript& transcript);

private:
    std::string sessionId_;
    nlohmann::json data_;
    std::chrono::system_clock::time_point timestamp_;
};

// Message factory and parser
class MessageProtocol {
public:
    /**
     * Parse a client control message
     * @return nullptr for malformed JSON or message types clients may not send
     */
    static std::unique_ptr<Message> parseMessage(const std::string& json);
    static MessageType getMessageType(const std::string& json);
    static bool validateMessage(const std::string& json);

    static MessageType stringToMessageType(const std::string& typeStr);
    static std::string messageTypeToString(MessageType type);
};

// ISO-8601 UTC with milliseconds, e.g. 2024-01-01T12:00:00.000Z
std::string formatTimestamp(std::chrono::system_clock::time_point timePoint);

// JSON views of engine types
nlohmann::json toJson(const TranscriptionConfig& config);
nlohmann::json toJson(const TranscriptSegment& segment);
nlohmann::json toJson(const diarization::VoiceProfile& profile);
nlohmann::json toJson(const diarization::Speaker& speaker);
nlohmann::json toJson(const TranscriptionError& error);
nlohmann::json toJson(const Session& session);
nlohmann::json toJson(const FullTranscript& transcript);
nlohmann::json toJson(const SessionQualityMetrics& metrics);
nlohmann::json toJson(const diarization::DiarizationResult& result);
nlohmann::json toJson(const models::ModelStatus& status);
nlohmann::json toJson(const models::ModelPerformance& performance);
nlohmann::json toJson(const models::ClientHealth& health);

} // namespace core
} // namespace meetscribe
