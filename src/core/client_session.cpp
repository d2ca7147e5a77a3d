#include "core/client_session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace meetscribe {
namespace core {

ClientSession::ClientSession(const std::string& connectionId,
                             std::shared_ptr<SessionManager> sessionManager,
                             std::shared_ptr<DistributionHub> hub,
                             std::shared_ptr<MessageSink> sink,
                             std::shared_ptr<TaskQueue> controlQueue,
                             const nlohmann::json& defaultConfig)
    : connectionId_(connectionId), connected_(true),
      sessionManager_(std::move(sessionManager)), hub_(std::move(hub)),
      sink_(std::move(sink)), controlQueue_(std::move(controlQueue)),
      defaultConfig_(defaultConfig.is_object() ? defaultConfig : nlohmann::json::object()) {
    utils::Logger::info("Created client session: " + connectionId_);
}

ClientSession::~ClientSession() {
    if (connected_) {
        handleDisconnect();
    }
    utils::Logger::info("Destroyed client session: " + connectionId_);
}

std::string ClientSession::getSessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionId_;
}

void ClientSession::handleMessage(const std::string& message) {
    utils::Logger::debug("Connection " + connectionId_ + " received JSON: " + message);

    if (!connected_) {
        utils::Logger::warn("Received message for disconnected client: " + connectionId_);
        return;
    }

    auto parsedMessage = MessageProtocol::parseMessage(message);
    if (!parsedMessage) {
        reply(ErrorMessage("Invalid message", "INVALID_MESSAGE"));
        return;
    }

    switch (parsedMessage->getType()) {
        case MessageType::START:
            processStart(static_cast<const StartMessage&>(*parsedMessage));
            break;
        case MessageType::PAUSE:
        case MessageType::RESUME:
        case MessageType::FINALIZE:
        case MessageType::CANCEL:
        case MessageType::SUBSCRIBE:
        case MessageType::UNSUBSCRIBE:
            processCommand(static_cast<const SessionCommandMessage&>(*parsedMessage));
            break;
        case MessageType::PING:
            reply(PongMessage());
            break;
        default:
            reply(ErrorMessage("Unsupported message type", "INVALID_MESSAGE"));
            break;
    }
}

void ClientSession::handleBinaryMessage(std::string_view data) {
    std::shared_ptr<audio::QueueAudioStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = stream_;
    }

    if (!stream) {
        reply(ErrorMessage("No session started on this connection", "SESSION_NOT_FOUND"));
        return;
    }

    std::string sessionId = getSessionId();
    switch (stream->push(std::vector<uint8_t>(data.begin(), data.end()))) {
        case audio::PushResult::ACCEPTED:
            break;
        case audio::PushResult::FULL:
            utils::Logger::warn("Audio queue of session " + sessionId + " is full, dropping frame of " +
                                std::to_string(data.size()) + " bytes");
            reply(ErrorMessage("Audio is arriving faster than it is transcribed, frame dropped",
                               "AUDIO_BUFFER_FULL", sessionId));
            break;
        case audio::PushResult::ENDED:
            utils::Logger::debug("Ignoring audio for finished input of session " + sessionId);
            break;
    }
}

void ClientSession::handleDisconnect() {
    std::string ownSession;
    std::shared_ptr<audio::QueueAudioStream> stream;
    std::map<std::string, std::string> subscriptions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
        ownSession = sessionId_;
        stream = stream_;
        subscriptions.swap(subscriptions_);
        stream_.reset();
    }

    for (const auto& subscription : subscriptions) {
        hub_->unsubscribe(subscription.second);
    }

    if (!ownSession.empty()) {
        if (stream) {
            stream->finish();
        }
        try {
            Session session = sessionManager_->getTranscriptionSession(ownSession);
            if (!isTerminal(session.status)) {
                sessionManager_->cancelSession(ownSession);
                utils::Logger::info("Cancelled session " + ownSession + " of disconnected client " + connectionId_);
            }
        } catch (const utils::SessionException& e) {
            // Already finalized or cancelled
            utils::Logger::debug("No open session to cancel for " + connectionId_ + ": " + e.what());
        }
    }
}

void ClientSession::processStart(const StartMessage& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            reply(ErrorMessage("A session is already running on this connection", "INVALID_STATE", sessionId_));
            return;
        }
    }

    try {
        TranscriptionConfig config = TranscriptionConfig::fromJson(buildConfig(message.getConfig()));
        auto stream = std::make_shared<audio::QueueAudioStream>(maxPendingFrames_);

        Session session = sessionManager_->startSession(stream, config, message.getMeetingId());
        std::string connection;
        try {
            connection = hub_->subscribe(session.id, sink_);
        } catch (const std::exception&) {
            sessionManager_->cancelSession(session.id);
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessionId_ = session.id;
            stream_ = stream;
            subscriptions_[session.id] = connection;
        }

        reply(SessionStartedMessage(session.id, session.channelId, session.config));
        utils::Logger::info("Connection " + connectionId_ + " started session " + session.id);
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to start session for " + connectionId_ + ": " + e.what());
        replyError(e, "");
    }
}

void ClientSession::processCommand(const SessionCommandMessage& message) {
    std::string sessionId = resolveSessionId(message);
    if (sessionId.empty()) {
        reply(ErrorMessage("No session started on this connection", "SESSION_NOT_FOUND"));
        return;
    }

    std::string action = MessageProtocol::messageTypeToString(message.getType());
    try {
        switch (message.getType()) {
            case MessageType::PAUSE:
                sessionManager_->pauseSession(sessionId);
                break;
            case MessageType::RESUME:
                sessionManager_->resumeSession(sessionId);
                break;
            case MessageType::CANCEL:
                sessionManager_->cancelSession(sessionId);
                break;
            case MessageType::FINALIZE:
                processFinalize(sessionId);
                return;
            case MessageType::SUBSCRIBE:
                processSubscribe(sessionId);
                return;
            case MessageType::UNSUBSCRIBE:
                processUnsubscribe(sessionId);
                return;
            default:
                reply(ErrorMessage("Unsupported command", "INVALID_MESSAGE", sessionId));
                return;
        }
        reply(AckMessage(action, sessionId));
    } catch (const std::exception& e) {
        utils::Logger::warn(action + " failed for session " + sessionId + ": " + e.what());
        replyError(e, sessionId);
    }
}

void ClientSession::processSubscribe(const std::string& sessionId) {
    std::string existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(sessionId);
        if (it != subscriptions_.end()) {
            existing = it->second;
        }
    }

    AckMessage ack("subscribe", sessionId);
    if (!existing.empty()) {
        ack.setData({{"connectionId", existing}});
        reply(ack);
        return;
    }

    std::string connection = hub_->subscribe(sessionId, sink_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_[sessionId] = connection;
    }
    ack.setData({{"connectionId", connection}});
    reply(ack);
}

void ClientSession::processUnsubscribe(const std::string& sessionId) {
    std::string connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(sessionId);
        if (it != subscriptions_.end()) {
            connection = it->second;
            subscriptions_.erase(it);
        }
    }

    if (connection.empty()) {
        reply(ErrorMessage("Not subscribed to session", "NOT_SUBSCRIBED", sessionId));
        return;
    }

    hub_->unsubscribe(connection);
    reply(AckMessage("unsubscribe", sessionId));
}

void ClientSession::processFinalize(const std::string& sessionId) {
    std::shared_ptr<audio::QueueAudioStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessionId == sessionId_) {
            stream = stream_;
            stream_.reset();
        }
    }

    // Deliver what the client already sent before closing the session
    if (stream) {
        stream->finish();
    }

    auto manager = sessionManager_;
    auto sink = sink_;
    auto timeout = drainTimeout_;
    bool ownStream = static_cast<bool>(stream);
    std::string connectionId = connectionId_;

    controlQueue_->enqueue([manager, sink, timeout, ownStream, sessionId, connectionId]() {
        std::string payload;
        try {
            if (ownStream && !manager->waitForInputDrained(sessionId, timeout)) {
                utils::Logger::warn("Timed out waiting for buffered audio of session " + sessionId +
                                    ", finalizing with what was processed");
            }
            FullTranscript transcript = manager->finalizeTranscript(sessionId);

            AckMessage ack("finalize", sessionId);
            ack.setData(toJson(transcript));
            payload = ack.serialize();
        } catch (const std::exception& e) {
            utils::Logger::error("Finalize failed for session " + sessionId + ": " + e.what());
            payload = ErrorMessage(e.what(), errorCodeFor(e), sessionId).serialize();
        }

        try {
            sink->send(payload);
        } catch (const std::exception& e) {
            utils::Logger::warn("Could not deliver finalize reply to " + connectionId + ": " + e.what());
        }
    }, TaskPriority::HIGH);
}

std::string ClientSession::resolveSessionId(const SessionCommandMessage& message) const {
    if (!message.getSessionId().empty()) {
        return message.getSessionId();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionId_;
}

nlohmann::json ClientSession::buildConfig(const nlohmann::json& overrides) const {
    nlohmann::json merged = defaultConfig_;
    if (overrides.is_object()) {
        merged.merge_patch(overrides);
    }
    return merged;
}

void ClientSession::reply(const Message& message) {
    try {
        sink_->send(message.serialize());
    } catch (const std::exception& e) {
        utils::Logger::warn("Failed to send reply to " + connectionId_ + ": " + e.what());
    }
}

void ClientSession::replyError(const std::exception& e, const std::string& sessionId) {
    reply(ErrorMessage(e.what(), errorCodeFor(e), sessionId));
}

std::string ClientSession::errorCodeFor(const std::exception& e) {
    if (auto* session = dynamic_cast<const utils::SessionException*>(&e)) {
        return utils::errorCodeToString(session->getCode());
    }
    if (auto* transcription = dynamic_cast<const utils::TranscriptionException*>(&e)) {
        return utils::errorCodeToString(transcription->getCode());
    }
    if (dynamic_cast<const utils::ConfigurationException*>(&e)) {
        return "CONFIGURATION_ERROR";
    }
    if (dynamic_cast<const utils::DiarizationException*>(&e)) {
        return "DIARIZATION_ERROR";
    }
    if (dynamic_cast<const utils::DistributionException*>(&e)) {
        return "DISTRIBUTION_ERROR";
    }
    return "INTERNAL_ERROR";
}

} // namespace core
} // namespace meetscribe
