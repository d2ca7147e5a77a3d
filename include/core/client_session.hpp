#pragma once

#include "audio/audio_stream.hpp"
#include "core/distribution_hub.hpp"
#include "core/message_protocol.hpp"
#include "core/session_manager.hpp"
#include "core/task_queue.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace meetscribe {
namespace core {

/**
 * Control handler for one client connection.
 *
 * Text frames are JSON control messages, binary frames are audio for the
 * session this connection started. Replies and distribution messages go out
 * through the connection's sink. Finalize waits for buffered audio on the
 * control queue so the transport thread is never blocked on model calls.
 */
class ClientSession {
public:
    ClientSession(const std::string& connectionId,
                  std::shared_ptr<SessionManager> sessionManager,
                  std::shared_ptr<DistributionHub> hub,
                  std::shared_ptr<MessageSink> sink,
                  std::shared_ptr<TaskQueue> controlQueue,
                  const nlohmann::json& defaultConfig = nlohmann::json::object());
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    const std::string& getConnectionId() const { return connectionId_; }
    bool isConnected() const { return connected_; }

    // Session started by this connection, empty before start
    std::string getSessionId() const;

    void handleMessage(const std::string& message);
    void handleBinaryMessage(std::string_view data);

    // Drop subscriptions and cancel the connection's own session if still open
    void handleDisconnect();

    // Upper bound on waiting for buffered audio during finalize
    void setDrainTimeout(std::chrono::milliseconds timeout) { drainTimeout_ = timeout; }

    // Unread audio frames kept for the session before new ones are refused
    void setMaxPendingFrames(size_t frames) { maxPendingFrames_ = frames; }

private:
    void processStart(const StartMessage& message);
    void processCommand(const SessionCommandMessage& message);
    void processSubscribe(const std::string& sessionId);
    void processUnsubscribe(const std::string& sessionId);
    void processFinalize(const std::string& sessionId);

    std::string resolveSessionId(const SessionCommandMessage& message) const;
    nlohmann::json buildConfig(const nlohmann::json& overrides) const;

    void reply(const Message& message);
    void replyError(const std::exception& e, const std::string& sessionId);
    static std::string errorCodeFor(const std::exception& e);

    std::string connectionId_;
    bool connected_;

    std::shared_ptr<SessionManager> sessionManager_;
    std::shared_ptr<DistributionHub> hub_;
    std::shared_ptr<MessageSink> sink_;
    std::shared_ptr<TaskQueue> controlQueue_;
    nlohmann::json defaultConfig_;
    std::chrono::milliseconds drainTimeout_{30000};
    size_t maxPendingFrames_ = audio::QueueAudioStream::DEFAULT_MAX_PENDING_FRAMES;

    // Own session and its input stream
    std::string sessionId_;
    std::shared_ptr<audio::QueueAudioStream> stream_;

    // sessionId -> hub connection id
    std::map<std::string, std::string> subscriptions_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace meetscribe
