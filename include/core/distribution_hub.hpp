#pragma once

#include "core/message_protocol.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Destination of distribution messages, e.g. one WebSocket connection
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    /**
     * Deliver one serialized message
     * @throws std::exception if the destination is gone
     */
    virtual void send(const std::string& payload) = 0;

    // Called once when the hub detaches the sink
    virtual void close() {}
};

struct ConnectionInfo {
    std::string connectionId;
    std::string sessionId;
    std::chrono::steady_clock::time_point connectedAt;
    std::chrono::steady_clock::time_point lastActivity;
    size_t messagesDelivered = 0;
    size_t messagesDropped = 0;
    size_t queuedMessages = 0;
};

struct DistributionStats {
    std::string sessionId;
    std::string channelId;
    size_t connectionCount = 0;
    int64_t connectionTimeMs = 0;   // age of the session channel
    std::chrono::steady_clock::time_point lastActivity;
    size_t messagesBroadcast = 0;
    size_t messagesDropped = 0;
};

/**
 * Per-session publish/subscribe fan-out.
 *
 * Every subscriber owns a bounded FIFO drained by its own delivery thread,
 * so broadcast() never waits on a slow or dead connection. When the queue
 * is full the oldest message is dropped and counted. A sink that throws is
 * detached and reported as WEBSOCKET_CONNECTION_LOST.
 */
class DistributionHub {
public:
    explicit DistributionHub(const utils::DistributionSettings& settings = utils::DistributionSettings());
    ~DistributionHub();

    DistributionHub(const DistributionHub&) = delete;
    DistributionHub& operator=(const DistributionHub&) = delete;

    /**
     * Open the distribution channel of a session
     * @return Channel id; an existing channel's id is returned unchanged
     * @throws DistributionException after shutdown()
     */
    std::string createConnection(const std::string& sessionId);

    /**
     * Attach a sink to a session channel
     * @return Connection id used for unsubscribe()
     * @throws DistributionException if the session has no open channel
     */
    std::string subscribe(const std::string& sessionId, std::shared_ptr<MessageSink> sink);

    /**
     * Detach a subscriber; already queued messages are still delivered by
     * its worker, which closes the sink afterwards. Never waits on the sink.
     * @return false if the connection is unknown
     */
    bool unsubscribe(const std::string& connectionId);

    // Best-effort fan-out to every subscriber of the session
    void broadcast(const std::string& sessionId, const DistributionMessage& message);

    /**
     * Close a channel id (with all its subscribers) or a single connection id
     */
    void close(const std::string& id);

    // Close the channel of a session and detach its subscribers
    void closeSession(const std::string& sessionId);

    bool hasChannel(const std::string& sessionId) const;

    // Record inbound activity on a connection
    void touch(const std::string& connectionId);

    std::vector<std::string> getSessionConnections(const std::string& sessionId) const;
    std::vector<ConnectionInfo> getActiveConnections() const;
    std::optional<DistributionStats> getSessionStats(const std::string& sessionId) const;

    /**
     * Detach connections without activity for longer than the threshold
     * @return Number of connections removed
     */
    size_t sweepStaleConnections(std::chrono::milliseconds threshold);
    size_t sweepStaleConnections();

    // Drain queues, detach every subscriber, join their workers and refuse new channels
    void shutdown();

    // Detached subscribers whose worker has not exited yet
    size_t getRetiredCount() const;

private:
    struct Subscriber {
        std::string id;
        std::string sessionId;
        std::shared_ptr<MessageSink> sink;
        size_t capacity = 0;

        std::deque<std::string> queue;
        bool stopping = false;
        std::mutex mutex;
        std::condition_variable condition;
        std::thread worker;

        std::atomic<bool> failed{false};
        std::atomic<bool> finished{false};
        std::atomic<size_t> delivered{0};
        std::atomic<size_t> dropped{0};
        std::chrono::steady_clock::time_point connectedAt;
        std::atomic<int64_t> lastActivityMs{0};   // steady clock, ms since epoch
    };

    struct Channel {
        std::string id;
        std::string sessionId;
        std::chrono::steady_clock::time_point createdAt;
        std::vector<std::string> connections;
        size_t messagesBroadcast = 0;
        size_t messagesDropped = 0;
        std::chrono::steady_clock::time_point lastActivity;
    };

    void deliveryLoop(std::shared_ptr<Subscriber> subscriber);
    void enqueue(Subscriber& subscriber, const std::string& payload);

    // Caller holds mutex_; returns the detached subscriber for stopSubscriber()
    std::shared_ptr<Subscriber> detachLocked(const std::string& connectionId);
    void stopSubscriber(const std::shared_ptr<Subscriber>& subscriber);

    // Remove subscribers whose sink failed
    void reapFailed();

    // Join workers of detached subscribers; only finished ones unless waitAll
    void reapRetired(bool waitAll);

    static int64_t nowMs();
    static ConnectionInfo describe(const Subscriber& subscriber);

    utils::DistributionSettings settings_;

    std::unordered_map<std::string, Channel> channels_;              // by session id
    std::unordered_map<std::string, std::string> channelIds_;         // channel id -> session id
    std::unordered_map<std::string, std::shared_ptr<Subscriber>> subscribers_;
    bool shutdown_ = false;
    mutable std::mutex mutex_;

    std::vector<std::shared_ptr<Subscriber>> retired_;
    mutable std::mutex retiredMutex_;
};

} // namespace core
} // namespace meetscribe
