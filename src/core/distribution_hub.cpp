#include "core/distribution_hub.hpp"
#include "utils/error_handler.hpp"
#include "utils/id_generator.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace meetscribe {
namespace core {

DistributionHub::DistributionHub(const utils::DistributionSettings& settings)
    : settings_(settings) {
    if (settings_.maxQueuedMessages == 0) {
        settings_.maxQueuedMessages = 1;
    }
}

DistributionHub::~DistributionHub() {
    shutdown();
}

int64_t DistributionHub::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string DistributionHub::createConnection(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        throw utils::DistributionException("Distribution hub is shut down", sessionId);
    }

    auto it = channels_.find(sessionId);
    if (it != channels_.end()) {
        return it->second.id;
    }

    Channel channel;
    channel.id = utils::IdGenerator::generate("ws");
    channel.sessionId = sessionId;
    channel.createdAt = std::chrono::steady_clock::now();
    channel.lastActivity = channel.createdAt;

    channelIds_[channel.id] = sessionId;
    std::string channelId = channel.id;
    channels_.emplace(sessionId, std::move(channel));

    utils::Logger::debug("Opened distribution channel " + channelId + " for session " + sessionId);
    return channelId;
}

std::string DistributionHub::subscribe(const std::string& sessionId, std::shared_ptr<MessageSink> sink) {
    if (!sink) {
        throw utils::DistributionException("Cannot subscribe a null sink", sessionId);
    }
    reapRetired(false);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(sessionId);
    if (shutdown_ || it == channels_.end()) {
        throw utils::DistributionException("No open distribution channel for session", sessionId);
    }

    auto subscriber = std::make_shared<Subscriber>();
    subscriber->id = utils::IdGenerator::generate("conn");
    subscriber->sessionId = sessionId;
    subscriber->sink = std::move(sink);
    subscriber->capacity = settings_.maxQueuedMessages;
    subscriber->connectedAt = std::chrono::steady_clock::now();
    subscriber->lastActivityMs = nowMs();
    subscriber->worker = std::thread(&DistributionHub::deliveryLoop, this, subscriber);

    subscribers_[subscriber->id] = subscriber;
    it->second.connections.push_back(subscriber->id);

    utils::Logger::info("Subscriber " + subscriber->id + " attached to session " + sessionId +
                        " (" + std::to_string(it->second.connections.size()) + " connections)");
    return subscriber->id;
}

bool DistributionHub::unsubscribe(const std::string& connectionId) {
    std::shared_ptr<Subscriber> subscriber;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriber = detachLocked(connectionId);
    }
    if (!subscriber) {
        return false;
    }
    stopSubscriber(subscriber);
    utils::Logger::info("Subscriber " + connectionId + " detached");
    return true;
}

void DistributionHub::broadcast(const std::string& sessionId, const DistributionMessage& message) {
    reapFailed();

    std::string payload = message.serialize();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(sessionId);
    if (it == channels_.end()) {
        utils::Logger::debug("Dropping " + MessageProtocol::messageTypeToString(message.getType()) +
                             " message for session without channel: " + sessionId);
        return;
    }

    Channel& channel = it->second;
    channel.messagesBroadcast++;
    channel.lastActivity = std::chrono::steady_clock::now();

    for (const auto& connectionId : channel.connections) {
        auto subIt = subscribers_.find(connectionId);
        if (subIt == subscribers_.end()) {
            continue;
        }
        size_t droppedBefore = subIt->second->dropped;
        enqueue(*subIt->second, payload);
        if (subIt->second->dropped != droppedBefore) {
            channel.messagesDropped++;
        }
    }
}

void DistributionHub::enqueue(Subscriber& subscriber, const std::string& payload) {
    {
        std::lock_guard<std::mutex> lock(subscriber.mutex);
        if (subscriber.stopping) {
            return;
        }
        if (subscriber.queue.size() >= subscriber.capacity) {
            subscriber.queue.pop_front();
            subscriber.dropped++;
        }
        subscriber.queue.push_back(payload);
    }
    subscriber.condition.notify_one();
}

void DistributionHub::deliveryLoop(std::shared_ptr<Subscriber> subscriber) {
    while (true) {
        std::string payload;
        {
            std::unique_lock<std::mutex> lock(subscriber->mutex);
            subscriber->condition.wait(lock, [&subscriber] {
                return subscriber->stopping || !subscriber->queue.empty();
            });
            if (subscriber->queue.empty()) {
                break;
            }
            payload = std::move(subscriber->queue.front());
            subscriber->queue.pop_front();
        }

        try {
            subscriber->sink->send(payload);
            subscriber->delivered++;
            subscriber->lastActivityMs = nowMs();
        } catch (const std::exception& e) {
            subscriber->failed = true;
            utils::Logger::warn("Subscriber " + subscriber->id + " lost: " + e.what());
            utils::ErrorHandler::getInstance().reportError(
                utils::TranscriptionException(utils::TranscriptionErrorCode::WEBSOCKET_CONNECTION_LOST,
                                              "Delivery to " + subscriber->id + " failed: " + e.what(),
                                              "", subscriber->sessionId),
                "DistributionHub", subscriber->sessionId);
            break;
        }
    }

    try {
        subscriber->sink->close();
    } catch (const std::exception& e) {
        utils::Logger::warn("Error closing subscriber " + subscriber->id + ": " + e.what());
    }
    subscriber->finished = true;
}

std::shared_ptr<DistributionHub::Subscriber> DistributionHub::detachLocked(const std::string& connectionId) {
    auto it = subscribers_.find(connectionId);
    if (it == subscribers_.end()) {
        return nullptr;
    }

    std::shared_ptr<Subscriber> subscriber = it->second;
    subscribers_.erase(it);

    auto channelIt = channels_.find(subscriber->sessionId);
    if (channelIt != channels_.end()) {
        auto& connections = channelIt->second.connections;
        connections.erase(std::remove(connections.begin(), connections.end(), connectionId), connections.end());
    }
    return subscriber;
}

void DistributionHub::stopSubscriber(const std::shared_ptr<Subscriber>& subscriber) {
    {
        std::lock_guard<std::mutex> lock(subscriber->mutex);
        subscriber->stopping = true;
    }
    subscriber->condition.notify_all();

    std::lock_guard<std::mutex> lock(retiredMutex_);
    retired_.push_back(subscriber);
}

void DistributionHub::reapRetired(bool waitAll) {
    std::vector<std::shared_ptr<Subscriber>> done;
    {
        std::lock_guard<std::mutex> lock(retiredMutex_);
        auto split = std::partition(retired_.begin(), retired_.end(),
                                    [waitAll](const std::shared_ptr<Subscriber>& subscriber) {
                                        return !waitAll && !subscriber->finished;
                                    });
        done.assign(split, retired_.end());
        retired_.erase(split, retired_.end());
    }

    for (const auto& subscriber : done) {
        if (!subscriber->worker.joinable()) {
            continue;
        }
        if (subscriber->worker.get_id() == std::this_thread::get_id()) {
            subscriber->worker.detach();
        } else {
            subscriber->worker.join();
        }
    }
}

size_t DistributionHub::getRetiredCount() const {
    std::lock_guard<std::mutex> lock(retiredMutex_);
    return static_cast<size_t>(std::count_if(retired_.begin(), retired_.end(),
                                             [](const std::shared_ptr<Subscriber>& subscriber) {
                                                 return !subscriber->finished;
                                             }));
}

void DistributionHub::reapFailed() {
    reapRetired(false);

    std::vector<std::shared_ptr<Subscriber>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& entry : subscribers_) {
            if (entry.second->failed) {
                ids.push_back(entry.first);
            }
        }
        for (const auto& id : ids) {
            failed.push_back(detachLocked(id));
        }
    }
    for (const auto& subscriber : failed) {
        stopSubscriber(subscriber);
        utils::Logger::info("Detached failed subscriber " + subscriber->id);
    }
}

void DistributionHub::close(const std::string& id) {
    std::string sessionId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channelIds_.find(id);
        if (it != channelIds_.end()) {
            sessionId = it->second;
        }
    }

    if (!sessionId.empty()) {
        closeSession(sessionId);
    } else if (!unsubscribe(id)) {
        utils::Logger::debug("Close requested for unknown connection: " + id);
    }
}

void DistributionHub::closeSession(const std::string& sessionId) {
    std::vector<std::shared_ptr<Subscriber>> detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(sessionId);
        if (it == channels_.end()) {
            return;
        }

        std::vector<std::string> connections = it->second.connections;
        for (const auto& connectionId : connections) {
            auto subscriber = detachLocked(connectionId);
            if (subscriber) {
                detached.push_back(subscriber);
            }
        }
        channelIds_.erase(it->second.id);
        channels_.erase(it);
    }

    for (const auto& subscriber : detached) {
        stopSubscriber(subscriber);
    }
    utils::Logger::debug("Closed distribution channel of session " + sessionId);
}

bool DistributionHub::hasChannel(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.count(sessionId) > 0;
}

void DistributionHub::touch(const std::string& connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(connectionId);
    if (it != subscribers_.end()) {
        it->second->lastActivityMs = nowMs();
    }
}

ConnectionInfo DistributionHub::describe(const Subscriber& subscriber) {
    ConnectionInfo info;
    info.connectionId = subscriber.id;
    info.sessionId = subscriber.sessionId;
    info.connectedAt = subscriber.connectedAt;
    info.lastActivity = std::chrono::steady_clock::time_point(
        std::chrono::milliseconds(subscriber.lastActivityMs.load()));
    info.messagesDelivered = subscriber.delivered;
    info.messagesDropped = subscriber.dropped;
    return info;
}

std::vector<std::string> DistributionHub::getSessionConnections(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(sessionId);
    if (it == channels_.end()) {
        return {};
    }
    return it->second.connections;
}

std::vector<ConnectionInfo> DistributionHub::getActiveConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionInfo> result;
    for (const auto& entry : subscribers_) {
        if (entry.second->failed) {
            continue;
        }
        ConnectionInfo info = describe(*entry.second);
        {
            std::lock_guard<std::mutex> subLock(entry.second->mutex);
            info.queuedMessages = entry.second->queue.size();
        }
        result.push_back(info);
    }
    return result;
}

std::optional<DistributionStats> DistributionHub::getSessionStats(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(sessionId);
    if (it == channels_.end()) {
        return std::nullopt;
    }

    const Channel& channel = it->second;
    DistributionStats stats;
    stats.sessionId = sessionId;
    stats.channelId = channel.id;
    stats.connectionCount = channel.connections.size();
    stats.connectionTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - channel.createdAt).count();
    stats.lastActivity = channel.lastActivity;
    stats.messagesBroadcast = channel.messagesBroadcast;
    stats.messagesDropped = channel.messagesDropped;
    return stats;
}

size_t DistributionHub::sweepStaleConnections(std::chrono::milliseconds threshold) {
    std::vector<std::shared_ptr<Subscriber>> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = nowMs();
        std::vector<std::string> ids;
        for (const auto& entry : subscribers_) {
            if (entry.second->failed || now - entry.second->lastActivityMs > threshold.count()) {
                ids.push_back(entry.first);
            }
        }
        for (const auto& id : ids) {
            stale.push_back(detachLocked(id));
        }
    }

    for (const auto& subscriber : stale) {
        stopSubscriber(subscriber);
    }
    if (!stale.empty()) {
        utils::Logger::info("Swept " + std::to_string(stale.size()) + " stale connections");
    }
    return stale.size();
}

size_t DistributionHub::sweepStaleConnections() {
    return sweepStaleConnections(std::chrono::milliseconds(settings_.staleConnectionMs));
}

void DistributionHub::shutdown() {
    std::vector<std::shared_ptr<Subscriber>> detached;
    bool alreadyShutdown = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alreadyShutdown = shutdown_;
        shutdown_ = true;
        for (auto& entry : subscribers_) {
            detached.push_back(entry.second);
        }
        subscribers_.clear();
        channels_.clear();
        channelIds_.clear();
    }

    for (const auto& subscriber : detached) {
        stopSubscriber(subscriber);
    }
    reapRetired(true);
    if (!alreadyShutdown) {
        utils::Logger::info("Distribution hub shut down, detached " + std::to_string(detached.size()) +
                            " connections");
    }
}

} // namespace core
} // namespace meetscribe
