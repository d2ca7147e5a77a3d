#pragma once

#include "core/client_session.hpp"
#include "core/distribution_hub.hpp"
#include "core/session_manager.hpp"
#include "core/task_queue.hpp"
#include "models/model_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

// Forward declarations for uWS types
namespace uWS {
    struct Loop;
}
struct us_listen_socket_t;

namespace meetscribe {
namespace core {

class WebSocketSink;

struct EndpointResponse {
    std::string status;
    nlohmann::json body;
};

/**
 * uWebSockets front end: control and audio over /ws, plus GET /health and
 * GET /models. All socket callbacks run on the event loop thread; sinks handed
 * to the distribution hub defer their writes onto that loop.
 */
class WebSocketServer {
public:
    WebSocketServer(int port,
                    std::shared_ptr<SessionManager> sessionManager,
                    std::shared_ptr<DistributionHub> hub,
                    std::shared_ptr<models::ModelTranscriptionClient> modelClient,
                    const nlohmann::json& defaultConfig = nlohmann::json::object(),
                    size_t controlThreads = 2);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Blocks running the event loop until stop()
    void run();
    void stop();

    bool isRunning() const { return running_; }

    // Applied to the audio queue of every session started over /ws
    void setMaxPendingAudioFrames(size_t frames) { maxPendingAudioFrames_ = frames; }
    size_t getConnectionCount() const;

    // Health check response: 200 unless the model client is unhealthy
    EndpointResponse handleHealthCheck() const;

    // Statuses and performance of every known model
    EndpointResponse handleModels() const;

private:
    void handleNewConnection(const std::string& connectionId, std::shared_ptr<WebSocketSink> sink);
    void handleMessage(const std::string& connectionId, const std::string& message);
    void handleBinaryMessage(const std::string& connectionId, std::string_view data);
    void handleDisconnection(const std::string& connectionId);

    std::shared_ptr<ClientSession> findConnection(const std::string& connectionId) const;

    int port_;
    std::atomic<bool> running_;

    std::shared_ptr<SessionManager> sessionManager_;
    std::shared_ptr<DistributionHub> hub_;
    std::shared_ptr<models::ModelTranscriptionClient> modelClient_;
    nlohmann::json defaultConfig_;
    size_t maxPendingAudioFrames_ = audio::QueueAudioStream::DEFAULT_MAX_PENDING_FRAMES;

    std::shared_ptr<TaskQueue> controlQueue_;
    std::unique_ptr<ThreadPool> controlPool_;

    std::unordered_map<std::string, std::shared_ptr<ClientSession>> connections_;
    std::unordered_map<std::string, std::shared_ptr<WebSocketSink>> sockets_;
    mutable std::mutex connectionsMutex_;

    // Set while run() is on the event loop
    std::atomic<uWS::Loop*> loop_;
    us_listen_socket_t* listenSocket_;
};

} // namespace core
} // namespace meetscribe
