#include "core/websocket_server.hpp"
#include "core/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include "utils/id_generator.hpp"
#include "utils/logging.hpp"
#include <App.h>
#include <vector>

namespace meetscribe {
namespace core {

namespace {

struct PerSocketData {
    std::string connectionId;
    std::shared_ptr<WebSocketSink> sink;
};

using Socket = uWS::WebSocket<false, true, PerSocketData>;

} // namespace

/**
 * Sink writing text frames to one socket. send() may be called from any
 * thread; the write itself is deferred onto the event loop.
 */
class WebSocketSink : public MessageSink, public std::enable_shared_from_this<WebSocketSink> {
public:
    WebSocketSink(uWS::Loop* loop, Socket* ws) : loop_(loop), ws_(ws), open_(true) {}

    void send(const std::string& payload) override {
        if (!open_) {
            throw utils::DistributionException("WebSocket connection is closed");
        }
        auto self = shared_from_this();
        loop_->defer([self, payload]() {
            if (self->open_) {
                self->ws_->send(payload, uWS::OpCode::TEXT);
            }
        });
    }

    // Event loop thread only
    void detach() { open_ = false; }

    void end(int code, const std::string& reason) {
        auto self = shared_from_this();
        loop_->defer([self, code, reason]() {
            if (self->open_) {
                self->ws_->end(code, reason);
            }
        });
    }

private:
    uWS::Loop* loop_;
    Socket* ws_;
    std::atomic<bool> open_;
};

WebSocketServer::WebSocketServer(int port,
                                 std::shared_ptr<SessionManager> sessionManager,
                                 std::shared_ptr<DistributionHub> hub,
                                 std::shared_ptr<models::ModelTranscriptionClient> modelClient,
                                 const nlohmann::json& defaultConfig,
                                 size_t controlThreads)
    : port_(port), running_(false),
      sessionManager_(std::move(sessionManager)), hub_(std::move(hub)),
      modelClient_(std::move(modelClient)), defaultConfig_(defaultConfig),
      controlQueue_(std::make_shared<TaskQueue>()),
      controlPool_(std::make_unique<ThreadPool>(controlThreads == 0 ? 1 : controlThreads, "control")),
      loop_(nullptr), listenSocket_(nullptr) {
    controlPool_->start(controlQueue_);
}

WebSocketServer::~WebSocketServer() {
    stop();
    controlPool_->stop();

    std::unordered_map<std::string, std::shared_ptr<ClientSession>> connections;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        connections.swap(connections_);
        sockets_.clear();
    }
    for (auto& connection : connections) {
        connection.second->handleDisconnect();
    }
}

void WebSocketServer::run() {
    utils::Logger::info("Starting WebSocket server on port " + std::to_string(port_));

    uWS::App app;
    loop_ = uWS::Loop::get();
    running_ = true;

    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.maxPayloadLength = 16 * 1024 * 1024;
    behavior.idleTimeout = 120;

    behavior.open = [this](Socket* ws) {
        auto* data = ws->getUserData();
        data->connectionId = utils::IdGenerator::generate("client");
        data->sink = std::make_shared<WebSocketSink>(loop_.load(), ws);
        handleNewConnection(data->connectionId, data->sink);
    };

    behavior.message = [this](Socket* ws, std::string_view message, uWS::OpCode opCode) {
        auto* data = ws->getUserData();
        if (opCode == uWS::OpCode::TEXT) {
            handleMessage(data->connectionId, std::string(message));
        } else if (opCode == uWS::OpCode::BINARY) {
            handleBinaryMessage(data->connectionId, message);
        }
    };

    behavior.close = [this](Socket* ws, int code, std::string_view message) {
        auto* data = ws->getUserData();
        if (data->sink) {
            data->sink->detach();
        }
        utils::Logger::debug("Socket " + data->connectionId + " closed with code " + std::to_string(code));
        handleDisconnection(data->connectionId);
        data->sink.reset();
    };

    app.ws<PerSocketData>("/ws", std::move(behavior));

    app.get("/health", [this](auto* res, auto* req) {
        EndpointResponse response = handleHealthCheck();
        res->writeStatus(response.status)
           ->writeHeader("Content-Type", "application/json")
           ->writeHeader("Cache-Control", "no-cache")
           ->end(response.body.dump());
    });

    app.get("/models", [this](auto* res, auto* req) {
        EndpointResponse response = handleModels();
        res->writeStatus(response.status)
           ->writeHeader("Content-Type", "application/json")
           ->end(response.body.dump());
    });

    app.listen(port_, [this](us_listen_socket_t* listenSocket) {
        listenSocket_ = listenSocket;
        if (listenSocket) {
            utils::Logger::info("WebSocket server listening on port " + std::to_string(port_));
        } else {
            utils::Logger::error("Failed to listen on port " + std::to_string(port_));
        }
    });

    if (!listenSocket_) {
        running_ = false;
        loop_ = nullptr;
        throw utils::MeetScribeException(utils::ErrorInfo(
            utils::ErrorCategory::SYSTEM, utils::ErrorSeverity::CRITICAL,
            "Failed to listen on port " + std::to_string(port_)));
    }

    utils::Logger::info("Server started successfully. Press Ctrl+C to stop.");
    app.run();

    running_ = false;
    loop_ = nullptr;
    utils::Logger::info("WebSocket server stopped");
}

void WebSocketServer::stop() {
    uWS::Loop* loop = loop_.load();
    if (!running_ || !loop) {
        return;
    }

    utils::Logger::info("Stopping WebSocket server");
    loop->defer([this]() {
        if (listenSocket_) {
            us_listen_socket_close(0, listenSocket_);
            listenSocket_ = nullptr;
        }

        std::vector<std::shared_ptr<WebSocketSink>> sockets;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            for (auto& socket : sockets_) {
                sockets.push_back(socket.second);
            }
        }
        for (auto& socket : sockets) {
            socket->end(1001, "Server shutting down");
        }
    });
}

size_t WebSocketServer::getConnectionCount() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    return connections_.size();
}

void WebSocketServer::handleNewConnection(const std::string& connectionId, std::shared_ptr<WebSocketSink> sink) {
    utils::Logger::info("New client connection: " + connectionId);

    auto session = std::make_shared<ClientSession>(connectionId, sessionManager_, hub_, sink,
                                                   controlQueue_, defaultConfig_);
    session->setMaxPendingFrames(maxPendingAudioFrames_);

    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        connections_[connectionId] = session;
        sockets_[connectionId] = std::move(sink);
        total = connections_.size();
    }

    utils::Logger::info("Total active connections: " + std::to_string(total));
}

std::shared_ptr<ClientSession> WebSocketServer::findConnection(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto it = connections_.find(connectionId);
    return it != connections_.end() ? it->second : nullptr;
}

void WebSocketServer::handleMessage(const std::string& connectionId, const std::string& message) {
    auto session = findConnection(connectionId);
    if (!session) {
        utils::Logger::warn("Message from unknown connection: " + connectionId);
        return;
    }
    session->handleMessage(message);
}

void WebSocketServer::handleBinaryMessage(const std::string& connectionId, std::string_view data) {
    auto session = findConnection(connectionId);
    if (!session) {
        utils::Logger::warn("Binary message from unknown connection: " + connectionId);
        return;
    }
    session->handleBinaryMessage(data);
}

void WebSocketServer::handleDisconnection(const std::string& connectionId) {
    utils::Logger::info("Client disconnected: " + connectionId);

    std::shared_ptr<ClientSession> session;
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(connectionId);
        if (it != connections_.end()) {
            session = it->second;
            connections_.erase(it);
        }
        sockets_.erase(connectionId);
        remaining = connections_.size();
    }

    if (session) {
        session->handleDisconnect();
    }

    utils::Logger::info("Connection removed. Remaining active connections: " + std::to_string(remaining));
}

EndpointResponse WebSocketServer::handleHealthCheck() const {
    EndpointResponse response;
    try {
        models::ClientHealth health = modelClient_->healthCheck();

        response.status = health.status == models::HealthStatus::UNHEALTHY ? "503 Service Unavailable" : "200 OK";
        response.body = toJson(health);
        response.body["service"] = "MeetScribe";
        response.body["activeSessions"] = sessionManager_->listSessions().size();
        response.body["connections"] = getConnectionCount();
    } catch (const std::exception& e) {
        utils::Logger::error("Exception in health check endpoint: " + std::string(e.what()));
        response.status = "500 Internal Server Error";
        response.body = {{"status", "error"}, {"message", "Internal server error"}};
    }
    return response;
}

EndpointResponse WebSocketServer::handleModels() const {
    EndpointResponse response;
    try {
        nlohmann::json statuses = nlohmann::json::array();
        for (const auto& status : modelClient_->getAllModelStatuses()) {
            statuses.push_back(toJson(status));
        }
        nlohmann::json performance = nlohmann::json::array();
        for (const auto& entry : modelClient_->getAllModelPerformance()) {
            performance.push_back(toJson(entry));
        }

        response.status = "200 OK";
        response.body = {{"models", statuses}, {"performance", performance}};
    } catch (const std::exception& e) {
        utils::Logger::error("Exception in models endpoint: " + std::string(e.what()));
        response.status = "500 Internal Server Error";
        response.body = {{"status", "error"}, {"message", "Internal server error"}};
    }
    return response;
}

} // namespace core
} // namespace meetscribe
