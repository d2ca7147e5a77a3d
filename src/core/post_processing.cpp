#include "core/post_processing.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace meetscribe {
namespace core {

nlohmann::json PostProcessingRequest::toJson() const {
    return {
        {"sessionId", sessionId},
        {"transcriptId", transcriptId},
        {"segments", segmentCount},
        {"duration", duration}
    };
}

QueuedPostProcessingScheduler::QueuedPostProcessingScheduler(size_t workerThreads)
    : taskQueue_(std::make_shared<TaskQueue>()),
      threadPool_(std::make_unique<ThreadPool>(workerThreads == 0 ? 1 : workerThreads, "post-processing")),
      scheduled_(0), completed_(0), failed_(0) {
    threadPool_->start(taskQueue_);
}

QueuedPostProcessingScheduler::~QueuedPostProcessingScheduler() {
    shutdown();
}

void QueuedPostProcessingScheduler::addHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_.push_back(std::move(handler));
}

void QueuedPostProcessingScheduler::schedule(const PostProcessingRequest& request) {
    if (taskQueue_->isShuttingDown()) {
        throw utils::MeetScribeException(utils::ErrorInfo(
            utils::ErrorCategory::POST_PROCESSING, utils::ErrorSeverity::ERROR,
            "Post-processing scheduler is shut down", request.transcriptId, "", request.sessionId));
    }

    scheduled_++;
    taskQueue_->enqueue([this, request]() { dispatch(request); }, TaskPriority::LOW);
    utils::Logger::debug("Scheduled " + std::string(POST_PROCESS_EVENT) + " for session " + request.sessionId);
}

void QueuedPostProcessingScheduler::dispatch(const PostProcessingRequest& request) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers = handlers_;
    }

    bool ok = true;
    for (const auto& handler : handlers) {
        try {
            handler(POST_PROCESS_EVENT, request);
        } catch (const std::exception& e) {
            ok = false;
            utils::Logger::error("Post-processing handler failed for session " + request.sessionId + ": " + e.what());
            utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
                utils::ErrorCategory::POST_PROCESSING, utils::ErrorSeverity::ERROR,
                "Post-processing handler failed", e.what(), POST_PROCESS_EVENT, request.sessionId));
        }
    }

    if (ok) {
        completed_++;
    } else {
        failed_++;
    }
}

bool QueuedPostProcessingScheduler::waitForIdle(std::chrono::milliseconds timeout) {
    return threadPool_->waitForIdle(timeout);
}

void QueuedPostProcessingScheduler::shutdown() {
    if (threadPool_->isRunning()) {
        if (!threadPool_->waitForIdle(std::chrono::milliseconds(5000))) {
            utils::Logger::warn("Post-processing still busy at shutdown, pending requests are dropped");
        }
        threadPool_->stop();
    }
}

} // namespace core
} // namespace meetscribe
