#pragma once

#include "core/task_queue.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

// Event name handed to downstream workers
constexpr const char* POST_PROCESS_EVENT = "transcription/post-process";

struct PostProcessingRequest {
    std::string sessionId;
    std::string transcriptId;
    size_t segmentCount = 0;
    int64_t duration = 0;           // ms

    nlohmann::json toJson() const;
};

/**
 * Handoff of finished transcripts to post-processing
 */
class PostProcessingScheduler {
public:
    virtual ~PostProcessingScheduler() = default;

    /**
     * Queue post-processing of a transcript without waiting for it
     * @throws std::exception if the request cannot be queued
     */
    virtual void schedule(const PostProcessingRequest& request) = 0;
};

/**
 * In-process scheduler running registered handlers on a worker pool
 */
class QueuedPostProcessingScheduler : public PostProcessingScheduler {
public:
    using Handler = std::function<void(const std::string& event, const PostProcessingRequest& request)>;

    explicit QueuedPostProcessingScheduler(size_t workerThreads = 1);
    ~QueuedPostProcessingScheduler() override;

    QueuedPostProcessingScheduler(const QueuedPostProcessingScheduler&) = delete;
    QueuedPostProcessingScheduler& operator=(const QueuedPostProcessingScheduler&) = delete;

    void addHandler(Handler handler);

    /**
     * @throws MeetScribeException after shutdown()
     */
    void schedule(const PostProcessingRequest& request) override;

    bool waitForIdle(std::chrono::milliseconds timeout);
    void shutdown();

    size_t getScheduledCount() const { return scheduled_; }
    size_t getCompletedCount() const { return completed_; }
    size_t getFailedCount() const { return failed_; }

private:
    void dispatch(const PostProcessingRequest& request);

    std::shared_ptr<TaskQueue> taskQueue_;
    std::unique_ptr<ThreadPool> threadPool_;

    std::vector<Handler> handlers_;
    std::mutex handlersMutex_;

    std::atomic<size_t> scheduled_;
    std::atomic<size_t> completed_;
    std::atomic<size_t> failed_;
};

} // namespace core
} // namespace meetscribe
