#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>
#include <atomic>
#include <memory>
#include <future>
#include <chrono>
#include <string>
#include <cstdint>

namespace meetscribe {
namespace core {

/**
 * Scheduling class of a queued job.
 * Finalize replies run at HIGH, model calls at NORMAL, post-processing at LOW.
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2
};

/**
 * Job handed out by TaskQueue::dequeue. Empty once the queue is shut down and drained.
 */
using Job = std::function<void()>;

/**
 * Blocking job queue shared by a ThreadPool and its producers.
 * Higher priority runs first; equal priorities run in submission order.
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * Queue a job. Ignored after shutdown.
     */
    void enqueue(Job job, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * Queue a callable and get its result, or its exception, through a future.
     * After shutdown the future reports broken_promise.
     */
    template<typename F, typename... Args>
    auto enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    /**
     * Wait for the next job. Jobs queued before shutdown are still handed out;
     * an empty Job means the queue is shut down and drained.
     */
    Job dequeue();

    void shutdown();
    bool isShuttingDown() const;

    /**
     * Called by the worker once a dequeued job has returned
     */
    void markDone();

    /**
     * True when nothing is queued and every dequeued job has been marked done
     */
    bool isIdle() const;

private:
    struct Entry {
        TaskPriority priority;
        uint64_t sequence;
        Job job;
    };

    struct RunsLater {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<Entry, std::vector<Entry>, RunsLater> pending_;
    uint64_t nextSequence_ = 0;
    size_t inFlight_ = 0;
    std::atomic<bool> shutdown_;
};

/**
 * Fixed set of named worker threads draining one TaskQueue.
 * A job that throws is logged and does not take its worker down.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency(),
                        const std::string& name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Spawn the workers on the given queue. No-op while already running.
     */
    void start(std::shared_ptr<TaskQueue> queue);

    /**
     * Shut the queue down and join the workers once their current jobs return
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * Block until the queue is drained and no job is executing
     * @return false if the timeout elapsed first
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    void workerLoop();

    size_t numThreads_;
    std::string name_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> queue_;
    std::atomic<bool> running_;

    std::mutex idleMutex_;
    std::condition_variable idleCondition_;
};

template<typename F, typename... Args>
auto TaskQueue::enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
    using Result = typename std::result_of<F(Args...)>::type;

    auto packaged = std::make_shared<std::packaged_task<Result()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Result> result = packaged->get_future();

    enqueue([packaged]() { (*packaged)(); }, priority);
    return result;
}

} // namespace core
} // namespace meetscribe
