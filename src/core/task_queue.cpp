#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace meetscribe {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

void TaskQueue::enqueue(Job job, TaskPriority priority) {
    if (!job) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        pending_.push(Entry{priority, nextSequence_++, std::move(job)});
    }
    condition_.notify_one();
}

Job TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return shutdown_ || !pending_.empty(); });

    if (pending_.empty()) {
        return Job();
    }

    Job job = pending_.top().job;
    pending_.pop();
    ++inFlight_;
    return job;
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

void TaskQueue::markDone() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inFlight_ > 0) {
        --inFlight_;
    }
}

bool TaskQueue::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty() && inFlight_ == 0;
}

ThreadPool::ThreadPool(size_t numThreads, const std::string& name)
    : numThreads_(numThreads == 0 ? 1 : numThreads), name_(name), running_(false) {
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> queue) {
    if (running_ || !queue) {
        return;
    }

    queue_ = std::move(queue);
    running_ = true;

    workers_.reserve(numThreads_);
    for (size_t i = 0; i < numThreads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    utils::Logger::debug("Pool '" + name_ + "' running " + std::to_string(numThreads_) + " workers");
}

void ThreadPool::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    if (queue_) {
        queue_->shutdown();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    queue_.reset();

    utils::Logger::debug("Pool '" + name_ + "' stopped");
}

bool ThreadPool::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCondition_.wait_for(lock, timeout, [this] {
        return !queue_ || queue_->isIdle();
    });
}

void ThreadPool::workerLoop() {
    // Exits at the next job boundary once stop() clears running_
    while (running_) {
        Job job = queue_->dequeue();
        if (!job) {
            break;
        }

        try {
            job();
        } catch (const std::exception& e) {
            utils::Logger::error("Job failed in pool '" + name_ + "': " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(idleMutex_);
            queue_->markDone();
        }
        idleCondition_.notify_all();
    }
}

} // namespace core
} // namespace meetscribe
