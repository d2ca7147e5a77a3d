#pragma once

#include "core/distribution_hub.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixtures {

// MessageSink collecting every payload it is given
class RecordingSink : public meetscribe::core::MessageSink {
public:
    void send(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            throw std::runtime_error("socket write failed");
        }
        payloads_.push_back(payload);
        condition_.notify_all();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        condition_.notify_all();
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    bool waitForCount(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [&] { return payloads_.size() >= count; });
    }

    bool waitForClose(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [&] { return closed_; });
    }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> result;
        for (const auto& payload : payloads_) {
            result.push_back(nlohmann::json::parse(payload));
        }
        return result;
    }

    // Messages whose "type" matches
    std::vector<nlohmann::json> messagesOfType(const std::string& type) const {
        std::vector<nlohmann::json> result;
        for (auto& message : messages()) {
            if (message.value("type", "") == type) {
                result.push_back(message);
            }
        }
        return result;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return payloads_.size();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::vector<std::string> payloads_;
    bool failing_ = false;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace fixtures
