#include "audio/audio_stream.hpp"
#include <algorithm>

namespace meetscribe {
namespace audio {

// BufferAudioStream implementation
BufferAudioStream::BufferAudioStream(std::vector<uint8_t> data, size_t sliceSize)
    : data_(std::move(data)), sliceSize_(sliceSize == 0 ? 1 : sliceSize) {
}

bool BufferAudioStream::read(std::vector<uint8_t>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || position_ >= data_.size()) {
        return false;
    }

    size_t end = std::min(position_ + sliceSize_, data_.size());
    out.assign(data_.begin() + position_, data_.begin() + end);
    position_ = end;
    return true;
}

void BufferAudioStream::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

// QueueAudioStream implementation
QueueAudioStream::QueueAudioStream(size_t maxPendingFrames)
    : capacity_(maxPendingFrames == 0 ? 1 : maxPendingFrames) {
}

bool QueueAudioStream::read(std::vector<uint8_t>& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || finished_ || !frames_.empty(); });

    if (closed_ || frames_.empty()) {
        return false;
    }

    out = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

void QueueAudioStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        frames_.clear();
    }
    condition_.notify_all();
}

PushResult QueueAudioStream::push(std::vector<uint8_t> frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) {
            return PushResult::ENDED;
        }
        if (frame.empty()) {
            return PushResult::ACCEPTED;
        }
        if (frames_.size() >= capacity_) {
            return PushResult::FULL;
        }
        frames_.push_back(std::move(frame));
    }
    condition_.notify_one();
    return PushResult::ACCEPTED;
}

void QueueAudioStream::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    condition_.notify_all();
}

size_t QueueAudioStream::pendingFrames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

} // namespace audio
} // namespace meetscribe
