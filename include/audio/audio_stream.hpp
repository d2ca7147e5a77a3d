#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace meetscribe {
namespace audio {

/**
 * Sequential source of raw audio bytes with an end-of-stream signal.
 */
class AudioStream {
public:
    virtual ~AudioStream() = default;

    /**
     * Read the next block of bytes, blocking until one is available
     * @param out Receives the block
     * @return false once the stream has ended or been closed
     */
    virtual bool read(std::vector<uint8_t>& out) = 0;

    /**
     * Stop the stream; pending and future reads return false
     */
    virtual void close() = 0;
};

// In-memory buffer delivered in fixed-size slices
class BufferAudioStream : public AudioStream {
public:
    BufferAudioStream(std::vector<uint8_t> data, size_t sliceSize);

    bool read(std::vector<uint8_t>& out) override;
    void close() override;

private:
    std::vector<uint8_t> data_;
    size_t sliceSize_;
    size_t position_ = 0;
    bool closed_ = false;
    std::mutex mutex_;
};

enum class PushResult {
    ACCEPTED,
    FULL,       // pending frames at capacity, frame dropped
    ENDED       // finish() or close() already called, frame dropped
};

/**
 * Queue fed by transport frames.
 *
 * Holds at most maxPendingFrames unread frames. A consumer that falls behind
 * (slow model calls, or a paused session) makes push() report FULL instead of
 * letting the queue grow.
 */
class QueueAudioStream : public AudioStream {
public:
    static constexpr size_t DEFAULT_MAX_PENDING_FRAMES = 256;

    explicit QueueAudioStream(size_t maxPendingFrames = DEFAULT_MAX_PENDING_FRAMES);

    bool read(std::vector<uint8_t>& out) override;
    void close() override;

    // Append a frame; empty frames are accepted and discarded
    PushResult push(std::vector<uint8_t> frame);

    // Signal end of stream; queued frames are still delivered
    void finish();

    size_t pendingFrames() const;
    size_t getCapacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<std::vector<uint8_t>> frames_;
    bool finished_ = false;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace audio
} // namespace meetscribe
