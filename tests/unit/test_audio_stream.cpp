#include <gtest/gtest.h>
#include "audio/audio_stream.hpp"
#include <chrono>
#include <thread>

using namespace meetscribe::audio;

TEST(BufferAudioStreamTest, DeliversFixedSlices) {
    BufferAudioStream stream(std::vector<uint8_t>(10, 1), 4);
    std::vector<uint8_t> block;

    ASSERT_TRUE(stream.read(block));
    EXPECT_EQ(block.size(), 4u);
    ASSERT_TRUE(stream.read(block));
    EXPECT_EQ(block.size(), 4u);
    ASSERT_TRUE(stream.read(block));
    EXPECT_EQ(block.size(), 2u);
    EXPECT_FALSE(stream.read(block));
}

TEST(BufferAudioStreamTest, CloseEndsStream) {
    BufferAudioStream stream(std::vector<uint8_t>(10, 1), 4);
    stream.close();
    std::vector<uint8_t> block;
    EXPECT_FALSE(stream.read(block));
}

TEST(QueueAudioStreamTest, FinishDeliversQueuedFrames) {
    QueueAudioStream stream;
    EXPECT_EQ(stream.push({1, 2}), PushResult::ACCEPTED);
    EXPECT_EQ(stream.push({}), PushResult::ACCEPTED);
    EXPECT_EQ(stream.push({3}), PushResult::ACCEPTED);
    stream.finish();
    EXPECT_EQ(stream.push({4}), PushResult::ENDED);

    EXPECT_EQ(stream.pendingFrames(), 2u);

    std::vector<uint8_t> block;
    ASSERT_TRUE(stream.read(block));
    EXPECT_EQ(block, (std::vector<uint8_t>{1, 2}));
    ASSERT_TRUE(stream.read(block));
    EXPECT_EQ(block, (std::vector<uint8_t>{3}));
    EXPECT_FALSE(stream.read(block));
}

TEST(QueueAudioStreamTest, FullQueueRejectsFrames) {
    QueueAudioStream stream(2);
    EXPECT_EQ(stream.getCapacity(), 2u);
    EXPECT_EQ(stream.push({1}), PushResult::ACCEPTED);
    EXPECT_EQ(stream.push({2}), PushResult::ACCEPTED);
    EXPECT_EQ(stream.push({3}), PushResult::FULL);
    EXPECT_EQ(stream.pendingFrames(), 2u);

    std::vector<uint8_t> block;
    ASSERT_TRUE(stream.read(block));
    EXPECT_EQ(block, (std::vector<uint8_t>{1}));
    EXPECT_EQ(stream.push({3}), PushResult::ACCEPTED);
}

TEST(QueueAudioStreamTest, CloseDiscardsPendingFrames) {
    QueueAudioStream stream;
    stream.push({1, 2, 3});
    stream.close();

    std::vector<uint8_t> block;
    EXPECT_FALSE(stream.read(block));
    EXPECT_EQ(stream.pendingFrames(), 0u);
}

TEST(QueueAudioStreamTest, ReadBlocksUntilFrameArrives) {
    QueueAudioStream stream;
    std::vector<uint8_t> received;
    bool ok = false;

    std::thread reader([&]() { ok = stream.read(received); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stream.push({9, 9, 9});
    reader.join();

    EXPECT_TRUE(ok);
    EXPECT_EQ(received.size(), 3u);
}

TEST(QueueAudioStreamTest, CloseWakesBlockedReader) {
    QueueAudioStream stream;
    bool ok = true;

    std::thread reader([&]() {
        std::vector<uint8_t> block;
        ok = stream.read(block);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stream.close();
    reader.join();

    EXPECT_FALSE(ok);
}
