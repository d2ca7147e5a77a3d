#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "audio/audio_stream.hpp"
#include "fixtures/engine_harness.hpp"
#include "fixtures/recording_sink.hpp"
#include "fixtures/test_data_generator.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <future>
#include <stdexcept>
#include <thread>

namespace meetscribe {
namespace core {

using ::testing::_;
using ::testing::Invoke;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::Throw;
using fixtures::EngineHarness;
using fixtures::TestDataGenerator;

namespace {

class RecordingObserver : public SessionObserver {
public:
    void onSessionStarted(const Session& session) override {
        std::lock_guard<std::mutex> lock(mutex);
        started.push_back(session.id);
    }

    void onSegmentProcessed(const std::string&, const TranscriptSegment& segment) override {
        std::lock_guard<std::mutex> lock(mutex);
        segments.push_back(segment.id);
        if (failOnSegment) {
            throw std::runtime_error("segment observer failed");
        }
    }

    void onSessionCompleted(const FullTranscript& transcript) override {
        std::lock_guard<std::mutex> lock(mutex);
        completed.push_back(transcript.id);
        if (failOnComplete) {
            throw std::runtime_error("transcript store unavailable");
        }
    }

    void onSessionCancelled(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled.push_back(sessionId);
    }

    void onSessionError(const std::string& sessionId, const TranscriptionError&) override {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(sessionId);
    }

    std::mutex mutex;
    std::vector<std::string> started;
    std::vector<std::string> segments;
    std::vector<std::string> completed;
    std::vector<std::string> cancelled;
    std::vector<std::string> errors;
    bool failOnSegment = false;
    bool failOnComplete = false;
};

double l2Norm(const std::vector<float>& values) {
    double sum = 0.0;
    for (float v : values) {
        sum += static_cast<double>(v) * v;
    }
    return std::sqrt(sum);
}

// Speaking time a speaker should have accumulated from the session's segments
double speakingTimeOf(const Session& session, const std::string& speakerId) {
    double seconds = 0.0;
    for (const auto& segment : session.segments) {
        if (segment.speakerId == speakerId) {
            seconds += (segment.endTimestamp - segment.timestamp) / 1000.0;
        }
    }
    return seconds;
}

// Holds a model call open until released
struct CallGate {
    void enterAndWait() {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        condition.notify_all();
        condition.wait_for(lock, std::chrono::seconds(1), [this] { return released; });
        returned = true;
    }

    bool waitUntilEntered() {
        std::unique_lock<std::mutex> lock(mutex);
        return condition.wait_for(lock, std::chrono::seconds(2), [this] { return entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        condition.notify_all();
    }

    std::mutex mutex;
    std::condition_variable condition;
    bool entered = false;
    bool released = false;
    bool returned = false;
};

utils::SessionErrorCode sessionErrorOf(const std::function<void()>& call) {
    try {
        call();
    } catch (const utils::SessionException& e) {
        return e.getCode();
    }
    ADD_FAILURE() << "expected SessionException";
    return utils::SessionErrorCode::INVALID_STATE;
}

} // namespace

class SessionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        harness = std::make_unique<EngineHarness>();
        manager = harness->manager;
    }

    void TearDown() override {
        manager.reset();
        harness.reset();
    }

    // Open session fed by a stream the test controls
    Session startOpenSession(const TranscriptionConfig& config = EngineHarness::config(),
                             std::shared_ptr<SessionObserver> observer = nullptr) {
        stream = std::make_shared<audio::QueueAudioStream>();
        return manager->startSession(stream, config, "meeting-1", observer);
    }

    std::shared_ptr<fixtures::RecordingSink> subscribe(const std::string& sessionId) {
        auto sink = std::make_shared<fixtures::RecordingSink>();
        harness->hub->subscribe(sessionId, sink);
        return sink;
    }

    void failModel(const std::string& model) {
        ON_CALL(*harness->backend, transcribe(Not(SizeIs(1024)), model))
            .WillByDefault(Throw(std::runtime_error("inference server error")));
    }

    std::unique_ptr<EngineHarness> harness;
    std::shared_ptr<SessionManager> manager;
    std::shared_ptr<audio::QueueAudioStream> stream;
    TestDataGenerator generator;
};

TEST_F(SessionLifecycleTest, EmptyStreamLeavesSessionActive) {
    auto empty = std::make_shared<audio::BufferAudioStream>(std::vector<uint8_t>(), 4096);
    Session session = manager->startSession(empty, EngineHarness::config());

    EXPECT_EQ(session.status, SessionStatus::ACTIVE);
    EXPECT_EQ(session.currentModel, "test/model-a");
    EXPECT_EQ(session.channelId.rfind("ws_", 0), 0u);
    ASSERT_TRUE(manager->waitForInputDrained(session.id, std::chrono::milliseconds(2000)));

    Session current = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(current.status, SessionStatus::ACTIVE);
    EXPECT_TRUE(current.segments.empty());
    EXPECT_EQ(current.errorCount, 0u);
}

TEST_F(SessionLifecycleTest, StartFailsWhenModelCannotLoad) {
    ON_CALL(*harness->backend, transcribe(SizeIs(1024), "test/broken"))
        .WillByDefault(Throw(std::runtime_error("HTTP 404")));

    auto input = std::make_shared<audio::QueueAudioStream>();
    EXPECT_THROW(manager->startSession(input, EngineHarness::config("test/broken")), utils::TranscriptionException);
    EXPECT_TRUE(manager->listSessions().empty());
}

TEST_F(SessionLifecycleTest, InvalidConfigIsRejected) {
    TranscriptionConfig config = EngineHarness::config();
    config.overlapSize = config.chunkSize;

    auto input = std::make_shared<audio::QueueAudioStream>();
    EXPECT_THROW(manager->startSession(input, config), utils::ConfigurationException);
    EXPECT_THROW(manager->startSession(nullptr, EngineHarness::config()), utils::ConfigurationException);
}

TEST_F(SessionLifecycleTest, SilentChunkProducesUnknownSpeakerSegment) {
    Session session = startOpenSession();
    auto sink = subscribe(session.id);

    TranscriptSegment segment = manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));

    EXPECT_EQ(segment.speakerId, "unknown");
    EXPECT_FALSE(segment.audioChunkId.empty());
    EXPECT_EQ(segment.text, "hello world");
    EXPECT_EQ(segment.modelUsed, "test/model-a");
    EXPECT_EQ(segment.language, "en");
    EXPECT_EQ(segment.endTimestamp - segment.timestamp, 512);
    EXPECT_FLOAT_EQ(segment.confidence, 0.9f);

    Session current = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(current.segments.size(), 1u);
    EXPECT_EQ(current.segments[0].id, segment.id);
    EXPECT_EQ(current.chunksReceived, 1u);
    EXPECT_TRUE(current.speakers.empty());

    ASSERT_TRUE(sink->waitForCount(1));
    auto segments = sink->messagesOfType("segment");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0]["data"]["id"], segment.id);
}

TEST_F(SessionLifecycleTest, ConversationSeedsSpeakers) {
    Session session = startOpenSession();
    auto audio = generator.generateConversation({140.0f, 4}, {420.0f, 4}, 1.0f, 2);

    TranscriptSegment segment = manager->processAudioChunk(session.id, TestDataGenerator::toPcm16(audio));

    Session current = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(current.speakers.size(), 2u);
    EXPECT_EQ(segment.speakerId, current.speakers[0].id);
    EXPECT_EQ(current.speakers[0].segments.size(), 1u);
    EXPECT_GT(current.speakers[0].totalSpeakingTime, 0.0);
}

TEST_F(SessionLifecycleTest, SnapshotsAreStableBetweenChunks) {
    Session session = startOpenSession();
    auto audio = generator.generateConversation({140.0f, 4}, {420.0f, 4}, 1.0f, 2);
    manager->processAudioChunk(session.id, TestDataGenerator::toPcm16(audio));
    manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));

    Session first = manager->getTranscriptionSession(session.id);
    Session second = manager->getTranscriptionSession(session.id);

    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.currentModel, second.currentModel);
    EXPECT_EQ(first.fallbackModels, second.fallbackModels);
    EXPECT_EQ(first.chunksReceived, second.chunksReceived);
    EXPECT_EQ(first.errorCount, second.errorCount);
    EXPECT_EQ(first.retryCount, second.retryCount);

    ASSERT_EQ(first.segments.size(), 2u);
    ASSERT_EQ(first.segments.size(), second.segments.size());
    for (size_t i = 0; i < first.segments.size(); ++i) {
        EXPECT_EQ(first.segments[i].id, second.segments[i].id);
        EXPECT_EQ(first.segments[i].text, second.segments[i].text);
        EXPECT_EQ(first.segments[i].speakerId, second.segments[i].speakerId);
        EXPECT_EQ(first.segments[i].timestamp, second.segments[i].timestamp);
        EXPECT_EQ(first.segments[i].endTimestamp, second.segments[i].endTimestamp);
    }

    ASSERT_EQ(first.speakers.size(), second.speakers.size());
    for (size_t i = 0; i < first.speakers.size(); ++i) {
        EXPECT_EQ(first.speakers[i].id, second.speakers[i].id);
        EXPECT_EQ(first.speakers[i].segments, second.speakers[i].segments);
        EXPECT_DOUBLE_EQ(first.speakers[i].totalSpeakingTime, second.speakers[i].totalSpeakingTime);
        EXPECT_EQ(first.speakers[i].voiceProfile.sampleCount, second.speakers[i].voiceProfile.sampleCount);
        EXPECT_EQ(first.speakers[i].voiceProfile.features, second.speakers[i].voiceProfile.features);
    }
}

TEST_F(SessionLifecycleTest, SpeakerTotalsFollowTheirSegments) {
    Session session = startOpenSession();
    auto conversation = generator.generateConversation({140.0f, 4}, {420.0f, 4}, 1.0f, 2);
    manager->processAudioChunk(session.id, TestDataGenerator::toPcm16(conversation));

    Session seeded = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(seeded.speakers.size(), 2u);

    // A second chunk in the first voice is matched against the seeded speakers
    auto voice = generator.generateVoice({140.0f, 4}, 1.0f);
    TranscriptSegment matched = manager->processAudioChunk(session.id, TestDataGenerator::toPcm16(voice));
    ASSERT_NE(matched.speakerId, "unknown");

    Session current = manager->getTranscriptionSession(session.id);
    for (const auto& speaker : current.speakers) {
        EXPECT_NEAR(speaker.totalSpeakingTime, speakingTimeOf(current, speaker.id), 1e-9);
        EXPECT_NEAR(l2Norm(speaker.voiceProfile.features), 1.0, 1e-6);
    }

    auto speaker = std::find_if(current.speakers.begin(), current.speakers.end(),
                                [&matched](const diarization::Speaker& s) { return s.id == matched.speakerId; });
    ASSERT_NE(speaker, current.speakers.end());
    EXPECT_EQ(speaker->voiceProfile.sampleCount, 2u);
    EXPECT_EQ(speaker->segments.back(), matched.id);
}

TEST_F(SessionLifecycleTest, MergedSpeakerCombinesProfiles) {
    Session session = startOpenSession();
    auto audio = generator.generateConversation({140.0f, 4}, {420.0f, 4}, 1.0f, 2);
    manager->processAudioChunk(session.id, TestDataGenerator::toPcm16(audio));

    Session current = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(current.speakers.size(), 2u);
    const auto& first = current.speakers[0];
    const auto& second = current.speakers[1];

    diarization::Speaker merged = manager->mergeSpeakers(session.id, first.id, second.id);
    EXPECT_EQ(merged.voiceProfile.sampleCount, first.voiceProfile.sampleCount + second.voiceProfile.sampleCount);
    EXPECT_NEAR(merged.totalSpeakingTime, first.totalSpeakingTime + second.totalSpeakingTime, 1e-9);

    Session after = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(after.speakers.size(), 1u);
    EXPECT_EQ(after.speakers[0].id, merged.id);
    for (const auto& segment : after.segments) {
        EXPECT_EQ(segment.speakerId, merged.id);
    }

    EXPECT_THROW(manager->mergeSpeakers(session.id, merged.id, "speaker_missing"), utils::DiarizationException);
    EXPECT_THROW(manager->mergeSpeakers(session.id, merged.id, merged.id), utils::DiarizationException);
}

TEST_F(SessionLifecycleTest, PausedSessionRejectsChunks) {
    Session session = startOpenSession();
    auto sink = subscribe(session.id);

    manager->pauseSession(session.id);
    EXPECT_NO_THROW(manager->pauseSession(session.id));
    EXPECT_EQ(manager->getTranscriptionSession(session.id).status, SessionStatus::PAUSED);

    EXPECT_EQ(sessionErrorOf([&] { manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)); }),
              utils::SessionErrorCode::SESSION_NOT_ACTIVE);

    manager->resumeSession(session.id);
    EXPECT_NO_THROW(manager->resumeSession(session.id));
    EXPECT_NO_THROW(manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)));

    ASSERT_TRUE(sink->waitForCount(3));
    auto statuses = sink->messagesOfType("status");
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0]["data"], "paused");
    EXPECT_EQ(statuses[1]["data"], "active");
}

TEST_F(SessionLifecycleTest, PausedStreamWaitsForResume) {
    Session session = startOpenSession();

    manager->pauseSession(session.id);
    stream->push(TestDataGenerator::silentChunk(16384));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(manager->getTranscriptionSession(session.id).segments.empty());

    manager->resumeSession(session.id);
    stream->finish();
    ASSERT_TRUE(manager->waitForInputDrained(session.id, std::chrono::milliseconds(5000)));
    // The window and its retained overlap
    EXPECT_EQ(manager->getTranscriptionSession(session.id).segments.size(), 2u);
}

TEST_F(SessionLifecycleTest, PausedSessionBoundsBufferedInput) {
    stream = std::make_shared<audio::QueueAudioStream>(2);
    Session session = manager->startSession(stream, EngineHarness::config(), "meeting-1");
    manager->pauseSession(session.id);

    // The consumer takes one full window, then waits for resume
    ASSERT_EQ(stream->push(TestDataGenerator::silentChunk(16384)), audio::PushResult::ACCEPTED);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (stream->pendingFrames() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(stream->pendingFrames(), 0u);

    EXPECT_EQ(stream->push(TestDataGenerator::silentChunk(16384)), audio::PushResult::ACCEPTED);
    EXPECT_EQ(stream->push(TestDataGenerator::silentChunk(16384)), audio::PushResult::ACCEPTED);
    EXPECT_EQ(stream->push(TestDataGenerator::silentChunk(16384)), audio::PushResult::FULL);
    EXPECT_EQ(stream->pendingFrames(), 2u);
    EXPECT_TRUE(manager->getTranscriptionSession(session.id).segments.empty());

    manager->resumeSession(session.id);
    stream->finish();
    ASSERT_TRUE(manager->waitForInputDrained(session.id, std::chrono::milliseconds(5000)));
    // Three accepted windows plus the 6144-byte remainder
    EXPECT_EQ(manager->getTranscriptionSession(session.id).segments.size(), 4u);
}

TEST_F(SessionLifecycleTest, UnknownSessionIsReported) {
    EXPECT_EQ(sessionErrorOf([&] { manager->getTranscriptionSession("session_missing"); }),
              utils::SessionErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(sessionErrorOf([&] { manager->pauseSession("session_missing"); }),
              utils::SessionErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(sessionErrorOf([&] { manager->finalizeTranscript("session_missing"); }),
              utils::SessionErrorCode::SESSION_NOT_FOUND);
}

TEST_F(SessionLifecycleTest, FailedModelFallsBackOnce) {
    failModel("test/model-a");
    Session session = startOpenSession(EngineHarness::config("test/model-a", {"test/model-b"}));
    auto sink = subscribe(session.id);

    TranscriptSegment segment = manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));
    EXPECT_EQ(segment.modelUsed, "test/model-b");

    Session current = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(current.currentModel, "test/model-b");
    EXPECT_TRUE(current.fallbackModels.empty());
    EXPECT_EQ(current.errorCount, 1u);
    EXPECT_EQ(current.retryCount, 1u);
    ASSERT_TRUE(current.lastError.has_value());
    EXPECT_EQ(current.lastError->code, utils::TranscriptionErrorCode::UNKNOWN_ERROR);
    EXPECT_EQ(current.lastError->message, "inference server error");

    ASSERT_TRUE(sink->waitForCount(2));
    EXPECT_EQ(sink->messagesOfType("error").size(), 1u);

    SessionQualityMetrics metrics = manager->getQualityMetrics(session.id);
    EXPECT_EQ(metrics.totalChunks, 2u);
    EXPECT_EQ(metrics.failedChunks, 1u);
    EXPECT_EQ(metrics.successfulChunks, 1u);
}

TEST_F(SessionLifecycleTest, FallbackFailureIsRecordedTwice) {
    failModel("test/model-a");
    failModel("test/model-b");
    Session session = startOpenSession(EngineHarness::config("test/model-a", {"test/model-b"}));

    EXPECT_THROW(manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)),
                 utils::TranscriptionException);

    Session current = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(current.errorCount, 2u);
    EXPECT_EQ(current.retryCount, 1u);
    EXPECT_EQ(current.currentModel, "test/model-b");
    EXPECT_EQ(current.status, SessionStatus::ACTIVE);
}

TEST_F(SessionLifecycleTest, NoFallbacksMeansNoRetry) {
    failModel("test/model-a");
    Session session = startOpenSession(EngineHarness::config("test/model-a", {}));

    for (int i = 0; i < 4; ++i) {
        EXPECT_THROW(manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)),
                     utils::TranscriptionException);
    }

    Session current = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(current.errorCount, 4u);
    EXPECT_EQ(current.retryCount, 0u);
    EXPECT_TRUE(current.segments.empty());
    EXPECT_EQ(current.status, SessionStatus::ACTIVE);
}

TEST_F(SessionLifecycleTest, ErrorBudgetStopsFallbacks) {
    failModel("test/model-a");
    failModel("test/model-b");
    failModel("test/model-c");
    Session session = startOpenSession(
        EngineHarness::config("test/model-a", {"test/model-b", "test/model-c"}));

    // First chunk: primary and one fallback fail
    EXPECT_THROW(manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)),
                 utils::TranscriptionException);
    // Second chunk: the third error leaves no budget for model-c
    EXPECT_THROW(manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)),
                 utils::TranscriptionException);

    Session current = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(current.errorCount, 3u);
    EXPECT_EQ(current.retryCount, 1u);
    EXPECT_EQ(current.currentModel, "test/model-b");
    ASSERT_EQ(current.fallbackModels.size(), 1u);
    EXPECT_EQ(current.fallbackModels[0], "test/model-c");
}

TEST_F(SessionLifecycleTest, FinalizeBuildsTranscript) {
    auto observer = std::make_shared<RecordingObserver>();
    Session session = startOpenSession(EngineHarness::config(), observer);
    auto sink = subscribe(session.id);

    ON_CALL(*harness->backend, transcribe(Not(SizeIs(1024)), "test/model-a"))
        .WillByDefault(::testing::Return(fixtures::inferenceReply("good morning everyone", 0.8f)));

    TranscriptSegment first = manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));
    TranscriptSegment second = manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));

    FullTranscript transcript = manager->finalizeTranscript(session.id);
    EXPECT_EQ(transcript.sessionId, session.id);
    EXPECT_EQ(transcript.meetingId, "meeting-1");
    EXPECT_EQ(transcript.status, TranscriptStatus::COMPLETED);
    EXPECT_EQ(transcript.language, "en");
    EXPECT_GE(transcript.duration, 0);
    ASSERT_EQ(transcript.segments.size(), 2u);
    EXPECT_EQ(transcript.segments[0].id, first.id);
    EXPECT_EQ(transcript.segments[1].id, second.id);
    EXPECT_LE(transcript.segments[0].timestamp, transcript.segments[1].timestamp);

    const ModelMetadata& meta = transcript.modelMetadata;
    EXPECT_EQ(meta.primaryModel, "test/model-a");
    EXPECT_TRUE(meta.fallbackModelsUsed.empty());
    EXPECT_EQ(meta.apiCalls, 2u);
    EXPECT_EQ(meta.totalTokensProcessed, 6u);
    EXPECT_DOUBLE_EQ(meta.totalCost, 2 * COST_PER_API_CALL);
    EXPECT_NEAR(meta.averageConfidence, 0.8, 1e-6);
    EXPECT_EQ(meta.processingStats.totalChunks, 2u);

    // Evicted once handed off
    EXPECT_EQ(sessionErrorOf([&] { manager->getTranscriptionSession(session.id); }),
              utils::SessionErrorCode::SESSION_NOT_FOUND);
    EXPECT_FALSE(harness->hub->hasChannel(session.id));

    ASSERT_TRUE(sink->waitForCount(3));
    auto complete = sink->messagesOfType("complete");
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0]["data"]["id"], transcript.id);
    EXPECT_TRUE(sink->waitForClose());

    ASSERT_TRUE(harness->postProcessing->waitForIdle(std::chrono::milliseconds(2000)));
    auto requests = harness->recordedRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].transcriptId, transcript.id);
    EXPECT_EQ(requests[0].segmentCount, 2u);
    EXPECT_EQ(harness->recordedEvents()[0], POST_PROCESS_EVENT);

    std::lock_guard<std::mutex> lock(observer->mutex);
    EXPECT_EQ(observer->started.size(), 1u);
    EXPECT_EQ(observer->segments.size(), 2u);
    ASSERT_EQ(observer->completed.size(), 1u);
    EXPECT_EQ(observer->completed[0], transcript.id);
}

TEST_F(SessionLifecycleTest, ObserverFailureFailsFinalize) {
    auto observer = std::make_shared<RecordingObserver>();
    observer->failOnSegment = true;
    observer->failOnComplete = true;
    Session session = startOpenSession(EngineHarness::config(), observer);

    // A failing segment observer does not fail the chunk
    EXPECT_NO_THROW(manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)));

    EXPECT_THROW(manager->finalizeTranscript(session.id), std::runtime_error);

    Session failed = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(failed.status, SessionStatus::ERROR);
    ASSERT_TRUE(failed.endTime.has_value());
    EXPECT_GE(*failed.endTime, failed.startTime);
    ASSERT_TRUE(failed.lastError.has_value());
    EXPECT_EQ(failed.lastError->message, "transcript store unavailable");
    EXPECT_TRUE(harness->recordedRequests().empty());

    EXPECT_EQ(sessionErrorOf([&] { manager->pauseSession(session.id); }), utils::SessionErrorCode::SESSION_CLOSED);
    EXPECT_TRUE(manager->releaseSession(session.id));
    EXPECT_FALSE(manager->releaseSession(session.id));
}

TEST_F(SessionLifecycleTest, CancelDiscardsSession) {
    auto observer = std::make_shared<RecordingObserver>();
    Session session = startOpenSession(EngineHarness::config(), observer);
    auto sink = subscribe(session.id);

    manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));
    EXPECT_FALSE(manager->releaseSession(session.id));
    manager->cancelSession(session.id);

    EXPECT_TRUE(manager->listSessions().empty());
    EXPECT_EQ(sessionErrorOf([&] { manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)); }),
              utils::SessionErrorCode::SESSION_NOT_FOUND);

    ASSERT_TRUE(sink->waitForCount(2));
    auto statuses = sink->messagesOfType("status");
    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses.back()["data"], "cancelled");
    EXPECT_TRUE(sink->messagesOfType("complete").empty());
    EXPECT_TRUE(harness->recordedRequests().empty());

    std::lock_guard<std::mutex> lock(observer->mutex);
    ASSERT_EQ(observer->cancelled.size(), 1u);
    EXPECT_EQ(observer->cancelled[0], session.id);
}

TEST_F(SessionLifecycleTest, CancelDuringModelCallDiscardsResult) {
    Session session = startOpenSession();
    auto sink = subscribe(session.id);

    CallGate gate;
    ON_CALL(*harness->backend, transcribe(Not(SizeIs(1024)), "test/model-a"))
        .WillByDefault(Invoke([&gate](const std::vector<uint8_t>&, const std::string&) {
            gate.enterAndWait();
            return fixtures::inferenceReply("late words");
        }));

    auto inFlight = std::async(std::launch::async, [&] {
        return sessionErrorOf([&] { manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384)); });
    });
    ASSERT_TRUE(gate.waitUntilEntered());

    auto cancelling = std::async(std::launch::async, [&] { manager->cancelSession(session.id); });
    ASSERT_EQ(cancelling.wait_for(std::chrono::milliseconds(500)), std::future_status::ready);
    cancelling.get();
    EXPECT_TRUE(manager->listSessions().empty());
    ASSERT_TRUE(sink->waitForClose());
    size_t deliveredAtCancel = sink->count();

    gate.release();
    EXPECT_EQ(inFlight.get(), utils::SessionErrorCode::SESSION_CLOSED);
    {
        std::lock_guard<std::mutex> lock(gate.mutex);
        EXPECT_TRUE(gate.returned);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(sink->count(), deliveredAtCancel);
    EXPECT_TRUE(sink->messagesOfType("segment").empty());
}

TEST_F(SessionLifecycleTest, StreamIsCutIntoOverlappingWindows) {
    // 16384-byte windows advancing by 14336: two full windows plus a 11328-byte tail
    auto input = std::make_shared<audio::BufferAudioStream>(TestDataGenerator::silentChunk(40000), 4096);
    Session session = manager->startSession(input, EngineHarness::config());
    ASSERT_TRUE(manager->waitForInputDrained(session.id, std::chrono::milliseconds(5000)));

    Session current = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(current.segments.size(), 3u);
    EXPECT_EQ(current.chunksReceived, 3u);
    EXPECT_EQ(current.segments[0].endTimestamp - current.segments[0].timestamp, 512);
    EXPECT_EQ(current.segments[2].endTimestamp - current.segments[2].timestamp, 354);
}

TEST_F(SessionLifecycleTest, ExactWindowFlushesRetainedOverlap) {
    auto input = std::make_shared<audio::BufferAudioStream>(TestDataGenerator::silentChunk(16384), 4096);
    Session session = manager->startSession(input, EngineHarness::config());
    ASSERT_TRUE(manager->waitForInputDrained(session.id, std::chrono::milliseconds(5000)));

    Session current = manager->getTranscriptionSession(session.id);
    ASSERT_EQ(current.segments.size(), 2u);
    // 2048 retained bytes of 16-bit mono at 16 kHz
    EXPECT_EQ(current.segments[1].endTimestamp - current.segments[1].timestamp, 64);
}

TEST_F(SessionLifecycleTest, FinalizeDiscardsUnreadInput) {
    Session session = startOpenSession();
    manager->processAudioChunk(session.id, TestDataGenerator::silentChunk(16384));

    FullTranscript transcript = manager->finalizeTranscript(session.id);
    EXPECT_EQ(transcript.segments.size(), 1u);

    // Stream closed by finalize; later frames are ignored
    EXPECT_EQ(stream->push(TestDataGenerator::silentChunk(16384)), audio::PushResult::ENDED);
    EXPECT_EQ(stream->pendingFrames(), 0u);
}

TEST_F(SessionLifecycleTest, SwitchModelLoadsTarget) {
    Session session = startOpenSession(EngineHarness::config("test/model-a", {"test/model-b"}));

    manager->switchModel(session.id, "test/model-b");
    Session current = manager->getTranscriptionSession(session.id);
    EXPECT_EQ(current.currentModel, "test/model-b");
    EXPECT_TRUE(current.fallbackModels.empty());

    auto statuses = manager->getModelStatus(std::string("test/model-b"));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].state, models::ModelState::READY);
    EXPECT_EQ(manager->getModelStatus().size(), 2u);
    EXPECT_TRUE(manager->getModelStatus(std::string("test/unknown")).empty());
}

TEST_F(SessionLifecycleTest, IdentifySpeakersIsStateless) {
    auto audio = generator.generateConversation({140.0f, 4}, {420.0f, 4}, 1.0f, 4);
    diarization::DiarizationResult result = manager->identifySpeakers(TestDataGenerator::toWav(audio));

    EXPECT_EQ(result.speakers.size(), 2u);
    EXPECT_FALSE(result.segments.empty());
    EXPECT_TRUE(manager->listSessions().empty());
}

TEST_F(SessionLifecycleTest, SessionsAreIsolated) {
    failModel("test/model-a");
    Session failing = startOpenSession(EngineHarness::config("test/model-a", {}));

    auto otherStream = std::make_shared<audio::QueueAudioStream>();
    Session healthy = manager->startSession(otherStream, EngineHarness::config("test/model-b", {}));

    EXPECT_THROW(manager->processAudioChunk(failing.id, TestDataGenerator::silentChunk(16384)),
                 utils::TranscriptionException);
    EXPECT_NO_THROW(manager->processAudioChunk(healthy.id, TestDataGenerator::silentChunk(16384)));

    EXPECT_EQ(manager->getTranscriptionSession(healthy.id).errorCount, 0u);
    EXPECT_EQ(manager->listSessions().size(), 2u);
}

} // namespace core
} // namespace meetscribe
