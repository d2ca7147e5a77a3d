#include <gtest/gtest.h>
#include "diarization/speaker_diarization_engine.hpp"
#include "fixtures/test_data_generator.hpp"
#include "utils/error_handler.hpp"
#include <set>

using namespace meetscribe::diarization;
using fixtures::TestDataGenerator;
using fixtures::VoiceSpec;

class SpeakerDiarizationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<SpeakerDiarizationEngine>();
    }

    std::vector<uint8_t> voiceBytes(const VoiceSpec& voice, float seconds) {
        return TestDataGenerator::toPcm16(generator_.generateVoice(voice, seconds));
    }

    Speaker knownSpeaker(const std::string& id, const VoiceSpec& voice) {
        Speaker speaker;
        speaker.id = id;
        speaker.voiceProfile.id = id + "_profile";
        speaker.voiceProfile.features = engine_->extractEmbedding(generator_.generateVoice(voice, 1.0f), 16000);
        speaker.voiceProfile.confidence = 0.9f;
        speaker.voiceProfile.sampleCount = 1;
        return speaker;
    }

    std::unique_ptr<SpeakerDiarizationEngine> engine_;
    TestDataGenerator generator_;
    DiarizationConfig config_;
    VoiceSpec low_{140.0f, 4};
    VoiceSpec high_{420.0f, 4};
};

TEST_F(SpeakerDiarizationEngineTest, TwoSpeakerConversation) {
    auto audio = generator_.generateConversation(low_, high_, 1.0f, 4);
    auto result = engine_->diarizeSamples(audio, 16000, config_);

    ASSERT_EQ(result.speakers.size(), 2u);
    ASSERT_EQ(result.segments.size(), 4u);
    EXPECT_EQ(result.segments[0].speakerId, result.segments[2].speakerId);
    EXPECT_EQ(result.segments[1].speakerId, result.segments[3].speakerId);
    EXPECT_NE(result.segments[0].speakerId, result.segments[1].speakerId);
    EXPECT_EQ(result.speakers[0].id, "speaker_1");
    EXPECT_NEAR(result.speakers[0].totalSpeakingTime, 2.0, 0.1);
    EXPECT_GT(result.confidence, 0.9f);
    EXPECT_EQ(result.modelUsed, "spectral-clustering");
    EXPECT_EQ(engine_->getTotalDiarizations(), 1u);

    for (const auto& segment : result.segments) {
        EXPECT_LT(segment.startTime, segment.endTime);
        EXPECT_LE(segment.confidence, 1.0f);
    }
}

TEST_F(SpeakerDiarizationEngineTest, SilenceHasNoSpeakers) {
    auto result = engine_->diarizeSamples(generator_.generateSilence(2.0f), 16000, config_);
    EXPECT_TRUE(result.speakers.empty());
    EXPECT_TRUE(result.segments.empty());
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST_F(SpeakerDiarizationEngineTest, MaxSpeakersCapsClusters) {
    config_.maxSpeakers = 1;
    auto audio = generator_.generateConversation(low_, high_, 1.0f, 4);
    auto result = engine_->diarizeSamples(audio, 16000, config_);

    ASSERT_EQ(result.speakers.size(), 1u);
    ASSERT_EQ(result.segments.size(), 4u);
    for (const auto& segment : result.segments) {
        EXPECT_EQ(segment.speakerId, result.speakers[0].id);
    }
}

TEST_F(SpeakerDiarizationEngineTest, ShortSpeakersAreFiltered) {
    config_.minSegmentLength = 5.0;
    auto audio = generator_.generateConversation(low_, high_, 1.0f, 4);
    auto result = engine_->diarizeSamples(audio, 16000, config_);
    EXPECT_TRUE(result.speakers.empty());
    EXPECT_TRUE(result.segments.empty());
}

TEST_F(SpeakerDiarizationEngineTest, DiarizeWavBytes) {
    auto audio = generator_.generateVoice(low_, 1.5f);
    auto result = engine_->diarize(TestDataGenerator::toWav(audio), config_);
    EXPECT_EQ(result.speakers.size(), 1u);

    std::vector<uint8_t> broken = {'R', 'I', 'F', 'F', 4, 0, 0, 0, 'W', 'A', 'V', 'E'};
    EXPECT_THROW(engine_->diarize(broken, config_), meetscribe::utils::DiarizationException);
}

TEST_F(SpeakerDiarizationEngineTest, IdentifySpeaker) {
    std::vector<Speaker> known = {knownSpeaker("alice", low_), knownSpeaker("bob", high_)};

    auto query = engine_->extractEmbedding(voiceBytes(high_, 0.7f));
    auto match = engine_->identifySpeaker(query, known);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, "bob");

    std::vector<float> unrelated(EMBEDDING_DIMENSION, 0.0f);
    unrelated[EMBEDDING_DIMENSION - 1] = 1.0f;
    EXPECT_FALSE(engine_->identifySpeaker(unrelated, known).has_value());
    EXPECT_FALSE(engine_->identifySpeaker(query, {}).has_value());
}

TEST_F(SpeakerDiarizationEngineTest, VoiceProfileLifecycle) {
    auto profile = engine_->createVoiceProfile({voiceBytes(low_, 0.8f), voiceBytes(low_, 0.5f)});
    EXPECT_EQ(profile.sampleCount, 2u);
    EXPECT_GT(profile.confidence, 0.95f);
    EXPECT_NEAR(l2Norm(profile.features), 1.0f, 1e-4f);
    EXPECT_EQ(engine_->getVoiceProfileCount(), 1u);

    auto updated = engine_->updateVoiceProfile(profile.id, voiceBytes(high_, 0.5f));
    EXPECT_EQ(updated.sampleCount, 3u);
    EXPECT_LT(cosineSimilarity(updated.features, profile.features), 1.0f);
    EXPECT_GT(cosineSimilarity(updated.features, profile.features), 0.9f);

    auto other = engine_->createVoiceProfile({voiceBytes(high_, 0.5f)});
    EXPECT_FLOAT_EQ(other.confidence, 1.0f);
    EXPECT_EQ(engine_->getVoiceProfileCount(), 2u);

    auto merged = engine_->mergeVoiceProfiles(profile.id, other.id);
    EXPECT_EQ(merged.sampleCount, 4u);
    EXPECT_EQ(engine_->getVoiceProfileCount(), 1u);
    EXPECT_FALSE(engine_->getVoiceProfile(profile.id).has_value());
    EXPECT_TRUE(engine_->getVoiceProfile(merged.id).has_value());
}

TEST_F(SpeakerDiarizationEngineTest, VoiceProfileErrors) {
    auto silent = TestDataGenerator::silentChunk(16000);
    EXPECT_THROW(engine_->createVoiceProfile({silent}), meetscribe::utils::TranscriptionException);
    EXPECT_THROW(engine_->createVoiceProfile({}), meetscribe::utils::TranscriptionException);
    EXPECT_THROW(engine_->updateVoiceProfile("voice_profile_missing", voiceBytes(low_, 0.5f)),
                 meetscribe::utils::TranscriptionException);
    EXPECT_THROW(engine_->mergeVoiceProfiles("a", "b"), meetscribe::utils::TranscriptionException);
}

TEST_F(SpeakerDiarizationEngineTest, MergeSpeakers) {
    Speaker first = knownSpeaker("speaker_a", low_);
    first.segments = {"segment_1", "segment_3"};
    first.totalSpeakingTime = 2.0;
    first.voiceProfile.sampleCount = 2;
    Speaker second = knownSpeaker("speaker_b", high_);
    second.segments = {"segment_2"};
    second.totalSpeakingTime = 1.5;
    second.voiceProfile.confidence = 0.7f;

    Speaker merged = engine_->mergeSpeakers(first, second);
    EXPECT_NE(merged.id, first.id);
    EXPECT_NE(merged.id, second.id);
    EXPECT_EQ(merged.segments.size(), 3u);
    EXPECT_DOUBLE_EQ(merged.totalSpeakingTime, 3.5);
    EXPECT_EQ(merged.voiceProfile.sampleCount, 3u);
    EXPECT_FLOAT_EQ(merged.voiceProfile.confidence, 0.8f);
    EXPECT_NEAR(l2Norm(merged.voiceProfile.features), 1.0f, 1e-4f);
}

TEST_F(SpeakerDiarizationEngineTest, ApplyProfileUpdate) {
    VoiceProfile profile;
    profile.features = {1.0f, 0.0f};
    profile.sampleCount = 1;

    SpeakerDiarizationEngine::applyProfileUpdate(profile, {0.0f, 1.0f});
    EXPECT_EQ(profile.sampleCount, 2u);
    EXPECT_GT(profile.features[0], profile.features[1]);
    EXPECT_NEAR(l2Norm(profile.features), 1.0f, 1e-5f);
}

TEST_F(SpeakerDiarizationEngineTest, ConfigFromJson) {
    auto config = DiarizationConfig::fromJson({{"maxSpeakers", 4}, {"similarityThreshold", 0.9}});
    EXPECT_EQ(config.maxSpeakers, 4u);
    EXPECT_FLOAT_EQ(config.similarityThreshold, 0.9f);
    EXPECT_DOUBLE_EQ(config.minSegmentLength, 1.0);
    EXPECT_EQ(config.modelName, "spectral-clustering");
}
