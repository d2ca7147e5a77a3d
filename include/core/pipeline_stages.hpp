#pragma once

#include "audio/audio_preprocessor.hpp"
#include "core/transcription_types.hpp"
#include "diarization/speaker_diarization_engine.hpp"
#include "models/model_client.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

enum class StageKind {
    PREPROCESS,
    DIARIZE,
    TRANSCRIBE
};

std::string stageKindToString(StageKind kind);

/**
 * Working state of one chunk travelling through the pipeline.
 *
 * Stages read the session and write only into the context; the session
 * manager commits the outcome once the segment exists.
 */
struct ChunkContext {
    ChunkContext(const Session& s, const AudioChunk& c) : session(s), chunk(c), audio(c.data) {}

    const Session& session;
    const AudioChunk& chunk;

    // Current audio, replaced by the preprocessed bytes
    std::vector<uint8_t> audio;
    audio::PreprocessingResult preprocessing;

    std::string speakerId = "unknown";

    // Speakers found by the seeding diarization of a session's first chunk
    std::vector<diarization::Speaker> seededSpeakers;

    // Chunk embedding of an identification hit, blended into that profile
    std::vector<float> matchedEmbedding;

    std::optional<models::ModelTranscription> transcription;
};

/**
 * One step of the chunk pipeline
 */
class PipelineStage {
public:
    virtual ~PipelineStage() = default;

    virtual StageKind kind() const = 0;

    /**
     * @throws std::exception only for failures that must reach the fallback
     *         policy; absorbed failures leave the context at its defaults
     */
    virtual void run(ChunkContext& context) = 0;
};

class PreprocessStage : public PipelineStage {
public:
    explicit PreprocessStage(const audio::AudioFormat& sessionFormat);

    StageKind kind() const override { return StageKind::PREPROCESS; }
    void run(ChunkContext& context) override;

private:
    audio::AudioPreprocessor preprocessor_;
};

class DiarizeStage : public PipelineStage {
public:
    DiarizeStage(std::shared_ptr<diarization::SpeakerDiarizationEngine> engine,
                 const audio::AudioFormat& sessionFormat);

    StageKind kind() const override { return StageKind::DIARIZE; }
    void run(ChunkContext& context) override;

private:
    void seedSpeakers(ChunkContext& context, const std::vector<float>& samples, int sampleRate);
    void identify(ChunkContext& context, const std::vector<float>& samples, int sampleRate);

    std::shared_ptr<diarization::SpeakerDiarizationEngine> engine_;
    audio::AudioFormat sessionFormat_;
};

class TranscribeStage : public PipelineStage {
public:
    explicit TranscribeStage(std::shared_ptr<models::ModelTranscriptionClient> client);

    StageKind kind() const override { return StageKind::TRANSCRIBE; }
    void run(ChunkContext& context) override;

private:
    std::shared_ptr<models::ModelTranscriptionClient> client_;
};

/**
 * Preprocess, diarize, transcribe for the chunks of one session
 */
class ChunkPipeline {
public:
    ChunkPipeline(const audio::AudioFormat& sessionFormat,
                  std::shared_ptr<diarization::SpeakerDiarizationEngine> engine,
                  std::shared_ptr<models::ModelTranscriptionClient> client);

    /**
     * Run every stage over a chunk
     * @throws std::exception from the transcription stage
     */
    void run(ChunkContext& context);

    PipelineStage& stageFor(StageKind kind);

    static const std::vector<StageKind>& order();

private:
    std::unique_ptr<PreprocessStage> preprocess_;
    std::unique_ptr<DiarizeStage> diarize_;
    std::unique_ptr<TranscribeStage> transcribe_;
};

} // namespace core
} // namespace meetscribe
