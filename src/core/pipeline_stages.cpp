#include "core/pipeline_stages.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/id_generator.hpp"
#include "utils/logging.hpp"
#include <stdexcept>

namespace meetscribe {
namespace core {

std::string stageKindToString(StageKind kind) {
    switch (kind) {
        case StageKind::PREPROCESS: return "preprocess";
        case StageKind::DIARIZE: return "diarize";
        case StageKind::TRANSCRIBE: return "transcribe";
    }
    return "unknown";
}

// PreprocessStage implementation
PreprocessStage::PreprocessStage(const audio::AudioFormat& sessionFormat)
    : preprocessor_(sessionFormat) {
}

void PreprocessStage::run(ChunkContext& context) {
    context.preprocessing = preprocessor_.preprocess(context.audio, context.session.config.preprocessing);
    context.audio = context.preprocessing.processedAudio;

    if (context.preprocessing.qualityScore < context.session.config.preprocessing.qualityThreshold &&
        !context.preprocessing.enhancements.empty()) {
        utils::Logger::debug("Chunk " + context.chunk.id + " below quality threshold: " +
                             std::to_string(context.preprocessing.qualityScore));
        utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
            utils::ErrorCategory::AUDIO_PROCESSING, utils::ErrorSeverity::INFO,
            utils::errorCodeToString(utils::TranscriptionErrorCode::INSUFFICIENT_AUDIO_QUALITY),
            "quality score " + std::to_string(context.preprocessing.qualityScore),
            context.chunk.id, context.session.id));
    }
}

// DiarizeStage implementation
DiarizeStage::DiarizeStage(std::shared_ptr<diarization::SpeakerDiarizationEngine> engine,
                           const audio::AudioFormat& sessionFormat)
    : engine_(std::move(engine)), sessionFormat_(sessionFormat) {
}

void DiarizeStage::run(ChunkContext& context) {
    if (!context.session.config.enableSpeakerDiarization) {
        return;
    }

    try {
        audio::DecodedAudio decoded = audio::AudioUtils::decode(context.audio, sessionFormat_);
        std::vector<float> mono = audio::AudioUtils::convertChannels(decoded.samples, decoded.format.channels, 1);

        if (context.session.speakers.empty()) {
            seedSpeakers(context, mono, decoded.format.sampleRate);
        } else {
            identify(context, mono, decoded.format.sampleRate);
        }
    } catch (const std::exception& e) {
        context.speakerId = "unknown";
        context.seededSpeakers.clear();
        context.matchedEmbedding.clear();

        utils::Logger::warn("Speaker identification failed for chunk " + context.chunk.id + ": " + e.what());
        utils::ErrorHandler::getInstance().reportError(
            utils::TranscriptionException(utils::TranscriptionErrorCode::SPEAKER_DIARIZATION_FAILED,
                                          e.what(), "", context.session.id),
            "DiarizeStage", context.session.id);
    }
}

void DiarizeStage::seedSpeakers(ChunkContext& context, const std::vector<float>& samples, int sampleRate) {
    diarization::DiarizationResult result =
        engine_->diarizeSamples(samples, sampleRate, context.session.config.diarization);

    auto now = std::chrono::system_clock::now();
    for (const auto& detected : result.speakers) {
        diarization::Speaker speaker;
        speaker.id = detected.id;
        speaker.voiceProfile.id = utils::IdGenerator::generate("profile");
        speaker.voiceProfile.features = detected.voiceEmbedding;
        speaker.voiceProfile.confidence = detected.confidence;
        speaker.voiceProfile.sampleCount = 1;
        speaker.voiceProfile.lastUpdated = now;
        speaker.averageConfidence = detected.confidence;
        speaker.detectedAt = now;
        context.seededSpeakers.push_back(speaker);
    }

    if (!result.segments.empty()) {
        context.speakerId = result.segments.front().speakerId;
    } else if (!result.speakers.empty()) {
        context.speakerId = result.speakers.front().id;
    }

    utils::Logger::debug("Seeded " + std::to_string(context.seededSpeakers.size()) +
                         " speakers for session " + context.session.id);
}

void DiarizeStage::identify(ChunkContext& context, const std::vector<float>& samples, int sampleRate) {
    std::vector<float> embedding = engine_->extractEmbedding(samples, sampleRate);
    auto match = engine_->identifySpeaker(embedding, context.session.speakers);
    if (match) {
        context.speakerId = *match;
        context.matchedEmbedding = std::move(embedding);
    }
}

// TranscribeStage implementation
TranscribeStage::TranscribeStage(std::shared_ptr<models::ModelTranscriptionClient> client)
    : client_(std::move(client)) {
}

void TranscribeStage::run(ChunkContext& context) {
    models::ModelCallOptions options;
    options.modelName = context.session.currentModel;
    options.language = context.session.config.language;
    context.transcription = client_->transcribe(context.audio, options);
}

// ChunkPipeline implementation
ChunkPipeline::ChunkPipeline(const audio::AudioFormat& sessionFormat,
                             std::shared_ptr<diarization::SpeakerDiarizationEngine> engine,
                             std::shared_ptr<models::ModelTranscriptionClient> client)
    : preprocess_(std::make_unique<PreprocessStage>(sessionFormat)),
      diarize_(std::make_unique<DiarizeStage>(std::move(engine), sessionFormat)),
      transcribe_(std::make_unique<TranscribeStage>(std::move(client))) {
}

const std::vector<StageKind>& ChunkPipeline::order() {
    static const std::vector<StageKind> stages = {
        StageKind::PREPROCESS,
        StageKind::DIARIZE,
        StageKind::TRANSCRIBE
    };
    return stages;
}

PipelineStage& ChunkPipeline::stageFor(StageKind kind) {
    switch (kind) {
        case StageKind::PREPROCESS: return *preprocess_;
        case StageKind::DIARIZE: return *diarize_;
        case StageKind::TRANSCRIBE: return *transcribe_;
    }
    throw std::logic_error("Unhandled pipeline stage");
}

void ChunkPipeline::run(ChunkContext& context) {
    for (StageKind kind : order()) {
        utils::ErrorContext errorContext(stageKindToString(kind), context.session.id);
        stageFor(kind).run(context);
    }
}

} // namespace core
} // namespace meetscribe
