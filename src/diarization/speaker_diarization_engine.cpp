#include "diarization/speaker_diarization_engine.hpp"
#include "utils/error_handler.hpp"
#include "utils/id_generator.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>

namespace meetscribe {
namespace diarization {

DiarizationConfig DiarizationConfig::fromJson(const nlohmann::json& j) {
    DiarizationConfig config;
    if (!j.is_object()) {
        return config;
    }
    config.minSpeakers = j.value("minSpeakers", config.minSpeakers);
    config.maxSpeakers = j.value("maxSpeakers", config.maxSpeakers);
    config.minSegmentLength = j.value("minSegmentLength", config.minSegmentLength);
    config.similarityThreshold = j.value("similarityThreshold", config.similarityThreshold);
    config.vadEnergyThreshold = j.value("vadEnergyThreshold", config.vadEnergyThreshold);
    config.modelName = j.value("modelName", config.modelName);
    return config;
}

SpeakerDiarizationEngine::SpeakerDiarizationEngine(const audio::AudioFormat& rawFormat)
    : rawFormat_(rawFormat), totalDiarizations_(0) {
}

std::vector<float> SpeakerDiarizationEngine::decodeMono(const std::vector<uint8_t>& audioData,
                                                       int& sampleRate) const {
    try {
        audio::DecodedAudio decoded = audio::AudioUtils::decode(audioData, rawFormat_);
        sampleRate = decoded.format.sampleRate;
        return audio::AudioUtils::convertChannels(decoded.samples, decoded.format.channels, 1);
    } catch (const utils::AudioProcessingException& e) {
        throw utils::DiarizationException(std::string("Cannot decode audio for diarization: ") + e.what(),
                                          "SpeakerDiarizationEngine");
    }
}

SpectralEmbeddingExtractor& SpeakerDiarizationEngine::extractorFor(int sampleRate) {
    std::lock_guard<std::mutex> lock(extractorMutex_);
    auto it = extractors_.find(sampleRate);
    if (it == extractors_.end()) {
        it = extractors_.emplace(sampleRate, std::make_unique<SpectralEmbeddingExtractor>(sampleRate)).first;
    }
    return *it->second;
}

DiarizationResult SpeakerDiarizationEngine::diarize(const std::vector<uint8_t>& audioData,
                                                    const DiarizationConfig& config) {
    int sampleRate = 0;
    std::vector<float> samples = decodeMono(audioData, sampleRate);
    return diarizeSamples(samples, sampleRate, config);
}

DiarizationResult SpeakerDiarizationEngine::diarizeSamples(const std::vector<float>& samples, int sampleRate,
                                                           const DiarizationConfig& config) {
    auto startTime = std::chrono::steady_clock::now();
    totalDiarizations_++;

    DiarizationResult result;
    result.modelUsed = config.modelName;

    VoiceActivityDetector vad(config.vadEnergyThreshold);
    std::vector<VoiceSegment> voiceSegments = vad.detect(samples, sampleRate);

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(voiceSegments.size());
    if (!voiceSegments.empty()) {
        SpectralEmbeddingExtractor& extractor = extractorFor(sampleRate);
        for (const auto& segment : voiceSegments) {
            embeddings.push_back(extractor.extract(samples.data() + segment.startSample,
                                                   segment.endSample - segment.startSample));
        }
    }

    result.speakers = clusterSpeakers(embeddings, voiceSegments, config);

    // Assign every voice segment to its best-matching surviving speaker
    if (!result.speakers.empty()) {
        double confidenceSum = 0.0;
        for (size_t i = 0; i < voiceSegments.size(); ++i) {
            const DetectedSpeaker* best = &result.speakers.front();
            float bestSimilarity = 0.0f;
            for (const auto& speaker : result.speakers) {
                float similarity = cosineSimilarity(embeddings[i], speaker.voiceEmbedding);
                if (similarity > bestSimilarity) {
                    bestSimilarity = similarity;
                    best = &speaker;
                }
            }

            SpeakerSegment segment;
            segment.speakerId = best->id;
            segment.startTime = voiceSegments[i].startTime;
            segment.endTime = voiceSegments[i].endTime;
            segment.confidence = std::max(0.0f, std::min(1.0f, bestSimilarity));
            confidenceSum += segment.confidence;
            result.segments.push_back(segment);
        }
        result.confidence = result.segments.empty()
            ? 0.0f
            : static_cast<float>(confidenceSum / result.segments.size());
    }

    result.processingTimeMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();

    utils::Logger::debug("Speaker diarization found " + std::to_string(result.speakers.size()) +
                         " speaker(s) in " + std::to_string(voiceSegments.size()) + " voice segment(s)");
    return result;
}

std::vector<DetectedSpeaker> SpeakerDiarizationEngine::clusterSpeakers(
    const std::vector<std::vector<float>>& embeddings,
    const std::vector<VoiceSegment>& segments,
    const DiarizationConfig& config) const {

    std::vector<DetectedSpeaker> speakers;
    std::vector<bool> assigned(embeddings.size(), false);
    std::vector<size_t> memberCounts;

    for (size_t i = 0; i < embeddings.size(); ++i) {
        if (assigned[i]) {
            continue;
        }
        if (speakers.size() >= config.maxSpeakers) {
            break;
        }

        DetectedSpeaker speaker;
        speaker.id = "speaker_" + std::to_string(speakers.size() + 1);
        speaker.voiceEmbedding = embeddings[i];
        speaker.confidence = 1.0f;
        speaker.firstDetectedAt = segments[i].startTime;
        speaker.lastDetectedAt = segments[i].endTime;
        speaker.totalSpeakingTime = segments[i].duration();
        assigned[i] = true;
        size_t members = 1;

        for (size_t j = i + 1; j < embeddings.size(); ++j) {
            if (assigned[j]) {
                continue;
            }
            float similarity = cosineSimilarity(speaker.voiceEmbedding, embeddings[j]);
            if (similarity > config.similarityThreshold) {
                assigned[j] = true;
                speaker.lastDetectedAt = std::max(speaker.lastDetectedAt, segments[j].endTime);
                speaker.totalSpeakingTime += segments[j].duration();

                // Running average of member embeddings
                ++members;
                for (size_t k = 0; k < speaker.voiceEmbedding.size(); ++k) {
                    speaker.voiceEmbedding[k] += (embeddings[j][k] - speaker.voiceEmbedding[k]) / members;
                }
                l2Normalize(speaker.voiceEmbedding);
            }
        }

        speakers.push_back(std::move(speaker));
    }

    speakers.erase(std::remove_if(speakers.begin(), speakers.end(),
                                  [&config](const DetectedSpeaker& s) {
                                      return s.totalSpeakingTime < config.minSegmentLength;
                                  }),
                   speakers.end());
    return speakers;
}

std::optional<std::string> SpeakerDiarizationEngine::identifySpeaker(
    const std::vector<float>& embedding, const std::vector<Speaker>& knownSpeakers) const {

    std::optional<std::string> bestMatch;
    float highestSimilarity = 0.0f;

    for (const auto& speaker : knownSpeakers) {
        float similarity = cosineSimilarity(embedding, speaker.voiceProfile.features);
        if (similarity > highestSimilarity && similarity > IDENTIFICATION_THRESHOLD) {
            highestSimilarity = similarity;
            bestMatch = speaker.id;
        }
    }
    return bestMatch;
}

std::vector<float> SpeakerDiarizationEngine::extractEmbedding(const std::vector<uint8_t>& audioData) {
    int sampleRate = 0;
    std::vector<float> samples = decodeMono(audioData, sampleRate);
    return extractEmbedding(samples, sampleRate);
}

std::vector<float> SpeakerDiarizationEngine::extractEmbedding(const std::vector<float>& samples, int sampleRate) {
    return extractorFor(sampleRate).extract(samples);
}

VoiceProfile SpeakerDiarizationEngine::createVoiceProfile(const std::vector<std::vector<uint8_t>>& audioSamples) {
    std::vector<std::vector<float>> embeddings;
    for (const auto& sample : audioSamples) {
        try {
            std::vector<float> embedding = extractEmbedding(sample);
            if (l2Norm(embedding) > 0.0f) {
                embeddings.push_back(std::move(embedding));
            }
        } catch (const utils::DiarizationException& e) {
            utils::Logger::warn("Skipping voice sample for profile: " + std::string(e.what()));
        }
    }

    if (embeddings.empty()) {
        throw utils::TranscriptionException(utils::TranscriptionErrorCode::SPEAKER_DIARIZATION_FAILED,
                                            "No valid audio samples provided for voice profile creation");
    }

    VoiceProfile profile;
    profile.id = utils::IdGenerator::generate("voice_profile");
    profile.features = averageEmbeddings(embeddings);
    l2Normalize(profile.features);
    profile.sampleCount = embeddings.size();
    profile.lastUpdated = std::chrono::system_clock::now();

    if (embeddings.size() <= 1) {
        profile.confidence = 1.0f;
    } else {
        double total = 0.0;
        for (const auto& embedding : embeddings) {
            total += cosineSimilarity(embedding, profile.features);
        }
        profile.confidence = static_cast<float>(total / embeddings.size());
    }

    std::lock_guard<std::mutex> lock(profileMutex_);
    voiceProfiles_[profile.id] = profile;
    return profile;
}

VoiceProfile SpeakerDiarizationEngine::updateVoiceProfile(const std::string& profileId,
                                                          const std::vector<uint8_t>& audioSample) {
    {
        std::lock_guard<std::mutex> lock(profileMutex_);
        if (voiceProfiles_.find(profileId) == voiceProfiles_.end()) {
            throw utils::TranscriptionException(utils::TranscriptionErrorCode::SPEAKER_DIARIZATION_FAILED,
                                                "Voice profile not found: " + profileId);
        }
    }

    std::vector<float> embedding = extractEmbedding(audioSample);

    std::lock_guard<std::mutex> lock(profileMutex_);
    auto it = voiceProfiles_.find(profileId);
    if (it == voiceProfiles_.end()) {
        throw utils::TranscriptionException(utils::TranscriptionErrorCode::SPEAKER_DIARIZATION_FAILED,
                                            "Voice profile not found: " + profileId);
    }
    applyProfileUpdate(it->second, embedding);
    return it->second;
}

VoiceProfile SpeakerDiarizationEngine::mergeVoiceProfiles(const std::string& profileIdA,
                                                          const std::string& profileIdB) {
    std::lock_guard<std::mutex> lock(profileMutex_);
    auto a = voiceProfiles_.find(profileIdA);
    auto b = voiceProfiles_.find(profileIdB);
    if (a == voiceProfiles_.end() || b == voiceProfiles_.end()) {
        throw utils::TranscriptionException(utils::TranscriptionErrorCode::SPEAKER_DIARIZATION_FAILED,
                                            "One or both voice profiles not found");
    }

    VoiceProfile merged = mergeProfiles(a->second, b->second);
    voiceProfiles_.erase(profileIdA);
    voiceProfiles_.erase(profileIdB);
    voiceProfiles_[merged.id] = merged;
    return merged;
}

std::optional<VoiceProfile> SpeakerDiarizationEngine::getVoiceProfile(const std::string& profileId) const {
    std::lock_guard<std::mutex> lock(profileMutex_);
    auto it = voiceProfiles_.find(profileId);
    if (it == voiceProfiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SpeakerDiarizationEngine::getVoiceProfileCount() const {
    std::lock_guard<std::mutex> lock(profileMutex_);
    return voiceProfiles_.size();
}

Speaker SpeakerDiarizationEngine::mergeSpeakers(const Speaker& first, const Speaker& second) {
    Speaker merged;
    merged.voiceProfile = mergeProfiles(first.voiceProfile, second.voiceProfile);
    merged.id = utils::IdGenerator::generate("speaker");
    merged.name = first.name.empty() ? second.name : first.name;
    merged.totalSpeakingTime = first.totalSpeakingTime + second.totalSpeakingTime;
    merged.segments = first.segments;
    merged.segments.insert(merged.segments.end(), second.segments.begin(), second.segments.end());
    merged.averageConfidence = merged.voiceProfile.confidence;
    merged.detectedAt = std::min(first.detectedAt, second.detectedAt);

    std::lock_guard<std::mutex> lock(profileMutex_);
    voiceProfiles_.erase(first.voiceProfile.id);
    voiceProfiles_.erase(second.voiceProfile.id);
    return merged;
}

void SpeakerDiarizationEngine::applyProfileUpdate(VoiceProfile& profile, const std::vector<float>& embedding) {
    profile.features = blendEmbedding(profile.features, embedding, PROFILE_UPDATE_WEIGHT);
    profile.sampleCount += 1;
    profile.lastUpdated = std::chrono::system_clock::now();
}

VoiceProfile SpeakerDiarizationEngine::mergeProfiles(const VoiceProfile& a, const VoiceProfile& b) {
    if (a.features.size() != b.features.size()) {
        throw utils::DiarizationException("Cannot merge profiles of different dimensions",
                                          "SpeakerDiarizationEngine::mergeProfiles");
    }

    VoiceProfile merged;
    merged.id = utils::IdGenerator::generate("voice_profile");
    merged.features.resize(a.features.size());
    for (size_t i = 0; i < a.features.size(); ++i) {
        merged.features[i] = (a.features[i] + b.features[i]) / 2.0f;
    }
    l2Normalize(merged.features);
    merged.confidence = (a.confidence + b.confidence) / 2.0f;
    merged.sampleCount = a.sampleCount + b.sampleCount;
    merged.lastUpdated = std::chrono::system_clock::now();
    return merged;
}

} // namespace diarization
} // namespace meetscribe
