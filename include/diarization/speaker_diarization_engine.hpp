#pragma once

#include "audio/audio_utils.hpp"
#include "diarization/diarization_types.hpp"
#include "diarization/speaker_embedding.hpp"
#include "diarization/voice_activity_detector.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meetscribe {
namespace diarization {

/**
 * Speaker diarization engine
 *
 * Runs voice-activity detection, spectral embedding and greedy similarity
 * clustering over audio chunks, identifies speakers against known voice
 * profiles and keeps a store of enrolled profiles.
 */
class SpeakerDiarizationEngine {
public:
    /**
     * @param rawFormat Format assumed for chunks that are not WAV containers
     */
    explicit SpeakerDiarizationEngine(const audio::AudioFormat& rawFormat = audio::AudioFormat());
    ~SpeakerDiarizationEngine() = default;

    SpeakerDiarizationEngine(const SpeakerDiarizationEngine&) = delete;
    SpeakerDiarizationEngine& operator=(const SpeakerDiarizationEngine&) = delete;

    /**
     * Full diarization of one chunk
     * @param audioData WAV or raw PCM16 bytes
     * @param config Clustering parameters
     * @return Speakers found, their segments and the mean segment confidence
     * @throws DiarizationException if the audio cannot be decoded
     */
    DiarizationResult diarize(const std::vector<uint8_t>& audioData, const DiarizationConfig& config);

    /**
     * Full diarization of decoded mono samples
     */
    DiarizationResult diarizeSamples(const std::vector<float>& samples, int sampleRate,
                                     const DiarizationConfig& config);

    /**
     * Nearest-neighbour match of an embedding against known speakers
     * @return Id of the most similar speaker above IDENTIFICATION_THRESHOLD
     */
    std::optional<std::string> identifySpeaker(const std::vector<float>& embedding,
                                               const std::vector<Speaker>& knownSpeakers) const;

    /**
     * Embedding of a whole chunk
     * @throws DiarizationException if the audio cannot be decoded
     */
    std::vector<float> extractEmbedding(const std::vector<uint8_t>& audioData);
    std::vector<float> extractEmbedding(const std::vector<float>& samples, int sampleRate);

    // Voice profile store
    VoiceProfile createVoiceProfile(const std::vector<std::vector<uint8_t>>& audioSamples);
    VoiceProfile updateVoiceProfile(const std::string& profileId, const std::vector<uint8_t>& audioSample);
    VoiceProfile mergeVoiceProfiles(const std::string& profileIdA, const std::string& profileIdB);
    std::optional<VoiceProfile> getVoiceProfile(const std::string& profileId) const;
    size_t getVoiceProfileCount() const;

    /**
     * Merge two speakers into a new one with a fresh id. The voice profiles
     * are averaged and re-normalized, confidences averaged and sample counts
     * summed. Profiles of either input held in the store are retired.
     */
    Speaker mergeSpeakers(const Speaker& first, const Speaker& second);

    // Blend an embedding into a profile in place (0.9 old, 0.1 new)
    static void applyProfileUpdate(VoiceProfile& profile, const std::vector<float>& embedding);

    static VoiceProfile mergeProfiles(const VoiceProfile& a, const VoiceProfile& b);

    size_t getTotalDiarizations() const { return totalDiarizations_; }

private:
    std::vector<float> decodeMono(const std::vector<uint8_t>& audioData, int& sampleRate) const;
    SpectralEmbeddingExtractor& extractorFor(int sampleRate);

    std::vector<DetectedSpeaker> clusterSpeakers(
        const std::vector<std::vector<float>>& embeddings,
        const std::vector<VoiceSegment>& segments,
        const DiarizationConfig& config) const;

    audio::AudioFormat rawFormat_;

    std::map<int, std::unique_ptr<SpectralEmbeddingExtractor>> extractors_;
    std::mutex extractorMutex_;

    std::unordered_map<std::string, VoiceProfile> voiceProfiles_;
    mutable std::mutex profileMutex_;

    std::atomic<size_t> totalDiarizations_;
};

} // namespace diarization
} // namespace meetscribe
