#pragma once

#include "audio/audio_stream.hpp"
#include "core/distribution_hub.hpp"
#include "core/pipeline_stages.hpp"
#include "core/post_processing.hpp"
#include "core/quality_metrics.hpp"
#include "core/session_observer.hpp"
#include "core/transcription_types.hpp"
#include "diarization/speaker_diarization_engine.hpp"
#include "models/model_client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Session Manager and chunk pipeline orchestrator.
 *
 * Owns every live session in a single registry. Each session has a consumer
 * thread that cuts its input stream into overlapping windows and drives them
 * through preprocess, diarize and transcribe one at a time; a session's chunks
 * never overlap in flight. Failed model calls switch the session to its next
 * fallback model and retry the chunk once while the error budget allows.
 *
 * Errors are reported as SessionException (unknown, closed or inactive
 * sessions), TranscriptionException (model failures) and
 * ConfigurationException (invalid settings).
 */
class SessionManager {
public:
    SessionManager(std::shared_ptr<models::ModelTranscriptionClient> modelClient,
                   std::shared_ptr<diarization::SpeakerDiarizationEngine> diarizationEngine,
                   std::shared_ptr<DistributionHub> hub,
                   std::shared_ptr<PostProcessingScheduler> postProcessing,
                   const TranscriptionConfig& defaults = TranscriptionConfig());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Observer notified for every session
    void addObserver(std::shared_ptr<SessionObserver> observer);

    /**
     * Start a session and begin consuming its stream
     * @param stream Audio input, read on the session's consumer thread
     * @param config Settings; unset values are filled with defaults
     * @param meetingId Meeting the session belongs to, may be empty
     * @param observer Optional observer of this session only
     * @return Snapshot of the new session in Active state
     * @throws ConfigurationException for invalid settings
     * @throws TranscriptionException (MODEL_UNAVAILABLE) if the model cannot be loaded
     */
    Session startSession(std::shared_ptr<audio::AudioStream> stream,
                         TranscriptionConfig config,
                         const std::string& meetingId = "",
                         std::shared_ptr<SessionObserver> observer = nullptr);

    /**
     * Run one chunk through the pipeline and append its segment
     * @throws SessionException if the session is unknown, closed or not active
     * @throws TranscriptionException once the fallback retry is spent
     */
    TranscriptSegment processAudioChunk(const std::string& sessionId, const std::vector<uint8_t>& audioData);

    void pauseSession(const std::string& sessionId);
    void resumeSession(const std::string& sessionId);

    /**
     * Stop consumption, close the distribution channel and evict the session
     * without producing a transcript
     */
    void cancelSession(const std::string& sessionId);

    /**
     * Complete the session and assemble its transcript.
     *
     * Input still unread from the stream is discarded; callers wanting every
     * byte should end the stream and waitForInputDrained() first. On success
     * the session is evicted after the transcript is handed off; on failure
     * it stays queryable in Error state.
     */
    FullTranscript finalizeTranscript(const std::string& sessionId);

    // Snapshot copy of the session
    Session getTranscriptionSession(const std::string& sessionId) const;

    SessionQualityMetrics getQualityMetrics(const std::string& sessionId) const;

    /**
     * Make a model the session's active model, loading it if needed
     */
    void switchModel(const std::string& sessionId, const std::string& modelName);

    /**
     * Merge two speakers of a session; their segments move to the merged id
     * @throws DiarizationException if either speaker is unknown
     */
    diarization::Speaker mergeSpeakers(const std::string& sessionId,
                                       const std::string& speakerIdA,
                                       const std::string& speakerIdB);

    // Stateless full diarization of an audio buffer
    diarization::DiarizationResult identifySpeakers(const std::vector<uint8_t>& audioData);

    // One model's status, or every model's when no name is given
    std::vector<models::ModelStatus> getModelStatus(const std::optional<std::string>& modelName = std::nullopt) const;

    std::vector<std::string> listSessions() const;

    /**
     * Drop a session left in Error state from the registry
     * @return false if the session is unknown or not terminal
     */
    bool releaseSession(const std::string& sessionId);

    /**
     * Block until the session's consumer has read its stream to the end
     * @return false on timeout
     */
    bool waitForInputDrained(const std::string& sessionId, std::chrono::milliseconds timeout) const;

    const TranscriptionConfig& getDefaults() const { return defaults_; }

private:
    struct SessionEntry {
        explicit SessionEntry(const std::string& id) : metrics(id) {}

        // Written under stateMutex; pipeline-owned fields also need processingMutex
        Session session;
        mutable std::mutex stateMutex;
        std::condition_variable stateChanged;
        bool inputDrained = false;

        // Serializes chunk pipelines and pipeline-visible mutations
        std::mutex processingMutex;
        std::unique_ptr<ChunkPipeline> pipeline;

        SessionMetricsTracker metrics;
        std::shared_ptr<audio::AudioStream> stream;
        std::shared_ptr<SessionObserver> observer;
        std::chrono::steady_clock::time_point startedAt;

        std::thread consumer;
        std::atomic<bool> stopRequested{false};
        std::atomic<bool> consumerFinished{false};
    };

    using EntryPtr = std::shared_ptr<SessionEntry>;

    EntryPtr findEntry(const std::string& sessionId) const;

    // Caller holds entry->stateMutex
    static void requireOpen(const SessionEntry& entry);

    void consume(EntryPtr entry);
    bool waitWhilePaused(SessionEntry& entry);
    bool dispatchFromStream(const EntryPtr& entry, const std::vector<uint8_t>& window);

    // Caller holds entry->processingMutex
    TranscriptSegment processLocked(SessionEntry& entry, const std::vector<uint8_t>& audioData);
    TranscriptSegment runAttempt(SessionEntry& entry, AudioChunk& chunk);
    TranscriptSegment commit(SessionEntry& entry, AudioChunk& chunk, ChunkContext& context);
    void recordFailure(SessionEntry& entry, const TranscriptionError& error);

    FullTranscript buildTranscript(const Session& session) const;
    void schedulePostProcessing(const FullTranscript& transcript);

    std::vector<std::string> initialFallbacks(const TranscriptionConfig& config) const;
    static TranscriptionError toTranscriptionError(const std::exception& e, const std::string& sessionId,
                                                   const std::string& chunkId);

    void stopConsumer(SessionEntry& entry);
    void evict(const std::string& sessionId);
    void retire(EntryPtr entry);
    void reapRetired();

    template<typename Fn>
    void notifyObservers(const SessionEntry& entry, Fn&& fn);

    std::shared_ptr<models::ModelTranscriptionClient> modelClient_;
    std::shared_ptr<diarization::SpeakerDiarizationEngine> diarizationEngine_;
    std::shared_ptr<DistributionHub> hub_;
    std::shared_ptr<PostProcessingScheduler> postProcessing_;
    TranscriptionConfig defaults_;

    std::vector<std::shared_ptr<SessionObserver>> observers_;
    mutable std::mutex observersMutex_;

    std::unordered_map<std::string, EntryPtr> sessions_;
    std::vector<EntryPtr> retired_;
    mutable std::mutex registryMutex_;
};

} // namespace core
} // namespace meetscribe
