#include "core/session_manager.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/id_generator.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace meetscribe {
namespace core {

namespace {

int64_t elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

double elapsedMsPrecise(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

void removeModel(std::vector<std::string>& models, const std::string& modelName) {
    models.erase(std::remove(models.begin(), models.end(), modelName), models.end());
}

} // namespace

SessionManager::SessionManager(std::shared_ptr<models::ModelTranscriptionClient> modelClient,
                               std::shared_ptr<diarization::SpeakerDiarizationEngine> diarizationEngine,
                               std::shared_ptr<DistributionHub> hub,
                               std::shared_ptr<PostProcessingScheduler> postProcessing,
                               const TranscriptionConfig& defaults)
    : modelClient_(std::move(modelClient)),
      diarizationEngine_(std::move(diarizationEngine)),
      hub_(std::move(hub)),
      postProcessing_(std::move(postProcessing)),
      defaults_(defaults) {
    if (!modelClient_ || !diarizationEngine_ || !hub_) {
        throw utils::ConfigurationException("SessionManager requires a model client, diarization engine and hub");
    }
}

SessionManager::~SessionManager() {
    std::vector<EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        for (auto& entry : sessions_) {
            entries.push_back(entry.second);
        }
        entries.insert(entries.end(), retired_.begin(), retired_.end());
        sessions_.clear();
        retired_.clear();
    }

    for (auto& entry : entries) {
        stopConsumer(*entry);
    }
    for (auto& entry : entries) {
        if (entry->consumer.joinable()) {
            entry->consumer.join();
        }
    }
}

void SessionManager::addObserver(std::shared_ptr<SessionObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

template<typename Fn>
void SessionManager::notifyObservers(const SessionEntry& entry, Fn&& fn) {
    std::vector<std::shared_ptr<SessionObserver>> targets;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        targets = observers_;
    }
    if (entry.observer) {
        targets.push_back(entry.observer);
    }

    for (const auto& observer : targets) {
        try {
            fn(*observer);
        } catch (const std::exception& e) {
            utils::Logger::error("Session observer failed for " + entry.session.id + ": " + e.what());
            MEETSCRIBE_HANDLE_EXCEPTION(e, "SessionObserver");
        }
    }
}

SessionManager::EntryPtr SessionManager::findEntry(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        throw utils::SessionException(utils::SessionErrorCode::SESSION_NOT_FOUND,
                                      "Transcription session not found: " + sessionId, sessionId);
    }
    return it->second;
}

void SessionManager::requireOpen(const SessionEntry& entry) {
    if (isTerminal(entry.session.status)) {
        throw utils::SessionException(utils::SessionErrorCode::SESSION_CLOSED,
                                      "Session is " + sessionStatusToString(entry.session.status),
                                      entry.session.id);
    }
}

std::vector<std::string> SessionManager::initialFallbacks(const TranscriptionConfig& config) const {
    std::vector<std::string> fallbacks = config.fallbackModels ? *config.fallbackModels
                                                               : models::defaultModelOrder();
    removeModel(fallbacks, config.modelName);
    return fallbacks;
}

TranscriptionError SessionManager::toTranscriptionError(const std::exception& e, const std::string& sessionId,
                                                        const std::string& chunkId) {
    TranscriptionError error;
    error.message = e.what();
    error.timestamp = std::chrono::system_clock::now();
    error.sessionId = sessionId;
    error.audioChunkId = chunkId;

    if (auto* transcription = dynamic_cast<const utils::TranscriptionException*>(&e)) {
        error.code = transcription->getCode();
        error.retryable = transcription->isRetryable();
        error.modelName = transcription->getModelName();
    } else {
        error.code = utils::classifyErrorMessage(error.message);
        error.retryable = utils::isRetryable(error.code);
    }
    return error;
}

Session SessionManager::startSession(std::shared_ptr<audio::AudioStream> stream,
                                     TranscriptionConfig config,
                                     const std::string& meetingId,
                                     std::shared_ptr<SessionObserver> observer) {
    if (!stream) {
        throw utils::ConfigurationException("startSession requires an audio stream");
    }

    config.applyDefaults();
    config.validate();

    std::string sessionId = utils::IdGenerator::generate("session");
    utils::ErrorContext errorContext("startSession", sessionId);
    utils::Logger::info("Starting transcription session: " + sessionId + " with model " + config.modelName);

    // Blocking prerequisite; nothing is registered if the model cannot be loaded
    modelClient_->ensureModelLoaded(config.modelName);

    auto entry = std::make_shared<SessionEntry>(sessionId);
    entry->session.id = sessionId;
    entry->session.meetingId = meetingId;
    entry->session.config = config;
    entry->session.status = SessionStatus::INITIALIZING;
    entry->session.startTime = std::chrono::system_clock::now();
    entry->session.currentModel = config.modelName;
    entry->session.fallbackModels = initialFallbacks(config);
    entry->startedAt = std::chrono::steady_clock::now();
    entry->stream = std::move(stream);
    entry->observer = std::move(observer);
    entry->pipeline = std::make_unique<ChunkPipeline>(config.audioFormat(), diarizationEngine_, modelClient_);

    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        sessions_[sessionId] = entry;
    }

    Session snapshot;
    try {
        std::string channelId = hub_->createConnection(sessionId);
        {
            std::lock_guard<std::mutex> lock(entry->stateMutex);
            entry->session.channelId = channelId;
            entry->session.status = SessionStatus::ACTIVE;
            snapshot = entry->session;
        }
        entry->consumer = std::thread(&SessionManager::consume, this, entry);
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to start transcription session " + sessionId + ": " + e.what());
        TranscriptionError error = toTranscriptionError(e, sessionId, "");
        {
            std::lock_guard<std::mutex> lock(entry->stateMutex);
            entry->session.status = SessionStatus::ERROR;
            entry->session.endTime = std::chrono::system_clock::now();
            entry->session.lastError = error;
        }
        stopConsumer(*entry);
        notifyObservers(*entry, [&](SessionObserver& o) { o.onSessionError(sessionId, error); });
        throw;
    }

    hub_->broadcast(sessionId, DistributionMessage::status(sessionId, SessionStatus::ACTIVE));
    notifyObservers(*entry, [&](SessionObserver& o) { o.onSessionStarted(snapshot); });

    utils::Logger::info("Transcription session " + sessionId + " started successfully");
    return snapshot;
}

void SessionManager::consume(EntryPtr entry) {
    const size_t chunkSize = entry->session.config.chunkSize;
    const size_t overlapSize = entry->session.config.overlapSize;

    std::vector<uint8_t> buffer;
    std::vector<uint8_t> block;
    bool open = true;

    try {
        while (open && !entry->stopRequested && entry->stream->read(block)) {
            buffer.insert(buffer.end(), block.begin(), block.end());

            while (buffer.size() >= chunkSize && !entry->stopRequested) {
                std::vector<uint8_t> window(buffer.begin(), buffer.begin() + chunkSize);
                buffer.erase(buffer.begin(), buffer.begin() + (chunkSize - overlapSize));

                if (!dispatchFromStream(entry, window)) {
                    open = false;
                    break;
                }
            }
        }

        // Whatever is left, the retained overlap included, is the final chunk
        if (open && !entry->stopRequested && !buffer.empty()) {
            dispatchFromStream(entry, buffer);
        }
    } catch (const std::exception& e) {
        utils::Logger::error("Audio stream consumption failed for session " + entry->session.id + ": " + e.what());
        MEETSCRIBE_HANDLE_ERROR(utils::ErrorCategory::SESSION, utils::ErrorSeverity::ERROR,
                                "Audio stream consumption failed", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        entry->inputDrained = true;
    }
    entry->stateChanged.notify_all();
    entry->consumerFinished = true;
    utils::Logger::debug("Input stream of session " + entry->session.id + " drained");
}

bool SessionManager::waitWhilePaused(SessionEntry& entry) {
    std::unique_lock<std::mutex> lock(entry.stateMutex);
    entry.stateChanged.wait(lock, [&entry] {
        return entry.stopRequested || entry.session.status != SessionStatus::PAUSED;
    });
    return !entry.stopRequested && entry.session.status == SessionStatus::ACTIVE;
}

bool SessionManager::dispatchFromStream(const EntryPtr& entry, const std::vector<uint8_t>& window) {
    while (true) {
        if (!waitWhilePaused(*entry)) {
            return false;
        }

        try {
            std::lock_guard<std::mutex> processing(entry->processingMutex);
            {
                std::lock_guard<std::mutex> lock(entry->stateMutex);
                if (entry->session.status == SessionStatus::PAUSED) {
                    continue;
                }
                if (entry->session.status != SessionStatus::ACTIVE || entry->stopRequested) {
                    return false;
                }
            }
            processLocked(*entry, window);
            return true;
        } catch (const utils::SessionException& e) {
            utils::Logger::info("Stopping consumption of session " + entry->session.id + ": " + e.what());
            return false;
        } catch (const std::exception& e) {
            // Already recorded on the session and broadcast; move on to the next window
            utils::Logger::error("Error processing audio chunk for session " + entry->session.id + ": " + e.what());
            return true;
        }
    }
}

TranscriptSegment SessionManager::processAudioChunk(const std::string& sessionId,
                                                    const std::vector<uint8_t>& audioData) {
    EntryPtr entry = findEntry(sessionId);

    std::lock_guard<std::mutex> processing(entry->processingMutex);
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);
        if (entry->session.status != SessionStatus::ACTIVE) {
            throw utils::SessionException(utils::SessionErrorCode::SESSION_NOT_ACTIVE,
                                          "Session is " + sessionStatusToString(entry->session.status) +
                                          ", chunks are accepted only while active", sessionId);
        }
    }
    return processLocked(*entry, audioData);
}

TranscriptSegment SessionManager::processLocked(SessionEntry& entry, const std::vector<uint8_t>& audioData) {
    const std::string& sessionId = entry.session.id;
    utils::ErrorContext errorContext("processAudioChunk", sessionId);

    AudioChunk chunk;
    chunk.id = utils::IdGenerator::generate("chunk");
    chunk.sessionId = sessionId;
    chunk.data = audioData;
    chunk.timestamp = elapsedMs(entry.startedAt);
    chunk.duration = audio::AudioUtils::estimateDurationMs(audioData.size(), entry.session.config.audioFormat());
    chunk.sampleRate = entry.session.config.sampleRate;
    chunk.channels = entry.session.config.channels;

    {
        std::lock_guard<std::mutex> lock(entry.stateMutex);
        entry.session.chunksReceived++;
    }

    auto attemptStart = std::chrono::steady_clock::now();
    try {
        return runAttempt(entry, chunk);
    } catch (const utils::SessionException&) {
        throw;
    } catch (const std::exception& e) {
        entry.metrics.recordAttempt(elapsedMsPrecise(attemptStart), false, 0.0f, 0.0);
        utils::Logger::error("Failed to process audio chunk for session " + sessionId + ": " + e.what());

        TranscriptionError error = toTranscriptionError(e, sessionId, chunk.id);
        std::string fallbackModel;
        std::string failedModel;
        {
            std::lock_guard<std::mutex> lock(entry.stateMutex);
            entry.session.errorCount++;
            entry.session.lastError = error;
            failedModel = entry.session.currentModel;
            if (!entry.session.fallbackModels.empty() && entry.session.errorCount < MAX_SESSION_ERRORS) {
                fallbackModel = entry.session.fallbackModels.front();
            }
        }
        hub_->broadcast(sessionId, DistributionMessage::error(sessionId, error));

        if (fallbackModel.empty()) {
            throw;
        }

        utils::Logger::info("Switching to fallback model: " + fallbackModel);
        attemptStart = std::chrono::steady_clock::now();
        try {
            {
                std::lock_guard<std::mutex> lock(entry.stateMutex);
                removeModel(entry.session.fallbackModels, fallbackModel);
                entry.session.retryCount++;
            }
            modelClient_->switchModel(failedModel, fallbackModel);
            {
                std::lock_guard<std::mutex> lock(entry.stateMutex);
                entry.session.currentModel = fallbackModel;
            }
            return runAttempt(entry, chunk);
        } catch (const utils::SessionException&) {
            throw;
        } catch (const std::exception& retryError) {
            entry.metrics.recordAttempt(elapsedMsPrecise(attemptStart), false, 0.0f, 0.0);
            utils::Logger::error("Fallback model also failed: " + std::string(retryError.what()));

            TranscriptionError retryFailure = toTranscriptionError(retryError, sessionId, chunk.id);
            recordFailure(entry, retryFailure);
            hub_->broadcast(sessionId, DistributionMessage::error(sessionId, retryFailure));
            throw;
        }
    }
}

void SessionManager::recordFailure(SessionEntry& entry, const TranscriptionError& error) {
    std::lock_guard<std::mutex> lock(entry.stateMutex);
    entry.session.errorCount++;
    entry.session.lastError = error;
}

TranscriptSegment SessionManager::runAttempt(SessionEntry& entry, AudioChunk& chunk) {
    auto start = std::chrono::steady_clock::now();

    ChunkContext context(entry.session, chunk);
    entry.pipeline->run(context);

    TranscriptSegment segment = commit(entry, chunk, context);
    entry.metrics.recordAttempt(elapsedMsPrecise(start), true, segment.confidence, chunk.duration);
    return segment;
}

TranscriptSegment SessionManager::commit(SessionEntry& entry, AudioChunk& chunk, ChunkContext& context) {
    const std::string& sessionId = entry.session.id;
    const models::ModelTranscription& transcription = *context.transcription;

    TranscriptSegment segment;
    segment.id = utils::IdGenerator::generate("segment");
    segment.timestamp = chunk.timestamp;
    segment.endTimestamp = chunk.timestamp + static_cast<int64_t>(std::llround(chunk.duration));
    segment.speakerId = context.speakerId;
    segment.text = transcription.text;
    segment.confidence = std::max(0.0f, std::min(1.0f, transcription.confidence));
    segment.processingTime = transcription.processingTimeMs;
    segment.audioChunkId = chunk.id;
    segment.language = entry.session.config.language;

    std::vector<diarization::Speaker> updatedSpeakers;
    {
        std::lock_guard<std::mutex> lock(entry.stateMutex);
        Session& session = entry.session;

        // A chunk finishing after cancel or finalize is discarded
        if (isTerminal(session.status)) {
            throw utils::SessionException(utils::SessionErrorCode::SESSION_CLOSED,
                                          "Session closed while chunk " + chunk.id + " was in flight", sessionId);
        }

        segment.modelUsed = transcription.modelUsed.empty() ? session.currentModel : transcription.modelUsed;
        if (segment.modelUsed != session.currentModel) {
            utils::Logger::info("Session " + sessionId + " adopts model " + segment.modelUsed +
                                " after client fallback from " + session.currentModel);
            session.currentModel = segment.modelUsed;
            removeModel(session.fallbackModels, segment.modelUsed);
        }

        if (session.speakers.empty() && !context.seededSpeakers.empty()) {
            session.speakers = context.seededSpeakers;
            updatedSpeakers = context.seededSpeakers;
        }

        auto speakerIt = std::find_if(session.speakers.begin(), session.speakers.end(),
                                      [&segment](const diarization::Speaker& s) { return s.id == segment.speakerId; });
        if (speakerIt != session.speakers.end()) {
            diarization::Speaker& speaker = *speakerIt;
            speaker.segments.push_back(segment.id);
            speaker.totalSpeakingTime += (segment.endTimestamp - segment.timestamp) / 1000.0;
            size_t count = speaker.segments.size();
            speaker.averageConfidence = count == 1
                ? segment.confidence
                : (speaker.averageConfidence * (count - 1) + segment.confidence) / count;
            if (!context.matchedEmbedding.empty()) {
                diarization::SpeakerDiarizationEngine::applyProfileUpdate(speaker.voiceProfile,
                                                                          context.matchedEmbedding);
            }

            auto existing = std::find_if(updatedSpeakers.begin(), updatedSpeakers.end(),
                                         [&speaker](const diarization::Speaker& s) { return s.id == speaker.id; });
            if (existing != updatedSpeakers.end()) {
                *existing = speaker;
            } else {
                updatedSpeakers.push_back(speaker);
            }
        }

        session.segments.push_back(segment);
    }

    chunk.processed = true;
    chunk.transcriptSegmentId = segment.id;

    hub_->broadcast(sessionId, DistributionMessage::segment(sessionId, segment));
    for (const auto& speaker : updatedSpeakers) {
        hub_->broadcast(sessionId, DistributionMessage::speakerUpdate(sessionId, speaker));
    }
    notifyObservers(entry, [&](SessionObserver& o) { o.onSegmentProcessed(sessionId, segment); });

    utils::Logger::debug("Session " + sessionId + " segment " + segment.id + " from " + segment.modelUsed +
                         " speaker " + segment.speakerId);
    return segment;
}

void SessionManager::pauseSession(const std::string& sessionId) {
    EntryPtr entry = findEntry(sessionId);
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);
        if (entry->session.status == SessionStatus::PAUSED) {
            return;
        }
        if (entry->session.status != SessionStatus::ACTIVE) {
            throw utils::SessionException(utils::SessionErrorCode::INVALID_STATE,
                                          "Cannot pause a session that is " +
                                          sessionStatusToString(entry->session.status), sessionId);
        }
        entry->session.status = SessionStatus::PAUSED;
    }
    entry->stateChanged.notify_all();

    hub_->broadcast(sessionId, DistributionMessage::status(sessionId, SessionStatus::PAUSED));
    utils::Logger::info("Transcription paused for session: " + sessionId);
}

void SessionManager::resumeSession(const std::string& sessionId) {
    EntryPtr entry = findEntry(sessionId);
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);
        if (entry->session.status == SessionStatus::ACTIVE) {
            return;
        }
        if (entry->session.status != SessionStatus::PAUSED) {
            throw utils::SessionException(utils::SessionErrorCode::INVALID_STATE,
                                          "Cannot resume a session that is " +
                                          sessionStatusToString(entry->session.status), sessionId);
        }
        entry->session.status = SessionStatus::ACTIVE;
    }
    entry->stateChanged.notify_all();

    hub_->broadcast(sessionId, DistributionMessage::status(sessionId, SessionStatus::ACTIVE));
    utils::Logger::info("Transcription resumed for session: " + sessionId);
}

void SessionManager::cancelSession(const std::string& sessionId) {
    EntryPtr entry = findEntry(sessionId);
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);
        entry->session.status = SessionStatus::CANCELLED;
        entry->session.endTime = std::chrono::system_clock::now();
    }
    stopConsumer(*entry);

    hub_->broadcast(sessionId, DistributionMessage::status(sessionId, SessionStatus::CANCELLED));
    hub_->closeSession(sessionId);
    evict(sessionId);

    notifyObservers(*entry, [&](SessionObserver& o) { o.onSessionCancelled(sessionId); });
    utils::Logger::info("Transcription cancelled for session: " + sessionId);
}

FullTranscript SessionManager::finalizeTranscript(const std::string& sessionId) {
    EntryPtr entry = findEntry(sessionId);
    utils::ErrorContext errorContext("finalizeTranscript", sessionId);
    utils::Logger::info("Finalizing transcript for session: " + sessionId);

    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);
    }
    stopConsumer(*entry);

    // Wait for the in-flight chunk, then close the session
    std::unique_lock<std::mutex> processing(entry->processingMutex);

    FullTranscript transcript;
    try {
        Session snapshot;
        {
            std::lock_guard<std::mutex> lock(entry->stateMutex);
            requireOpen(*entry);
            entry->session.status = SessionStatus::COMPLETED;
            entry->session.endTime = std::chrono::system_clock::now();
            snapshot = entry->session;
        }

        transcript = buildTranscript(snapshot);

        std::vector<std::shared_ptr<SessionObserver>> targets;
        {
            std::lock_guard<std::mutex> lock(observersMutex_);
            targets = observers_;
        }
        if (entry->observer) {
            targets.push_back(entry->observer);
        }
        for (const auto& observer : targets) {
            observer->onSessionCompleted(transcript);
        }

        hub_->broadcast(sessionId, DistributionMessage::complete(sessionId, transcript));
    } catch (const utils::SessionException&) {
        throw;
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to finalize transcript for session " + sessionId + ": " + e.what());
        TranscriptionError error = toTranscriptionError(e, sessionId, "");
        {
            std::lock_guard<std::mutex> lock(entry->stateMutex);
            entry->session.status = SessionStatus::ERROR;
            entry->session.lastError = error;
            if (!entry->session.endTime) {
                entry->session.endTime = std::chrono::system_clock::now();
            }
        }
        hub_->broadcast(sessionId, DistributionMessage::error(sessionId, error));
        hub_->broadcast(sessionId, DistributionMessage::status(sessionId, SessionStatus::ERROR));
        notifyObservers(*entry, [&](SessionObserver& o) { o.onSessionError(sessionId, error); });
        throw;
    }
    processing.unlock();

    schedulePostProcessing(transcript);

    hub_->closeSession(sessionId);
    evict(sessionId);

    utils::Logger::info("Transcript finalized for session: " + sessionId + " (" +
                        std::to_string(transcript.segments.size()) + " segments)");
    return transcript;
}

FullTranscript SessionManager::buildTranscript(const Session& session) const {
    FullTranscript transcript;
    transcript.id = utils::IdGenerator::generate("transcript");
    transcript.meetingId = session.meetingId;
    transcript.sessionId = session.id;
    transcript.segments = session.segments;
    transcript.speakers = session.speakers;
    if (session.endTime) {
        transcript.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            *session.endTime - session.startTime).count();
    }
    transcript.language = session.config.language;
    transcript.modelMetadata = buildModelMetadata(session, session.chunksReceived);
    transcript.createdAt = session.startTime;
    transcript.updatedAt = std::chrono::system_clock::now();
    transcript.status = TranscriptStatus::COMPLETED;
    return transcript;
}

void SessionManager::schedulePostProcessing(const FullTranscript& transcript) {
    if (!postProcessing_) {
        utils::Logger::debug("No post-processing scheduler configured");
        return;
    }

    PostProcessingRequest request;
    request.sessionId = transcript.sessionId;
    request.transcriptId = transcript.id;
    request.segmentCount = transcript.segments.size();
    request.duration = transcript.duration;

    try {
        postProcessing_->schedule(request);
        utils::Logger::debug("Scheduled post-processing for session: " + transcript.sessionId);
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to schedule post-processing for session " + transcript.sessionId +
                             ": " + e.what());
        MEETSCRIBE_HANDLE_ERROR(utils::ErrorCategory::POST_PROCESSING, utils::ErrorSeverity::ERROR,
                                "Failed to schedule post-processing", e.what());
    }
}

Session SessionManager::getTranscriptionSession(const std::string& sessionId) const {
    EntryPtr entry = findEntry(sessionId);
    std::lock_guard<std::mutex> lock(entry->stateMutex);
    return entry->session;
}

SessionQualityMetrics SessionManager::getQualityMetrics(const std::string& sessionId) const {
    EntryPtr entry = findEntry(sessionId);
    SessionQualityMetrics metrics = entry->metrics.snapshot();
    metrics.modelPerformance = modelClient_->getAllModelPerformance();
    return metrics;
}

void SessionManager::switchModel(const std::string& sessionId, const std::string& modelName) {
    EntryPtr entry = findEntry(sessionId);
    std::lock_guard<std::mutex> processing(entry->processingMutex);

    std::string currentModel;
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);
        currentModel = entry->session.currentModel;
    }

    utils::Logger::info("Switching model for session " + sessionId + " from " + currentModel + " to " + modelName);
    modelClient_->switchModel(currentModel, modelName);

    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        entry->session.currentModel = modelName;
        removeModel(entry->session.fallbackModels, modelName);
    }
    utils::Logger::info("Successfully switched to model " + modelName + " for session " + sessionId);
}

diarization::Speaker SessionManager::mergeSpeakers(const std::string& sessionId,
                                                   const std::string& speakerIdA,
                                                   const std::string& speakerIdB) {
    EntryPtr entry = findEntry(sessionId);
    std::lock_guard<std::mutex> processing(entry->processingMutex);

    diarization::Speaker first;
    diarization::Speaker second;
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        requireOpen(*entry);

        if (speakerIdA == speakerIdB) {
            throw utils::DiarizationException("Cannot merge a speaker with itself: " + speakerIdA, sessionId);
        }
        const auto& speakers = entry->session.speakers;
        auto a = std::find_if(speakers.begin(), speakers.end(),
                              [&speakerIdA](const diarization::Speaker& s) { return s.id == speakerIdA; });
        auto b = std::find_if(speakers.begin(), speakers.end(),
                              [&speakerIdB](const diarization::Speaker& s) { return s.id == speakerIdB; });
        if (a == speakers.end() || b == speakers.end()) {
            throw utils::DiarizationException("Unknown speaker in merge request: " +
                                              (a == speakers.end() ? speakerIdA : speakerIdB), sessionId);
        }
        first = *a;
        second = *b;
    }

    diarization::Speaker merged = diarizationEngine_->mergeSpeakers(first, second);

    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        auto& speakers = entry->session.speakers;
        speakers.erase(std::remove_if(speakers.begin(), speakers.end(),
                                      [&](const diarization::Speaker& s) {
                                          return s.id == speakerIdA || s.id == speakerIdB;
                                      }),
                       speakers.end());
        speakers.push_back(merged);

        for (auto& segment : entry->session.segments) {
            if (segment.speakerId == speakerIdA || segment.speakerId == speakerIdB) {
                segment.speakerId = merged.id;
            }
        }
    }

    hub_->broadcast(sessionId, DistributionMessage::speakerUpdate(sessionId, merged));
    utils::Logger::info("Merged speakers " + speakerIdA + " and " + speakerIdB + " into " + merged.id +
                        " for session " + sessionId);
    return merged;
}

diarization::DiarizationResult SessionManager::identifySpeakers(const std::vector<uint8_t>& audioData) {
    return diarizationEngine_->diarize(audioData, defaults_.diarization);
}

std::vector<models::ModelStatus> SessionManager::getModelStatus(const std::optional<std::string>& modelName) const {
    if (!modelName) {
        return modelClient_->getAllModelStatuses();
    }
    std::vector<models::ModelStatus> result;
    auto status = modelClient_->getModelStatus(*modelName);
    if (status) {
        result.push_back(*status);
    }
    return result;
}

std::vector<std::string> SessionManager::listSessions() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool SessionManager::releaseSession(const std::string& sessionId) {
    EntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        entry = it->second;
    }
    {
        std::lock_guard<std::mutex> lock(entry->stateMutex);
        if (!isTerminal(entry->session.status)) {
            return false;
        }
    }
    hub_->closeSession(sessionId);
    evict(sessionId);
    return true;
}

bool SessionManager::waitForInputDrained(const std::string& sessionId, std::chrono::milliseconds timeout) const {
    EntryPtr entry = findEntry(sessionId);
    std::unique_lock<std::mutex> lock(entry->stateMutex);
    return entry->stateChanged.wait_for(lock, timeout, [&entry] { return entry->inputDrained; });
}

void SessionManager::stopConsumer(SessionEntry& entry) {
    entry.stopRequested = true;
    if (entry.stream) {
        entry.stream->close();
    }
    {
        // Wake a consumer waiting on pause
        std::lock_guard<std::mutex> lock(entry.stateMutex);
    }
    entry.stateChanged.notify_all();
}

void SessionManager::evict(const std::string& sessionId) {
    EntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return;
        }
        entry = it->second;
        sessions_.erase(it);
    }
    retire(std::move(entry));
    utils::Logger::debug("Evicted session " + sessionId);
}

void SessionManager::retire(EntryPtr entry) {
    reapRetired();
    if (!entry->consumer.joinable()) {
        return;
    }
    if (entry->consumer.get_id() == std::this_thread::get_id()) {
        entry->consumer.detach();
        return;
    }
    std::lock_guard<std::mutex> lock(registryMutex_);
    retired_.push_back(std::move(entry));
}

void SessionManager::reapRetired() {
    std::vector<EntryPtr> finished;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto split = std::partition(retired_.begin(), retired_.end(),
                                    [](const EntryPtr& e) { return !e->consumerFinished; });
        finished.assign(split, retired_.end());
        retired_.erase(split, retired_.end());
    }
    for (auto& entry : finished) {
        if (entry->consumer.joinable()) {
            entry->consumer.join();
        }
    }
}

} // namespace core
} // namespace meetscribe
