#pragma once

#include "core/transcription_types.hpp"
#include <string>

namespace meetscribe {
namespace core {

/**
 * Receives session lifecycle events.
 *
 * Called synchronously on the thread that performed the transition
 * (the session's consumer thread for segments). Implementations must not
 * call back into the SessionManager for the same session and should
 * return quickly.
 */
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onSessionStarted(const Session& session) = 0;
    virtual void onSegmentProcessed(const std::string& sessionId, const TranscriptSegment& segment) = 0;
    virtual void onSessionCompleted(const FullTranscript& transcript) = 0;
    virtual void onSessionCancelled(const std::string& sessionId) = 0;
    virtual void onSessionError(const std::string& sessionId, const TranscriptionError& error) = 0;
};

} // namespace core
} // namespace meetscribe
