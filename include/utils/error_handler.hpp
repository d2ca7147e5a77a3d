#pragma once

#include <string>
#include <exception>
#include <memory>
#include <functional>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace meetscribe {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per engine component
 */
enum class ErrorCategory {
    AUDIO_PROCESSING,
    DIARIZATION,
    MODEL,
    SESSION,
    DISTRIBUTION,
    POST_PROCESSING,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

/**
 * Failure kinds surfaced by the transcription pipeline
 */
enum class TranscriptionErrorCode {
    MODEL_UNAVAILABLE,
    AUDIO_PROCESSING_FAILED,
    NETWORK_ERROR,
    RATE_LIMIT_EXCEEDED,
    INVALID_AUDIO_FORMAT,
    SPEAKER_DIARIZATION_FAILED,
    WEBSOCKET_CONNECTION_LOST,
    INSUFFICIENT_AUDIO_QUALITY,
    MODEL_TIMEOUT,
    UNKNOWN_ERROR
};

/**
 * Session lifecycle violations
 */
enum class SessionErrorCode {
    SESSION_NOT_FOUND,
    SESSION_NOT_ACTIVE,
    SESSION_CLOSED,
    INVALID_STATE
};

std::string errorCodeToString(TranscriptionErrorCode code);
std::string errorCodeToString(SessionErrorCode code);
bool isRetryable(TranscriptionErrorCode code);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base exception for every engine failure
 */
class MeetScribeException : public std::exception {
public:
    explicit MeetScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

/**
 * Model-call and pipeline failures, carrying the error code that drives
 * fallback decisions
 */
class TranscriptionException : public MeetScribeException {
public:
    TranscriptionException(TranscriptionErrorCode code, const std::string& message,
                           const std::string& model_name = "", const std::string& session_id = "");

    TranscriptionErrorCode getCode() const { return code_; }
    bool isRetryable() const { return retryable_; }
    const std::string& getModelName() const { return model_name_; }

private:
    TranscriptionErrorCode code_;
    bool retryable_;
    std::string model_name_;
};

class SessionException : public MeetScribeException {
public:
    SessionException(SessionErrorCode code, const std::string& message, const std::string& session_id = "");

    SessionErrorCode getCode() const { return code_; }

private:
    SessionErrorCode code_;
};

class AudioProcessingException : public MeetScribeException {
public:
    AudioProcessingException(const std::string& message, const std::string& context = "");
};

class DiarizationException : public MeetScribeException {
public:
    DiarizationException(const std::string& message, const std::string& context = "");
};

class DistributionException : public MeetScribeException {
public:
    DistributionException(const std::string& message, const std::string& session_id = "");
};

class ConfigurationException : public MeetScribeException {
public:
    ConfigurationException(const std::string& message, const std::string& path = "");
};

/**
 * Classify an arbitrary failure message into a transcription error code.
 * First match wins: rate limit, network, model, audio format.
 */
TranscriptionErrorCode classifyErrorMessage(const std::string& message);

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Recovery action callback type
 */
using RecoveryAction = std::function<bool()>;

/**
 * Central error handler for the application
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    // Error callbacks
    void setErrorCallback(ErrorCallback callback);
    void addRecoveryAction(ErrorCategory category, RecoveryAction action);

    // Error statistics
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    // Recovery mechanisms
    bool attemptRecovery(const ErrorInfo& error);

    // Graceful degradation
    void enableGracefulDegradation(bool enable);
    bool isGracefulDegradationEnabled() const;

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::map<ErrorCategory, RecoveryAction> recovery_actions_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;
    bool graceful_degradation_enabled_ = true;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();

    void setContext(const std::string& context);
    void setSessionId(const std::string& session_id);

    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

/**
 * Utility macros for error handling
 */
#define MEETSCRIBE_HANDLE_ERROR(category, severity, message, details) \
    do { \
        ::meetscribe::utils::ErrorInfo error_(category, severity, message, details, \
                       ::meetscribe::utils::ErrorContext::getCurrentContext(), \
                       ::meetscribe::utils::ErrorContext::getCurrentSessionId()); \
        ::meetscribe::utils::ErrorHandler::getInstance().reportError(error_); \
    } while(0)

#define MEETSCRIBE_HANDLE_EXCEPTION(e, context) \
    ::meetscribe::utils::ErrorHandler::getInstance().reportError(e, context, \
        ::meetscribe::utils::ErrorContext::getCurrentSessionId())

#define MEETSCRIBE_TRY_WITH_ERROR_HANDLING(operation, category, error_message) \
    try { \
        operation; \
    } catch (const std::exception& e) { \
        MEETSCRIBE_HANDLE_ERROR(category, ::meetscribe::utils::ErrorSeverity::ERROR, error_message, e.what()); \
        throw; \
    }

} // namespace utils
} // namespace meetscribe
