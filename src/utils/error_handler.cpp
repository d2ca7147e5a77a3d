#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <cctype>

namespace meetscribe {
namespace utils {

// Thread-local storage for error context
thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

std::string errorCodeToString(TranscriptionErrorCode code) {
    switch (code) {
        case TranscriptionErrorCode::MODEL_UNAVAILABLE: return "MODEL_UNAVAILABLE";
        case TranscriptionErrorCode::AUDIO_PROCESSING_FAILED: return "AUDIO_PROCESSING_FAILED";
        case TranscriptionErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
        case TranscriptionErrorCode::RATE_LIMIT_EXCEEDED: return "RATE_LIMIT_EXCEEDED";
        case TranscriptionErrorCode::INVALID_AUDIO_FORMAT: return "INVALID_AUDIO_FORMAT";
        case TranscriptionErrorCode::SPEAKER_DIARIZATION_FAILED: return "SPEAKER_DIARIZATION_FAILED";
        case TranscriptionErrorCode::WEBSOCKET_CONNECTION_LOST: return "WEBSOCKET_CONNECTION_LOST";
        case TranscriptionErrorCode::INSUFFICIENT_AUDIO_QUALITY: return "INSUFFICIENT_AUDIO_QUALITY";
        case TranscriptionErrorCode::MODEL_TIMEOUT: return "MODEL_TIMEOUT";
        case TranscriptionErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

std::string errorCodeToString(SessionErrorCode code) {
    switch (code) {
        case SessionErrorCode::SESSION_NOT_FOUND: return "SESSION_NOT_FOUND";
        case SessionErrorCode::SESSION_NOT_ACTIVE: return "SESSION_NOT_ACTIVE";
        case SessionErrorCode::SESSION_CLOSED: return "SESSION_CLOSED";
        case SessionErrorCode::INVALID_STATE: return "INVALID_STATE";
    }
    return "INVALID_STATE";
}

bool isRetryable(TranscriptionErrorCode code) {
    switch (code) {
        case TranscriptionErrorCode::MODEL_UNAVAILABLE:
        case TranscriptionErrorCode::INVALID_AUDIO_FORMAT:
        case TranscriptionErrorCode::INSUFFICIENT_AUDIO_QUALITY:
            return false;
        default:
            return true;
    }
}

TranscriptionErrorCode classifyErrorMessage(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto contains = [&lower](const char* needle) {
        return lower.find(needle) != std::string::npos;
    };

    if (contains("rate limit") || contains("429")) {
        return TranscriptionErrorCode::RATE_LIMIT_EXCEEDED;
    }
    if (contains("network") || contains("timeout")) {
        return TranscriptionErrorCode::NETWORK_ERROR;
    }
    if (contains("model") || contains("unavailable")) {
        return TranscriptionErrorCode::MODEL_UNAVAILABLE;
    }
    if (contains("audio") || contains("format")) {
        return TranscriptionErrorCode::INVALID_AUDIO_FORMAT;
    }
    return TranscriptionErrorCode::UNKNOWN_ERROR;
}

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// MeetScribeException implementation
MeetScribeException::MeetScribeException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* MeetScribeException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

// Specific exception implementations
TranscriptionException::TranscriptionException(TranscriptionErrorCode code, const std::string& message,
                                               const std::string& model_name, const std::string& session_id)
    : MeetScribeException(ErrorInfo(ErrorCategory::MODEL,
                                    code == TranscriptionErrorCode::MODEL_UNAVAILABLE ? ErrorSeverity::CRITICAL
                                                                                      : ErrorSeverity::ERROR,
                                    message, "", errorCodeToString(code), session_id)),
      code_(code), retryable_(utils::isRetryable(code)), model_name_(model_name) {
}

SessionException::SessionException(SessionErrorCode code, const std::string& message, const std::string& session_id)
    : MeetScribeException(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::ERROR,
                                    message, "", errorCodeToString(code), session_id)),
      code_(code) {
}

AudioProcessingException::AudioProcessingException(const std::string& message, const std::string& context)
    : MeetScribeException(ErrorInfo(ErrorCategory::AUDIO_PROCESSING, ErrorSeverity::ERROR,
                                    message, "", context.empty() ? "AudioProcessing" : context)) {
}

DiarizationException::DiarizationException(const std::string& message, const std::string& context)
    : MeetScribeException(ErrorInfo(ErrorCategory::DIARIZATION, ErrorSeverity::WARNING,
                                    message, "", context.empty() ? "Diarization" : context)) {
}

DistributionException::DistributionException(const std::string& message, const std::string& session_id)
    : MeetScribeException(ErrorInfo(ErrorCategory::DISTRIBUTION, ErrorSeverity::WARNING,
                                    message, "", "Distribution", session_id)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& path)
    : MeetScribeException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL,
                                    message, path, "Configuration")) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    bool try_recovery = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }

        callback = error_callback_;
        try_recovery = error.severity != ErrorSeverity::CRITICAL && graceful_degradation_enabled_;
    }

    // Callbacks and recovery run unlocked so they may report errors themselves
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }

    if (try_recovery) {
        attemptRecovery(error);
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    ErrorCategory category = ErrorCategory::UNKNOWN;
    ErrorSeverity severity = ErrorSeverity::ERROR;
    std::string effective_session = session_id;

    if (auto* known = dynamic_cast<const MeetScribeException*>(&e)) {
        category = known->getErrorInfo().category;
        severity = known->getErrorInfo().severity;
        if (effective_session.empty()) {
            effective_session = known->getErrorInfo().session_id;
        }
    }

    ErrorInfo error(category, severity, e.what(), "", context, effective_session);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = callback;
}

void ErrorHandler::addRecoveryAction(ErrorCategory category, RecoveryAction action) {
    std::lock_guard<std::mutex> lock(mutex_);
    recovery_actions_[category] = action;
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                         [category](const ErrorInfo& error) {
                             return error.category == category;
                         });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

bool ErrorHandler::attemptRecovery(const ErrorInfo& error) {
    RecoveryAction action;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = recovery_actions_.find(error.category);
        if (it == recovery_actions_.end()) {
            return false;
        }
        action = it->second;
    }

    try {
        Logger::info("Attempting recovery for error: " + error.message);
        bool success = action();
        if (success) {
            Logger::info("Recovery successful for error: " + error.id);
        } else {
            Logger::warn("Recovery failed for error: " + error.id);
        }
        return success;
    } catch (const std::exception& e) {
        Logger::error("Exception during recovery: " + std::string(e.what()));
        return false;
    }
}

void ErrorHandler::enableGracefulDegradation(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    graceful_degradation_enabled_ = enable;
}

bool ErrorHandler::isGracefulDegradationEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graceful_degradation_enabled_;
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::string category_str;
    switch (error.category) {
        case ErrorCategory::AUDIO_PROCESSING: category_str = "Audio"; break;
        case ErrorCategory::DIARIZATION: category_str = "Diarization"; break;
        case ErrorCategory::MODEL: category_str = "Model"; break;
        case ErrorCategory::SESSION: category_str = "Session"; break;
        case ErrorCategory::DISTRIBUTION: category_str = "Distribution"; break;
        case ErrorCategory::POST_PROCESSING: category_str = "PostProcessing"; break;
        case ErrorCategory::CONFIGURATION: category_str = "Configuration"; break;
        case ErrorCategory::SYSTEM: category_str = "System"; break;
        case ErrorCategory::UNKNOWN: category_str = "Unknown"; break;
    }

    std::stringstream log_message;
    log_message << "[" << error.id << "] " << category_str << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

// ErrorContext implementation
ErrorContext::ErrorContext(const std::string& context, const std::string& session_id)
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

void ErrorContext::setContext(const std::string& context) {
    current_context_ = context;
}

void ErrorContext::setSessionId(const std::string& session_id) {
    current_session_id_ = session_id;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace meetscribe
