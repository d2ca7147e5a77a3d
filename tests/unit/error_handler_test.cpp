#include <gtest/gtest.h>
#include "utils/error_handler.hpp"
#include <thread>

using namespace meetscribe::utils;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        ErrorHandler::getInstance().clearErrorHistory();
        ErrorHandler::getInstance().setErrorCallback(nullptr);
        ErrorHandler::getInstance().enableGracefulDegradation(true);
    }
};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorCategory::DISTRIBUTION, ErrorSeverity::ERROR,
                    "Test message", "Test details", "Test context", "session123");

    EXPECT_EQ(error.category, ErrorCategory::DISTRIBUTION);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_EQ(error.session_id, "session123");
    EXPECT_EQ(error.id.rfind("err_", 0), 0u);
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::MODEL, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::MODEL, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, ExceptionMessageIncludesDetails) {
    ErrorInfo error(ErrorCategory::MODEL, ErrorSeverity::ERROR, "Inference failed", "HTTP 503");
    MeetScribeException exception(error);

    EXPECT_STREQ(exception.what(), "Inference failed: HTTP 503");
    EXPECT_EQ(exception.getErrorInfo().category, ErrorCategory::MODEL);
}

TEST_F(ErrorHandlerTest, TranscriptionExceptionCarriesCode) {
    TranscriptionException unavailable(TranscriptionErrorCode::MODEL_UNAVAILABLE, "Model offline",
                                       "openai/whisper-base", "session_1");
    EXPECT_EQ(unavailable.getCode(), TranscriptionErrorCode::MODEL_UNAVAILABLE);
    EXPECT_FALSE(unavailable.isRetryable());
    EXPECT_EQ(unavailable.getModelName(), "openai/whisper-base");
    EXPECT_EQ(unavailable.getErrorInfo().severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(unavailable.getErrorInfo().context, "MODEL_UNAVAILABLE");
    EXPECT_EQ(unavailable.getErrorInfo().session_id, "session_1");

    TranscriptionException network(TranscriptionErrorCode::NETWORK_ERROR, "Connection reset");
    EXPECT_TRUE(network.isRetryable());
    EXPECT_EQ(network.getErrorInfo().severity, ErrorSeverity::ERROR);
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    SessionException session_ex(SessionErrorCode::SESSION_NOT_ACTIVE, "Session is paused", "session_7");
    EXPECT_EQ(session_ex.getCode(), SessionErrorCode::SESSION_NOT_ACTIVE);
    EXPECT_EQ(session_ex.getErrorInfo().category, ErrorCategory::SESSION);
    EXPECT_EQ(session_ex.getErrorInfo().session_id, "session_7");

    AudioProcessingException audio_ex("Bad header", "wav_parser");
    EXPECT_EQ(audio_ex.getErrorInfo().category, ErrorCategory::AUDIO_PROCESSING);
    EXPECT_EQ(audio_ex.getErrorInfo().context, "wav_parser");

    DiarizationException diarization_ex("Unknown speaker");
    EXPECT_EQ(diarization_ex.getErrorInfo().category, ErrorCategory::DIARIZATION);
    EXPECT_EQ(diarization_ex.getErrorInfo().context, "Diarization");

    DistributionException distribution_ex("Send failed", "session_9");
    EXPECT_EQ(distribution_ex.getErrorInfo().category, ErrorCategory::DISTRIBUTION);

    ConfigurationException config_ex("Invalid port", "/etc/meetscribe.json");
    EXPECT_EQ(config_ex.getErrorInfo().category, ErrorCategory::CONFIGURATION);
    EXPECT_EQ(config_ex.getErrorInfo().severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(config_ex.getErrorInfo().details, "/etc/meetscribe.json");
}

TEST_F(ErrorHandlerTest, RetryableCodes) {
    EXPECT_FALSE(isRetryable(TranscriptionErrorCode::MODEL_UNAVAILABLE));
    EXPECT_FALSE(isRetryable(TranscriptionErrorCode::INVALID_AUDIO_FORMAT));
    EXPECT_FALSE(isRetryable(TranscriptionErrorCode::INSUFFICIENT_AUDIO_QUALITY));
    EXPECT_TRUE(isRetryable(TranscriptionErrorCode::NETWORK_ERROR));
    EXPECT_TRUE(isRetryable(TranscriptionErrorCode::RATE_LIMIT_EXCEEDED));
    EXPECT_TRUE(isRetryable(TranscriptionErrorCode::MODEL_TIMEOUT));
    EXPECT_TRUE(isRetryable(TranscriptionErrorCode::UNKNOWN_ERROR));
}

TEST_F(ErrorHandlerTest, ClassifyErrorMessage) {
    EXPECT_EQ(classifyErrorMessage("HTTP 429 Too Many Requests"), TranscriptionErrorCode::RATE_LIMIT_EXCEEDED);
    EXPECT_EQ(classifyErrorMessage("Rate limit reached"), TranscriptionErrorCode::RATE_LIMIT_EXCEEDED);
    EXPECT_EQ(classifyErrorMessage("Network unreachable"), TranscriptionErrorCode::NETWORK_ERROR);
    EXPECT_EQ(classifyErrorMessage("Operation TIMEOUT"), TranscriptionErrorCode::NETWORK_ERROR);
    EXPECT_EQ(classifyErrorMessage("Model is currently loading"), TranscriptionErrorCode::MODEL_UNAVAILABLE);
    EXPECT_EQ(classifyErrorMessage("Unsupported audio container"), TranscriptionErrorCode::INVALID_AUDIO_FORMAT);
    EXPECT_EQ(classifyErrorMessage("something else"), TranscriptionErrorCode::UNKNOWN_ERROR);

    // First match wins
    EXPECT_EQ(classifyErrorMessage("model network timeout"), TranscriptionErrorCode::NETWORK_ERROR);
}

TEST_F(ErrorHandlerTest, ErrorCodeStrings) {
    EXPECT_EQ(errorCodeToString(TranscriptionErrorCode::INSUFFICIENT_AUDIO_QUALITY), "INSUFFICIENT_AUDIO_QUALITY");
    EXPECT_EQ(errorCodeToString(TranscriptionErrorCode::MODEL_TIMEOUT), "MODEL_TIMEOUT");
    EXPECT_EQ(errorCodeToString(SessionErrorCode::SESSION_CLOSED), "SESSION_CLOSED");
}

TEST_F(ErrorHandlerTest, ErrorReporting) {
    auto& handler = ErrorHandler::getInstance();

    ErrorInfo error(ErrorCategory::AUDIO_PROCESSING, ErrorSeverity::WARNING, "Audio buffer overflow");
    handler.reportError(error);

    EXPECT_EQ(handler.getErrorCount(), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::AUDIO_PROCESSING), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::DISTRIBUTION), 0u);
}

TEST_F(ErrorHandlerTest, ErrorCallback) {
    auto& handler = ErrorHandler::getInstance();

    bool callback_called = false;
    ErrorInfo received_error(ErrorCategory::UNKNOWN, ErrorSeverity::INFO, "");

    handler.setErrorCallback([&](const ErrorInfo& error) {
        callback_called = true;
        received_error = error;
    });

    handler.reportError(ErrorInfo(ErrorCategory::POST_PROCESSING, ErrorSeverity::ERROR, "Handler failed"));

    EXPECT_TRUE(callback_called);
    EXPECT_EQ(received_error.category, ErrorCategory::POST_PROCESSING);
    EXPECT_EQ(received_error.message, "Handler failed");
}

TEST_F(ErrorHandlerTest, ThrowingCallbackDoesNotEscape) {
    auto& handler = ErrorHandler::getInstance();
    handler.setErrorCallback([](const ErrorInfo&) {
        throw std::runtime_error("callback broke");
    });

    EXPECT_NO_THROW(handler.reportError(ErrorInfo(ErrorCategory::SYSTEM, ErrorSeverity::WARNING, "x")));
    EXPECT_EQ(handler.getErrorCount(), 1u);
}

TEST_F(ErrorHandlerTest, ErrorHistory) {
    auto& handler = ErrorHandler::getInstance();

    for (int i = 0; i < 5; ++i) {
        handler.reportError(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::INFO,
                                      "Error " + std::to_string(i)));
    }

    EXPECT_EQ(handler.getErrorCount(), 5u);

    auto recent_errors = handler.getRecentErrors(3);
    ASSERT_EQ(recent_errors.size(), 3u);
    EXPECT_EQ(recent_errors[2].message, "Error 4");

    handler.clearErrorHistory();
    EXPECT_EQ(handler.getErrorCount(), 0u);
}

TEST_F(ErrorHandlerTest, RecoveryActions) {
    auto& handler = ErrorHandler::getInstance();

    bool recovery_called = false;
    handler.addRecoveryAction(ErrorCategory::DISTRIBUTION, [&]() -> bool {
        recovery_called = true;
        return true;
    });

    ErrorInfo error(ErrorCategory::DISTRIBUTION, ErrorSeverity::ERROR, "Subscriber lost");
    EXPECT_TRUE(handler.attemptRecovery(error));
    EXPECT_TRUE(recovery_called);

    handler.addRecoveryAction(ErrorCategory::DISTRIBUTION, []() -> bool { return false; });
    EXPECT_FALSE(handler.attemptRecovery(error));
}

TEST_F(ErrorHandlerTest, NoRecoveryAction) {
    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, "Unknown error");
    EXPECT_FALSE(ErrorHandler::getInstance().attemptRecovery(error));
}

TEST_F(ErrorHandlerTest, GracefulDegradation) {
    auto& handler = ErrorHandler::getInstance();

    EXPECT_TRUE(handler.isGracefulDegradationEnabled());

    handler.enableGracefulDegradation(false);
    EXPECT_FALSE(handler.isGracefulDegradationEnabled());

    handler.enableGracefulDegradation(true);
    EXPECT_TRUE(handler.isGracefulDegradationEnabled());
}

TEST_F(ErrorHandlerTest, ExceptionReportingKeepsCategory) {
    auto& handler = ErrorHandler::getInstance();

    TranscriptionException exception(TranscriptionErrorCode::MODEL_TIMEOUT, "Call timed out");
    handler.reportError(exception, "chunk_processing", "session456");

    EXPECT_EQ(handler.getErrorCount(ErrorCategory::MODEL), 1u);

    auto recent_errors = handler.getRecentErrors(1);
    ASSERT_EQ(recent_errors.size(), 1u);
    EXPECT_EQ(recent_errors[0].context, "chunk_processing");
    EXPECT_EQ(recent_errors[0].session_id, "session456");
}

TEST_F(ErrorHandlerTest, ErrorHandlingMacros) {
    auto& handler = ErrorHandler::getInstance();

    ErrorInfo received(ErrorCategory::UNKNOWN, ErrorSeverity::INFO, "");
    handler.setErrorCallback([&](const ErrorInfo& error) { received = error; });

    {
        ErrorContext ctx("macro_context", "session_macro");
        MEETSCRIBE_HANDLE_ERROR(ErrorCategory::SESSION, ErrorSeverity::WARNING,
                                "Test macro error", "Additional details");
    }

    EXPECT_EQ(received.category, ErrorCategory::SESSION);
    EXPECT_EQ(received.severity, ErrorSeverity::WARNING);
    EXPECT_EQ(received.message, "Test macro error");
    EXPECT_EQ(received.details, "Additional details");
    EXPECT_EQ(received.context, "macro_context");
    EXPECT_EQ(received.session_id, "session_macro");

    auto failing = []() { throw std::runtime_error("boom"); };
    EXPECT_THROW({
        MEETSCRIBE_TRY_WITH_ERROR_HANDLING(failing(), ErrorCategory::SYSTEM, "Operation failed");
    }, std::runtime_error);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::SYSTEM), 1u);
}

class ErrorContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
        EXPECT_TRUE(ErrorContext::getCurrentSessionId().empty());
    }
};

TEST_F(ErrorContextTest, NestedContexts) {
    {
        ErrorContext ctx1("outer_context", "session123");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");

        {
            ErrorContext ctx2("inner_context");
            EXPECT_EQ(ErrorContext::getCurrentContext(), "inner_context");
            EXPECT_EQ(ErrorContext::getCurrentSessionId(), "session123");
        }

        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");
    }

    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
    EXPECT_TRUE(ErrorContext::getCurrentSessionId().empty());
}

TEST_F(ErrorContextTest, ThreadLocalStorage) {
    std::string thread_context = "unset";

    ErrorContext ctx("main_context");
    std::thread t([&]() {
        thread_context = ErrorContext::getCurrentContext();
    });
    t.join();

    EXPECT_EQ(ErrorContext::getCurrentContext(), "main_context");
    EXPECT_TRUE(thread_context.empty());
}
