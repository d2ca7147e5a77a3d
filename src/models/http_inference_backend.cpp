#include "models/http_inference_backend.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>

namespace meetscribe {
namespace models {

namespace {

// Callback for libcurl to write response data
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HttpResponse perform(CURL* curl, const std::string& url) {
    HttpResponse response;

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT) {
            response.timed_out = true;
            response.error = "Network timeout contacting " + url;
        } else if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
            response.error = "Network error: cannot connect to " + url;
        } else {
            response.error = std::string("Network error: ") + curl_easy_strerror(res);
        }
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.success = response.status_code >= 200 && response.status_code < 300;
    if (!response.success) {
        response.error = "HTTP " + std::to_string(response.status_code);
    }
    return response;
}

} // namespace

HttpInferenceBackend::HttpInferenceBackend(const HttpBackendConfig& config)
    : config_(config) {
    if (config_.endpoint.empty()) {
        throw utils::ConfigurationException("Inference endpoint must not be empty");
    }
    if (config_.endpoint.back() != '/') {
        config_.endpoint += '/';
    }
    if (config_.apiKey.empty()) {
        utils::Logger::warn("No inference API key configured, requests are sent unauthenticated");
    }
}

std::string HttpInferenceBackend::endpointFor(const std::string& modelName) const {
    return config_.endpoint + modelName;
}

InferenceResult HttpInferenceBackend::transcribe(const std::vector<uint8_t>& audioData,
                                                 const std::string& modelName) {
    std::vector<uint8_t> body;
    if (audio::AudioUtils::isWav(audioData)) {
        body = audioData;
    } else {
        body = audio::AudioUtils::encodeWav(
            audio::AudioUtils::pcm16ToFloat(audioData.data(), audioData.size()), config_.rawFormat);
    }

    HttpResponse response = post(endpointFor(modelName), body);
    return parseResponse(response, modelName);
}

BackendHealth HttpInferenceBackend::healthCheck() {
    BackendHealth health;
    HttpResponse response = get(config_.endpoint);
    // Any HTTP answer means the service is reachable
    health.reachable = response.status_code != 0;
    health.detail = health.reachable ? "HTTP " + std::to_string(response.status_code) : response.error;
    return health;
}

InferenceResult HttpInferenceBackend::parseResponse(const HttpResponse& response, const std::string& modelName) {
    using utils::TranscriptionErrorCode;
    using utils::TranscriptionException;

    if (response.status_code == 0) {
        throw TranscriptionException(TranscriptionErrorCode::NETWORK_ERROR,
                                     response.error.empty() ? "Network error" : response.error, modelName);
    }

    if (!response.success) {
        std::string detail = response.error;
        if (!response.body.empty()) {
            detail += " - " + response.body.substr(0, 512);
        }

        switch (response.status_code) {
            case 429:
                throw TranscriptionException(TranscriptionErrorCode::RATE_LIMIT_EXCEEDED,
                                             "Inference rate limit exceeded: " + detail, modelName);
            case 503:
                throw TranscriptionException(TranscriptionErrorCode::MODEL_UNAVAILABLE,
                                             "Model " + modelName + " unavailable (loading): " + detail, modelName);
            case 404:
                throw TranscriptionException(TranscriptionErrorCode::MODEL_UNAVAILABLE,
                                             "Model " + modelName + " not found: " + detail, modelName);
            case 400:
            case 415:
                throw TranscriptionException(TranscriptionErrorCode::INVALID_AUDIO_FORMAT,
                                             "Audio rejected by inference service: " + detail, modelName);
            default:
                if (response.status_code >= 500) {
                    throw TranscriptionException(TranscriptionErrorCode::NETWORK_ERROR,
                                                 "Inference service error: " + detail, modelName);
                }
                throw TranscriptionException(utils::classifyErrorMessage(detail),
                                             "Inference request failed: " + detail, modelName);
        }
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TranscriptionException(TranscriptionErrorCode::UNKNOWN_ERROR,
                                     std::string("Malformed inference response: ") + e.what(), modelName);
    }

    // Some deployments wrap the result in a one-element array
    if (j.is_array() && !j.empty()) {
        j = j.front();
    }
    if (!j.is_object()) {
        throw TranscriptionException(TranscriptionErrorCode::UNKNOWN_ERROR,
                                     "Unexpected inference response shape", modelName);
    }
    if (j.contains("error")) {
        std::string message = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
        throw TranscriptionException(utils::classifyErrorMessage(message), message, modelName);
    }

    InferenceResult result;
    result.text = j.value("text", std::string());
    result.confidence = std::max(0.0f, std::min(1.0f, j.value("confidence", 0.9f)));
    return result;
}

HttpResponse HttpInferenceBackend::post(const std::string& url, const std::vector<uint8_t>& body) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        HttpResponse response;
        response.error = "Failed to initialize HTTP client";
        return response;
    }

    std::string response_body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(body.data()));
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: audio/wav");
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    if (!config_.apiKey.empty()) {
        std::string auth = "Authorization: Bearer " + config_.apiKey;
        raw_headers = curl_slist_append(raw_headers, auth.c_str());
    }
    HeaderList headers(raw_headers);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);

    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeoutMs));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connectTimeoutMs));

    // Required for multi-threaded environments - don't use signals for timeout
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

    HttpResponse response = perform(curl.get(), url);
    response.body = std::move(response_body);

    utils::Logger::debug("POST " + url + " -> " + std::to_string(response.status_code));
    return response;
}

HttpResponse HttpInferenceBackend::get(const std::string& url) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        HttpResponse response;
        response.error = "Failed to initialize HTTP client";
        return response;
    }

    std::string response_body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.connectTimeoutMs));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connectTimeoutMs));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    HttpResponse response = perform(curl.get(), url);
    response.body = std::move(response_body);
    return response;
}

} // namespace models
} // namespace meetscribe
