#pragma once

#include "audio/audio_utils.hpp"
#include "models/inference_backend.hpp"
#include <string>

namespace meetscribe {
namespace models {

struct HttpBackendConfig {
    std::string endpoint = "https://api-inference.huggingface.co/models/";
    std::string apiKey;
    int timeoutMs = 30000;
    int connectTimeoutMs = 5000;
    // Format used to wrap raw PCM chunks into WAV before upload
    audio::AudioFormat rawFormat;
};

struct HttpResponse {
    bool success = false;
    long status_code = 0;
    std::string body;
    std::string error;
    bool timed_out = false;
};

/**
 * Inference backend for Hugging Face style HTTP endpoints.
 * Audio is POSTed as WAV to <endpoint><model>; the JSON reply carries "text".
 */
class HttpInferenceBackend : public InferenceBackend {
public:
    explicit HttpInferenceBackend(const HttpBackendConfig& config);
    ~HttpInferenceBackend() override = default;

    InferenceResult transcribe(const std::vector<uint8_t>& audioData,
                               const std::string& modelName) override;
    BackendHealth healthCheck() override;
    std::string endpointFor(const std::string& modelName) const override;

    /**
     * Map an HTTP reply to a result, throwing TranscriptionException for
     * failure statuses and malformed bodies
     */
    static InferenceResult parseResponse(const HttpResponse& response, const std::string& modelName);

private:
    HttpResponse post(const std::string& url, const std::vector<uint8_t>& body) const;
    HttpResponse get(const std::string& url) const;

    HttpBackendConfig config_;
};

} // namespace models
} // namespace meetscribe
