#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace models {

struct InferenceResult {
    std::string text;
    float confidence = 0.0f;
};

struct BackendHealth {
    bool reachable = false;
    std::string detail;
};

/**
 * Speech-to-text inference service boundary
 */
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    /**
     * Transcribe one audio chunk with the named model
     * @param audioData WAV or raw PCM16 bytes
     * @param modelName Model identifier, e.g. "openai/whisper-base"
     * @return Recognized text and confidence in [0, 1]
     * @throws TranscriptionException (or any std::exception) on failure
     */
    virtual InferenceResult transcribe(const std::vector<uint8_t>& audioData,
                                       const std::string& modelName) = 0;

    /**
     * Check that the inference service can be reached
     */
    virtual BackendHealth healthCheck() = 0;

    /**
     * Endpoint the named model is served from, for status reporting
     */
    virtual std::string endpointFor(const std::string& modelName) const = 0;
};

} // namespace models
} // namespace meetscribe
