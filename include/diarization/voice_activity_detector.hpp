#pragma once

#include <cstddef>
#include <vector>

namespace meetscribe {
namespace diarization {

struct VoiceSegment {
    size_t startSample = 0;
    size_t endSample = 0;
    double startTime = 0.0;   // seconds
    double endTime = 0.0;

    double duration() const { return endTime - startTime; }
};

/**
 * Energy-based voice activity detector.
 *
 * Mean frame energy above the threshold opens a segment, a frame at or below
 * it closes the segment. Segments shorter than the minimum are dropped; a
 * segment still open at the end of input is kept if long enough.
 */
class VoiceActivityDetector {
public:
    VoiceActivityDetector(float energyThreshold = 0.01f,
                          double frameSeconds = 0.025,
                          double hopSeconds = 0.010,
                          double minSegmentSeconds = 0.5);

    std::vector<VoiceSegment> detect(const std::vector<float>& samples, int sampleRate) const;

    static float frameEnergy(const float* frame, size_t length);

    float getEnergyThreshold() const { return energyThreshold_; }

private:
    float energyThreshold_;
    double frameSeconds_;
    double hopSeconds_;
    double minSegmentSeconds_;
};

} // namespace diarization
} // namespace meetscribe
