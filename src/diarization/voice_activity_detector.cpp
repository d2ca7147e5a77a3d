#include "diarization/voice_activity_detector.hpp"
#include <algorithm>

namespace meetscribe {
namespace diarization {

VoiceActivityDetector::VoiceActivityDetector(float energyThreshold, double frameSeconds,
                                             double hopSeconds, double minSegmentSeconds)
    : energyThreshold_(energyThreshold), frameSeconds_(frameSeconds),
      hopSeconds_(hopSeconds), minSegmentSeconds_(minSegmentSeconds) {
}

float VoiceActivityDetector::frameEnergy(const float* frame, size_t length) {
    if (length == 0) {
        return 0.0f;
    }
    double energy = 0.0;
    for (size_t i = 0; i < length; ++i) {
        energy += static_cast<double>(frame[i]) * frame[i];
    }
    return static_cast<float>(energy / length);
}

std::vector<VoiceSegment> VoiceActivityDetector::detect(const std::vector<float>& samples,
                                                        int sampleRate) const {
    std::vector<VoiceSegment> segments;
    if (sampleRate <= 0) {
        return segments;
    }

    const size_t frameSize = std::max<size_t>(1, static_cast<size_t>(sampleRate * frameSeconds_));
    const size_t hopSize = std::max<size_t>(1, static_cast<size_t>(sampleRate * hopSeconds_));

    auto emit = [&](size_t start, size_t end) {
        double duration = static_cast<double>(end - start) / sampleRate;
        if (duration >= minSegmentSeconds_) {
            VoiceSegment segment;
            segment.startSample = start;
            segment.endSample = end;
            segment.startTime = static_cast<double>(start) / sampleRate;
            segment.endTime = static_cast<double>(end) / sampleRate;
            segments.push_back(segment);
        }
    };

    bool inVoice = false;
    size_t segmentStart = 0;

    for (size_t i = 0; i + frameSize < samples.size(); i += hopSize) {
        float energy = frameEnergy(samples.data() + i, frameSize);

        if (energy > energyThreshold_ && !inVoice) {
            inVoice = true;
            segmentStart = i;
        } else if (energy <= energyThreshold_ && inVoice) {
            inVoice = false;
            emit(segmentStart, i);
        }
    }

    if (inVoice) {
        emit(segmentStart, samples.size());
    }

    return segments;
}

} // namespace diarization
} // namespace meetscribe
