#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {
namespace audio {

// Sample format of a PCM stream
struct AudioFormat {
  int sampleRate = 16000;
  int channels = 1;
  int bitDepth = 16;

  AudioFormat() = default;
  AudioFormat(int sr, int ch, int bits = 16)
      : sampleRate(sr), channels(ch), bitDepth(bits) {}

  bool isValid() const;
  size_t bytesPerSecond() const;
  std::string toString() const;
};

// Interleaved float samples in [-1, 1] together with their format
struct DecodedAudio {
  std::vector<float> samples;
  AudioFormat format;
  bool wavContainer = false;

  size_t frameCount() const;
  double durationSeconds() const;
};

class AudioUtils {
public:
  // Container handling
  static bool isWav(const std::vector<uint8_t> &bytes);

  /**
   * Decode a chunk into float samples.
   * RIFF/WAVE input is parsed (16-bit PCM only); anything else is treated as
   * raw little-endian PCM16 in the given format.
   * @throws AudioProcessingException on malformed or unsupported WAV data
   */
  static DecodedAudio decode(const std::vector<uint8_t> &bytes,
                             const AudioFormat &rawFormat);

  static std::vector<uint8_t> encodeWav(const std::vector<float> &samples,
                                        const AudioFormat &format);
  static std::vector<uint8_t> encodePcm16(const std::vector<float> &samples);

  // Sample conversion
  static std::vector<float> pcm16ToFloat(const uint8_t *data, size_t size);
  static int16_t floatToPcm16(float sample);

  // Linear-interpolation resampling of mono or interleaved audio
  static std::vector<float> resample(const std::vector<float> &input,
                                     int channels, int inputRate,
                                     int outputRate);

  // Fold interleaved audio to the target channel count (averaging down,
  // duplicating up)
  static std::vector<float> convertChannels(const std::vector<float> &input,
                                            int fromChannels, int toChannels);

  static float rms(const std::vector<float> &samples);
  static float peak(const std::vector<float> &samples);

  // bytes / (sampleRate * channels * bitDepth / 8) * 1000
  static double estimateDurationMs(size_t byteCount, const AudioFormat &format);
};

} // namespace audio
} // namespace meetscribe
