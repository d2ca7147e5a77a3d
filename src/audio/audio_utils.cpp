#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <sstream>

namespace meetscribe {
namespace audio {

namespace {

constexpr size_t WAV_HEADER_SIZE = 44;

uint16_t readLe16(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLe32(const uint8_t *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

void writeLe16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void writeLe32(std::vector<uint8_t> &out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void writeTag(std::vector<uint8_t> &out, const char *tag) {
  out.insert(out.end(), tag, tag + 4);
}

} // namespace

// AudioFormat implementation
bool AudioFormat::isValid() const {
  return sampleRate > 0 && channels > 0 && bitDepth > 0 && bitDepth % 8 == 0;
}

size_t AudioFormat::bytesPerSecond() const {
  return static_cast<size_t>(sampleRate) * channels * (bitDepth / 8);
}

std::string AudioFormat::toString() const {
  std::stringstream ss;
  ss << sampleRate << "Hz, " << channels << " channel(s), " << bitDepth
     << "-bit";
  return ss.str();
}

// DecodedAudio implementation
size_t DecodedAudio::frameCount() const {
  return format.channels > 0 ? samples.size() / format.channels : 0;
}

double DecodedAudio::durationSeconds() const {
  return format.sampleRate > 0
             ? static_cast<double>(frameCount()) / format.sampleRate
             : 0.0;
}

// AudioUtils implementation
bool AudioUtils::isWav(const std::vector<uint8_t> &bytes) {
  return bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
         std::memcmp(bytes.data() + 8, "WAVE", 4) == 0;
}

DecodedAudio AudioUtils::decode(const std::vector<uint8_t> &bytes,
                                const AudioFormat &rawFormat) {
  DecodedAudio result;

  if (!isWav(bytes)) {
    result.format = rawFormat;
    result.format.bitDepth = 16;
    result.samples = pcm16ToFloat(bytes.data(), bytes.size());
    return result;
  }

  // Walk the RIFF chunks looking for "fmt " and "data"
  size_t pos = 12;
  bool haveFormat = false;
  while (pos + 8 <= bytes.size()) {
    const uint8_t *chunk = bytes.data() + pos;
    uint32_t chunkSize = readLe32(chunk + 4);
    size_t body = pos + 8;

    if (std::memcmp(chunk, "fmt ", 4) == 0) {
      if (chunkSize < 16 || body + 16 > bytes.size()) {
        throw utils::AudioProcessingException("Truncated WAV format chunk",
                                              "AudioUtils::decode");
      }
      uint16_t audioFormat = readLe16(bytes.data() + body);
      result.format.channels = readLe16(bytes.data() + body + 2);
      result.format.sampleRate = static_cast<int>(readLe32(bytes.data() + body + 4));
      result.format.bitDepth = readLe16(bytes.data() + body + 14);
      if (audioFormat != 1 || result.format.bitDepth != 16) {
        throw utils::AudioProcessingException(
            "Unsupported WAV encoding, only 16-bit PCM is accepted",
            "AudioUtils::decode");
      }
      if (!result.format.isValid()) {
        throw utils::AudioProcessingException("Invalid WAV format header",
                                              "AudioUtils::decode");
      }
      haveFormat = true;
    } else if (std::memcmp(chunk, "data", 4) == 0) {
      if (!haveFormat) {
        throw utils::AudioProcessingException("WAV data chunk precedes format chunk",
                                              "AudioUtils::decode");
      }
      size_t available = std::min<size_t>(chunkSize, bytes.size() - body);
      result.samples = pcm16ToFloat(bytes.data() + body, available);
      result.wavContainer = true;
      return result;
    }

    // Chunks are padded to even sizes
    pos = body + chunkSize + (chunkSize & 1);
  }

  throw utils::AudioProcessingException("WAV container has no data chunk",
                                        "AudioUtils::decode");
}

std::vector<uint8_t> AudioUtils::encodeWav(const std::vector<float> &samples,
                                           const AudioFormat &format) {
  const uint32_t dataSize = static_cast<uint32_t>(samples.size() * 2);
  const uint16_t blockAlign = static_cast<uint16_t>(format.channels * 2);

  std::vector<uint8_t> out;
  out.reserve(WAV_HEADER_SIZE + dataSize);

  writeTag(out, "RIFF");
  writeLe32(out, 36 + dataSize);
  writeTag(out, "WAVE");
  writeTag(out, "fmt ");
  writeLe32(out, 16);
  writeLe16(out, 1); // PCM
  writeLe16(out, static_cast<uint16_t>(format.channels));
  writeLe32(out, static_cast<uint32_t>(format.sampleRate));
  writeLe32(out, static_cast<uint32_t>(format.sampleRate) * blockAlign);
  writeLe16(out, blockAlign);
  writeLe16(out, 16);
  writeTag(out, "data");
  writeLe32(out, dataSize);

  std::vector<uint8_t> pcm = encodePcm16(samples);
  out.insert(out.end(), pcm.begin(), pcm.end());
  return out;
}

std::vector<uint8_t> AudioUtils::encodePcm16(const std::vector<float> &samples) {
  std::vector<uint8_t> out;
  out.reserve(samples.size() * 2);
  for (float s : samples) {
    writeLe16(out, static_cast<uint16_t>(floatToPcm16(s)));
  }
  return out;
}

std::vector<float> AudioUtils::pcm16ToFloat(const uint8_t *data, size_t size) {
  std::vector<float> samples;
  samples.reserve(size / 2);
  for (size_t i = 0; i + 1 < size; i += 2) {
    int16_t value = static_cast<int16_t>(readLe16(data + i));
    samples.push_back(static_cast<float>(value) / 32768.0f);
  }
  return samples;
}

int16_t AudioUtils::floatToPcm16(float sample) {
  float clamped = std::max(-1.0f, std::min(1.0f, sample));
  return static_cast<int16_t>(clamped * 32767.0f);
}

std::vector<float> AudioUtils::resample(const std::vector<float> &input,
                                        int channels, int inputRate,
                                        int outputRate) {
  if (inputRate == outputRate || input.empty() || channels <= 0) {
    return input;
  }

  const size_t inFrames = input.size() / channels;
  const double ratio = static_cast<double>(outputRate) / inputRate;
  const size_t outFrames = static_cast<size_t>(std::floor(inFrames * ratio));

  std::vector<float> output(outFrames * channels);
  for (size_t i = 0; i < outFrames; ++i) {
    double srcPos = i / ratio;
    size_t idx = static_cast<size_t>(srcPos);
    double frac = srcPos - idx;
    size_t next = std::min(idx + 1, inFrames - 1);

    for (int c = 0; c < channels; ++c) {
      float a = input[idx * channels + c];
      float b = input[next * channels + c];
      output[i * channels + c] = static_cast<float>(a + (b - a) * frac);
    }
  }
  return output;
}

std::vector<float> AudioUtils::convertChannels(const std::vector<float> &input,
                                               int fromChannels, int toChannels) {
  if (fromChannels == toChannels || fromChannels <= 0 || toChannels <= 0) {
    return input;
  }

  const size_t frames = input.size() / fromChannels;
  std::vector<float> output;
  output.reserve(frames * toChannels);

  for (size_t f = 0; f < frames; ++f) {
    if (toChannels < fromChannels) {
      // Average all source channels into each target channel
      float sum = 0.0f;
      for (int c = 0; c < fromChannels; ++c) {
        sum += input[f * fromChannels + c];
      }
      float mixed = sum / fromChannels;
      for (int c = 0; c < toChannels; ++c) {
        output.push_back(mixed);
      }
    } else {
      for (int c = 0; c < toChannels; ++c) {
        output.push_back(input[f * fromChannels + (c % fromChannels)]);
      }
    }
  }
  return output;
}

float AudioUtils::rms(const std::vector<float> &samples) {
  if (samples.empty()) {
    return 0.0f;
  }
  double sum = 0.0;
  for (float s : samples) {
    sum += static_cast<double>(s) * s;
  }
  return static_cast<float>(std::sqrt(sum / samples.size()));
}

float AudioUtils::peak(const std::vector<float> &samples) {
  float maxAbs = 0.0f;
  for (float s : samples) {
    maxAbs = std::max(maxAbs, std::fabs(s));
  }
  return maxAbs;
}

double AudioUtils::estimateDurationMs(size_t byteCount, const AudioFormat &format) {
  size_t bps = format.bytesPerSecond();
  if (bps == 0) {
    return 0.0;
  }
  return static_cast<double>(byteCount) / bps * 1000.0;
}

} // namespace audio
} // namespace meetscribe
