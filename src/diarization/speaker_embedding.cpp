#include "diarization/speaker_embedding.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace meetscribe {
namespace diarization {

namespace {

// FFTW planning is not thread-safe; execution on distinct plans is
std::mutex& planMutex() {
    static std::mutex mutex;
    return mutex;
}

size_t nextPowerOfTwo(size_t n) {
    size_t p = 1;
    while (p < n) {
        p <<= 1;
    }
    return p;
}

} // namespace

SpectralEmbeddingExtractor::SpectralEmbeddingExtractor(int sampleRate, size_t dimension)
    : sampleRate_(sampleRate), dimension_(dimension),
      fftInput_(nullptr), fftOutput_(nullptr), fftPlan_(nullptr) {
    if (sampleRate <= 0 || dimension == 0) {
        throw utils::DiarizationException("Invalid embedding extractor parameters",
                                          "SpectralEmbeddingExtractor");
    }

    frameSize_ = std::max<size_t>(2, static_cast<size_t>(sampleRate * 0.025));
    hopSize_ = std::max<size_t>(1, static_cast<size_t>(sampleRate * 0.010));
    fftSize_ = nextPowerOfTwo(frameSize_);

    window_.resize(frameSize_);
    for (size_t i = 0; i < frameSize_; ++i) {
        window_[i] = 0.54 - 0.46 * std::cos(2.0 * M_PI * i / (frameSize_ - 1));
    }

    std::lock_guard<std::mutex> lock(planMutex());
    fftInput_ = static_cast<double*>(fftw_malloc(sizeof(double) * fftSize_));
    fftOutput_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (fftSize_ / 2 + 1)));
    if (!fftInput_ || !fftOutput_) {
        if (fftInput_) fftw_free(fftInput_);
        if (fftOutput_) fftw_free(fftOutput_);
        throw utils::DiarizationException("Failed to allocate FFT buffers", "SpectralEmbeddingExtractor");
    }
    fftPlan_ = fftw_plan_dft_r2c_1d(static_cast<int>(fftSize_), fftInput_, fftOutput_, FFTW_ESTIMATE);
}

SpectralEmbeddingExtractor::~SpectralEmbeddingExtractor() {
    std::lock_guard<std::mutex> lock(planMutex());
    if (fftPlan_) {
        fftw_destroy_plan(fftPlan_);
    }
    if (fftInput_) {
        fftw_free(fftInput_);
    }
    if (fftOutput_) {
        fftw_free(fftOutput_);
    }
}

std::vector<float> SpectralEmbeddingExtractor::extract(const std::vector<float>& samples) {
    return extract(samples.data(), samples.size());
}

std::vector<float> SpectralEmbeddingExtractor::extract(const float* samples, size_t count) {
    std::vector<double> bands(dimension_, 0.0);
    size_t frames = 0;

    std::lock_guard<std::mutex> lock(mutex_);

    if (count > 0 && count < frameSize_) {
        // Short input: a single zero-padded frame
        accumulateFrame(samples, count, bands);
        frames = 1;
    } else {
        for (size_t i = 0; i + frameSize_ <= count; i += hopSize_) {
            accumulateFrame(samples + i, frameSize_, bands);
            ++frames;
        }
    }

    std::vector<float> embedding(dimension_, 0.0f);
    if (frames == 0) {
        return embedding;
    }
    for (size_t b = 0; b < dimension_; ++b) {
        embedding[b] = static_cast<float>(bands[b] / frames);
    }
    l2Normalize(embedding);
    return embedding;
}

void SpectralEmbeddingExtractor::accumulateFrame(const float* frame, size_t length,
                                                 std::vector<double>& bands) {
    for (size_t j = 0; j < fftSize_; ++j) {
        fftInput_[j] = j < length ? frame[j] * window_[j] : 0.0;
    }

    fftw_execute(fftPlan_);

    // Bins are spread uniformly over the bands
    const size_t bins = fftSize_ / 2 + 1;
    for (size_t k = 0; k < bins; ++k) {
        double real = fftOutput_[k][0];
        double imag = fftOutput_[k][1];
        size_t band = std::min(dimension_ - 1, k * dimension_ / bins);
        bands[band] += std::sqrt(real * real + imag * imag);
    }
}

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }

    double magnitude = std::sqrt(normA) * std::sqrt(normB);
    return magnitude > 0.0 ? static_cast<float>(dot / magnitude) : 0.0f;
}

float l2Norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return static_cast<float>(std::sqrt(sum));
}

void l2Normalize(std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    if (sum <= 0.0) {
        return;
    }
    double norm = std::sqrt(sum);
    for (float& x : v) {
        x = static_cast<float>(x / norm);
    }
}

std::vector<float> averageEmbeddings(const std::vector<std::vector<float>>& embeddings) {
    if (embeddings.empty()) {
        return {};
    }

    std::vector<double> sum(embeddings.front().size(), 0.0);
    for (const auto& embedding : embeddings) {
        for (size_t i = 0; i < sum.size() && i < embedding.size(); ++i) {
            sum[i] += embedding[i];
        }
    }

    std::vector<float> average(sum.size());
    for (size_t i = 0; i < sum.size(); ++i) {
        average[i] = static_cast<float>(sum[i] / embeddings.size());
    }
    return average;
}

std::vector<float> blendEmbedding(const std::vector<float>& profile,
                                  const std::vector<float>& sample, float weight) {
    if (profile.size() != sample.size()) {
        throw utils::DiarizationException("Embedding dimension mismatch", "blendEmbedding");
    }

    std::vector<float> blended(profile.size());
    for (size_t i = 0; i < profile.size(); ++i) {
        blended[i] = profile[i] * (1.0f - weight) + sample[i] * weight;
    }
    l2Normalize(blended);
    return blended;
}

} // namespace diarization
} // namespace meetscribe
