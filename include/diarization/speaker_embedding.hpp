#pragma once

#include "diarization/diarization_types.hpp"
#include <fftw3.h>
#include <mutex>
#include <vector>

namespace meetscribe {
namespace diarization {

/**
 * Spectral voice embedding.
 *
 * Audio is cut into 25 ms Hamming-windowed frames with a 10 ms hop, each
 * frame's magnitude spectrum is pooled into EMBEDDING_DIMENSION uniform
 * bands, band energies are averaged over frames and the result is
 * L2-normalized. Silence yields an all-zero vector.
 */
class SpectralEmbeddingExtractor {
public:
    explicit SpectralEmbeddingExtractor(int sampleRate, size_t dimension = EMBEDDING_DIMENSION);
    ~SpectralEmbeddingExtractor();

    SpectralEmbeddingExtractor(const SpectralEmbeddingExtractor&) = delete;
    SpectralEmbeddingExtractor& operator=(const SpectralEmbeddingExtractor&) = delete;

    std::vector<float> extract(const std::vector<float>& samples);
    std::vector<float> extract(const float* samples, size_t count);

    int getSampleRate() const { return sampleRate_; }
    size_t getFftSize() const { return fftSize_; }

private:
    void accumulateFrame(const float* frame, size_t length, std::vector<double>& bands);

    int sampleRate_;
    size_t dimension_;
    size_t frameSize_;
    size_t hopSize_;
    size_t fftSize_;
    std::vector<double> window_;

    double* fftInput_;
    fftw_complex* fftOutput_;
    fftw_plan fftPlan_;
    std::mutex mutex_;
};

// Vector helpers shared by clustering, identification and profile updates
float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);
void l2Normalize(std::vector<float>& v);
float l2Norm(const std::vector<float>& v);
std::vector<float> averageEmbeddings(const std::vector<std::vector<float>>& embeddings);

// new = (1 - weight) * profile + weight * sample, re-normalized
std::vector<float> blendEmbedding(const std::vector<float>& profile,
                                  const std::vector<float>& sample,
                                  float weight = PROFILE_UPDATE_WEIGHT);

} // namespace diarization
} // namespace meetscribe
