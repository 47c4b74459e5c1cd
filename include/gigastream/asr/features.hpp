#pragma once

#include <vector>

#include "gigastream/asr/tensor.hpp"

namespace gigastream {
namespace asr {

struct Features {
    Tensor features; // [1, feat_in, frames]
    Tensor lengths;  // [1], int64
};

class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    // audio: [1, N] float32, lengths: [1] int64.
    virtual Features extract(const Tensor& audio, const Tensor& lengths) = 0;
};

struct LogMelSettings {
    int sample_rate = 16000;
    int n_mels = 64;
    int n_fft = 320;
    int win_length = 320;
    int hop_length = 160;
};

// Centered STFT power spectrum, HTK mel filterbank, natural log clamped at
// 1e-9. Frame count is N / hop + 1.
class LogMelExtractor : public FeatureExtractor {
public:
    explicit LogMelExtractor(LogMelSettings settings = {});

    Features extract(const Tensor& audio, const Tensor& lengths) override;

    int num_frames(int64_t n_samples) const;
    const LogMelSettings& settings() const;

private:
    void init_window();
    void init_filters();
    std::vector<float> power_spectrum(const std::vector<float>& frame) const;

    LogMelSettings settings_;
    int n_bins_;
    std::vector<float> window_;
    std::vector<float> filters_; // [n_mels, n_bins]
};

}
}
