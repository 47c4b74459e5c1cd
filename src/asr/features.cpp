#include "gigastream/asr/features.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>

namespace gigastream::asr {

namespace {

constexpr double kPi = 3.14159265358979323846;

using Complex = std::complex<double>;

void dft(const std::vector<Complex>& in, std::vector<Complex>& out) {
    const size_t n = in.size();
    out.assign(n, Complex{});
    for (size_t k = 0; k < n; ++k) {
        Complex sum{};
        for (size_t t = 0; t < n; ++t) {
            const double angle = -2.0 * kPi * static_cast<double>(k * t) / static_cast<double>(n);
            sum += in[t] * Complex(std::cos(angle), std::sin(angle));
        }
        out[k] = sum;
    }
}

// Radix-2 split while the size is even, plain DFT for the odd remainder.
void fft(const std::vector<Complex>& in, std::vector<Complex>& out) {
    const size_t n = in.size();
    if (n == 1) {
        out = in;
        return;
    }
    if (n % 2 != 0) {
        dft(in, out);
        return;
    }
    const size_t half = n / 2;
    std::vector<Complex> even(half);
    std::vector<Complex> odd(half);
    for (size_t i = 0; i < half; ++i) {
        even[i] = in[2 * i];
        odd[i] = in[2 * i + 1];
    }
    std::vector<Complex> even_out;
    std::vector<Complex> odd_out;
    fft(even, even_out);
    fft(odd, odd_out);
    out.assign(n, Complex{});
    for (size_t k = 0; k < half; ++k) {
        const double angle = -2.0 * kPi * static_cast<double>(k) / static_cast<double>(n);
        const Complex twiddle = Complex(std::cos(angle), std::sin(angle)) * odd_out[k];
        out[k] = even_out[k] + twiddle;
        out[k + half] = even_out[k] - twiddle;
    }
}

double hz_to_mel(double hz) {
    return 2595.0 * std::log10(1.0 + hz / 700.0);
}

double mel_to_hz(double mel) {
    return 700.0 * (std::pow(10.0, mel / 2595.0) - 1.0);
}

float reflect_at(const float* samples, int64_t n, int64_t index) {
    if (n == 1) {
        return samples[0];
    }
    while (index < 0 || index >= n) {
        if (index < 0) {
            index = -index;
        }
        if (index >= n) {
            index = 2 * (n - 1) - index;
        }
    }
    return samples[index];
}

}

LogMelExtractor::LogMelExtractor(LogMelSettings settings)
    : settings_(settings),
      n_bins_(settings.n_fft / 2 + 1) {
    if (settings_.n_fft <= 0 || settings_.hop_length <= 0 || settings_.n_mels <= 0 ||
        settings_.win_length <= 0 || settings_.win_length > settings_.n_fft) {
        throw std::invalid_argument("invalid log-mel settings");
    }
    init_window();
    init_filters();
}

void LogMelExtractor::init_window() {
    // Periodic Hann window, centered inside n_fft.
    window_.assign(settings_.n_fft, 0.0f);
    const int offset = (settings_.n_fft - settings_.win_length) / 2;
    for (int i = 0; i < settings_.win_length; ++i) {
        window_[offset + i] = static_cast<float>(
            0.5 - 0.5 * std::cos(2.0 * kPi * i / settings_.win_length));
    }
}

void LogMelExtractor::init_filters() {
    filters_.assign(static_cast<size_t>(settings_.n_mels) * n_bins_, 0.0f);
    const double nyquist = settings_.sample_rate / 2.0;
    const double mel_min = hz_to_mel(0.0);
    const double mel_max = hz_to_mel(nyquist);

    std::vector<double> hz_points(settings_.n_mels + 2);
    for (int i = 0; i < settings_.n_mels + 2; ++i) {
        const double mel = mel_min + (mel_max - mel_min) * i / (settings_.n_mels + 1);
        hz_points[i] = mel_to_hz(mel);
    }

    for (int bin = 0; bin < n_bins_; ++bin) {
        const double freq = nyquist * bin / (n_bins_ - 1);
        for (int m = 0; m < settings_.n_mels; ++m) {
            const double left = hz_points[m];
            const double center = hz_points[m + 1];
            const double right = hz_points[m + 2];
            const double down = (freq - left) / (center - left);
            const double up = (right - freq) / (right - center);
            const double weight = std::max(0.0, std::min(down, up));
            filters_[static_cast<size_t>(m) * n_bins_ + bin] = static_cast<float>(weight);
        }
    }
}

std::vector<float> LogMelExtractor::power_spectrum(const std::vector<float>& frame) const {
    std::vector<Complex> input(settings_.n_fft);
    for (int i = 0; i < settings_.n_fft; ++i) {
        input[i] = Complex(frame[i] * window_[i], 0.0);
    }
    std::vector<Complex> output;
    fft(input, output);
    std::vector<float> power(n_bins_);
    for (int i = 0; i < n_bins_; ++i) {
        power[i] = static_cast<float>(std::norm(output[i]));
    }
    return power;
}

int LogMelExtractor::num_frames(int64_t n_samples) const {
    return static_cast<int>(n_samples / settings_.hop_length + 1);
}

const LogMelSettings& LogMelExtractor::settings() const {
    return settings_;
}

Features LogMelExtractor::extract(const Tensor& audio, const Tensor& lengths) {
    if (audio.dtype != DType::Float32 || audio.rank() != 2 || audio.dim(0) != 1) {
        throw std::invalid_argument("feature extractor expects a [1, N] float tensor, got " +
                                    shape_to_string(audio.shape));
    }
    const int64_t available = audio.dim(1);
    int64_t n_samples = available;
    if (lengths.dtype == DType::Int64 && !lengths.indices.empty()) {
        n_samples = std::min(available, lengths.indices.front());
    }
    if (n_samples <= 0) {
        throw std::invalid_argument("feature extractor received empty audio");
    }

    const int frames = num_frames(n_samples);
    const int pad = settings_.n_fft / 2;
    const float* samples = audio.values.data();

    std::vector<float> features(static_cast<size_t>(settings_.n_mels) * frames);
    std::vector<float> frame(settings_.n_fft);
    for (int t = 0; t < frames; ++t) {
        const int64_t begin = static_cast<int64_t>(t) * settings_.hop_length - pad;
        for (int i = 0; i < settings_.n_fft; ++i) {
            frame[i] = reflect_at(samples, n_samples, begin + i);
        }
        const auto power = power_spectrum(frame);
        for (int m = 0; m < settings_.n_mels; ++m) {
            double energy = 0.0;
            const float* filter = &filters_[static_cast<size_t>(m) * n_bins_];
            for (int bin = 0; bin < n_bins_; ++bin) {
                energy += static_cast<double>(filter[bin]) * power[bin];
            }
            energy = std::min(std::max(energy, 1e-9), 1e9);
            features[static_cast<size_t>(m) * frames + t] = static_cast<float>(std::log(energy));
        }
    }

    Features result;
    result.features = Tensor::floats(std::move(features), {1, settings_.n_mels, frames});
    result.lengths = Tensor::ints({frames}, {1});
    result.features.device = audio.device;
    result.lengths.device = audio.device;
    return result;
}

}
