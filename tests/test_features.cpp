#include <catch2/catch_test_macros.hpp>

#include "gigastream/asr/features.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace gigastream::asr;

namespace {

Tensor sine(size_t samples, double frequency, int sample_rate = 16000) {
    std::vector<float> audio(samples);
    for (size_t i = 0; i < samples; ++i) {
        audio[i] = static_cast<float>(
            0.5 * std::sin(2.0 * 3.14159265358979323846 * frequency * static_cast<double>(i) /
                           sample_rate));
    }
    return Tensor::floats(std::move(audio), {1, static_cast<int64_t>(samples)});
}

}

TEST_CASE("LogMelExtractor produces [1, n_mels, N / hop + 1] features") {
    LogMelExtractor extractor;
    const auto audio = sine(8000, 440.0);
    const auto result = extractor.extract(audio, Tensor::ints({8000}, {1}));

    REQUIRE(result.features.shape == std::vector<int64_t>{1, 64, 51});
    REQUIRE(result.lengths.indices == std::vector<int64_t>{51});
    REQUIRE(extractor.num_frames(8000) == 51);
    for (auto value : result.features.values) {
        REQUIRE(std::isfinite(value));
    }
}

TEST_CASE("LogMelExtractor honors the length tensor") {
    LogMelExtractor extractor;
    const auto audio = sine(8000, 440.0);
    const auto result = extractor.extract(audio, Tensor::ints({1600}, {1}));
    REQUIRE(result.features.dim(2) == 11);
}

TEST_CASE("LogMelExtractor clamps silence to the log floor") {
    LogMelExtractor extractor;
    const auto audio = Tensor::floats(std::vector<float>(1600, 0.0f), {1, 1600});
    const auto result = extractor.extract(audio, Tensor::ints({1600}, {1}));
    const float floor = static_cast<float>(std::log(1e-9));
    for (auto value : result.features.values) {
        REQUIRE(std::abs(value - floor) < 1e-3f);
    }
}

TEST_CASE("LogMelExtractor puts a low tone in low mel bands") {
    LogMelSettings settings;
    settings.n_mels = 32;
    LogMelExtractor extractor(settings);
    const auto audio = sine(4000, 300.0);
    const auto result = extractor.extract(audio, Tensor::ints({4000}, {1}));

    const int64_t frames = result.features.dim(2);
    const int64_t middle = frames / 2;
    int best_band = 0;
    float best_energy = -1e30f;
    for (int m = 0; m < settings.n_mels; ++m) {
        const float energy = result.features.values[static_cast<size_t>(m * frames + middle)];
        if (energy > best_energy) {
            best_energy = energy;
            best_band = m;
        }
    }
    REQUIRE(best_band < settings.n_mels / 4);
}

TEST_CASE("LogMelExtractor rejects malformed input") {
    LogMelExtractor extractor;
    const auto flat = Tensor::floats(std::vector<float>(100, 0.0f), {100});
    REQUIRE_THROWS_AS(extractor.extract(flat, Tensor::ints({100}, {1})), std::invalid_argument);

    LogMelSettings bad;
    bad.win_length = 1024;
    REQUIRE_THROWS_AS(LogMelExtractor(bad), std::invalid_argument);
}
