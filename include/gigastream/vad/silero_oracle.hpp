#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gigastream/vad/model.hpp"
#include "gigastream/vad/oracle.hpp"

namespace gigastream {
namespace vad {

struct SileroSettings {
    int sampling_rate = 16000;
    float threshold = 0.5f;
    int min_speech_ms = 250;
    int min_silence_ms = 100;
    int speech_pad_ms = 30;
};

// Converts per-window speech probabilities into speech segments (seconds).
// Enters speech at threshold, leaves it below threshold - 0.15 once the
// silence lasts min_silence_ms, drops segments shorter than min_speech_ms and
// pads the survivors. A segment's score is its mean window probability.
Timeline probabilities_to_timeline(const std::vector<float>& probabilities,
                                   int window_samples,
                                   size_t total_samples,
                                   const SileroSettings& settings);

class SileroVadOracle : public VadOracle {
public:
    SileroVadOracle(std::filesystem::path model_path,
                    SileroSettings settings = {},
                    const std::string& device = "cpu");

    Timeline detect(const std::string& wav_bytes) override;
    void to(const std::string& device) override;
    std::string device() const override;

    const SileroSettings& settings() const;

private:
    std::filesystem::path model_path_;
    SileroSettings settings_;
    mutable std::mutex mutex_;
    std::unique_ptr<VadModel> model_;
    std::string device_;
};

}
}
