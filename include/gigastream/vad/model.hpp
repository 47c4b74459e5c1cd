#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gigastream {
namespace vad {

// Silero VAD ONNX model. Scores one window of normalized samples at a time
// and threads the recurrent state through the caller.
class VadModel {
public:
    VadModel(const std::filesystem::path& model_path,
             int sampling_rate,
             const std::string& device = "cpu");
    ~VadModel();

    int sampling_rate() const;
    int window_size_samples() const;
    std::vector<float> initialize_state() const;
    float get_speech_prob(const std::vector<float>& audio,
                          std::vector<float>* state) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
