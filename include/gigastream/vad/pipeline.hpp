#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "gigastream/vad/oracle.hpp"

namespace gigastream {
namespace vad {

class VadCredentialError : public std::runtime_error {
public:
    explicit VadCredentialError(const std::string& message) : std::runtime_error(message) {}
};

class VadPipelineError : public std::runtime_error {
public:
    explicit VadPipelineError(const std::string& message) : std::runtime_error(message) {}
};

struct PipelineSettings {
    std::optional<std::string> hf_token;
    std::filesystem::path model_path = "silero_vad.onnx";
    std::string model_url;
    int sampling_rate = 16000;
};

// Process-wide oracle per device, built on first use. Throws
// VadCredentialError without a token and VadPipelineError when the model
// cannot be fetched or loaded.
std::shared_ptr<VadOracle> get_pipeline(const std::string& device,
                                        const PipelineSettings& settings);

void clear_pipeline_cache();

}
}
