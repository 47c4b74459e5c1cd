#pragma once

#include <memory>
#include <string>
#include <vector>

#include "gigastream/asr/features.hpp"
#include "gigastream/asr/model.hpp"

namespace gigastream {
namespace stream {

// Turns a block of mono samples into text with the loaded ASR model.
class TranscriptionBridge {
public:
    explicit TranscriptionBridge(std::shared_ptr<asr::AsrModel> model,
                                 std::unique_ptr<asr::FeatureExtractor> extractor = nullptr);

    std::string recognize(const std::vector<float>& samples);

    asr::AsrModel& model();

private:
    std::shared_ptr<asr::AsrModel> model_;
    std::unique_ptr<asr::FeatureExtractor> extractor_;
};

}
}
