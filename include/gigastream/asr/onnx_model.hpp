#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "gigastream/asr/decoding.hpp"
#include "gigastream/asr/model.hpp"

namespace gigastream {
namespace asr {

// Inputs: features [1, feat_in, T] float, lengths [1] int64.
// Outputs: encoded [1, D, T'] float, encoded lengths [1] int64.
class OnnxEncoder : public Encoder {
public:
    OnnxEncoder(const std::filesystem::path& model_path, const std::string& device);
    ~OnnxEncoder() override;

    EncoderOutput encode(const Tensor& features, const Tensor& lengths) override;
    void to(const std::string& device) override;

private:
    struct Impl;
    std::filesystem::path model_path_;
    std::unique_ptr<Impl> impl_;
};

// Input: encoded [1, D, T]. Output: log probabilities [1, T, V].
class OnnxCtcHead : public CtcHead {
public:
    OnnxCtcHead(const std::filesystem::path& model_path, const std::string& device);
    ~OnnxCtcHead() override;

    Tensor log_probs(const Tensor& encoded) override;
    void to(const std::string& device);

private:
    struct Impl;
    std::filesystem::path model_path_;
    std::unique_ptr<Impl> impl_;
};

// Prediction network: token [1, 1] int64, h and c [L, 1, H] -> output
// [1, H, 1] (or [1, 1, H]), h, c. Joint network: encoder frame [1, D, 1],
// prediction [1, H, 1] -> logits with V + 1 classes, blank last.
class OnnxRnntHead : public RnntHead {
public:
    OnnxRnntHead(const std::filesystem::path& decoder_path,
                 const std::filesystem::path& joint_path,
                 size_t vocabulary_size,
                 const std::string& device);
    ~OnnxRnntHead() override;

    int64_t blank_id() const override;
    RnntState initial_state() const override;
    std::vector<float> predict(std::optional<int64_t> token, RnntState& state) override;
    std::vector<float> joint(const std::vector<float>& encoded_frame,
                             const std::vector<float>& prediction) override;
    void to(const std::string& device);

private:
    struct Impl;
    std::filesystem::path decoder_path_;
    std::filesystem::path joint_path_;
    size_t vocabulary_size_;
    std::unique_ptr<Impl> impl_;
};

}
}
