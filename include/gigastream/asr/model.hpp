#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "gigastream/asr/decoding.hpp"
#include "gigastream/asr/tensor.hpp"

namespace gigastream {
namespace asr {

struct EncoderOutput {
    Tensor encoded; // [1, D, T']
    Tensor lengths; // [1], int64
};

class Encoder {
public:
    virtual ~Encoder() = default;

    virtual EncoderOutput encode(const Tensor& features, const Tensor& lengths) = 0;
    virtual void to(const std::string& device) { (void)device; }
};

enum class DecoderKind {
    Rnnt,
    Ctc
};

const char* to_string(DecoderKind kind);

struct ModelSettings {
    std::filesystem::path encoder_path;
    std::optional<std::filesystem::path> ctc_head_path;
    std::optional<std::filesystem::path> rnnt_decoder_path;
    std::optional<std::filesystem::path> rnnt_joint_path;
    std::filesystem::path vocab_path;
    int feat_in = 64;
    std::string device = "cpu";
};

// Encoder plus exactly one decoding head. The decoder kind is fixed when
// the model is assembled.
class AsrModel {
public:
    AsrModel(std::unique_ptr<Encoder> encoder,
             std::unique_ptr<CtcHead> head,
             Vocabulary vocabulary,
             int feat_in,
             std::string device = "cpu");
    AsrModel(std::unique_ptr<Encoder> encoder,
             std::unique_ptr<RnntHead> head,
             Vocabulary vocabulary,
             int feat_in,
             std::string device = "cpu");

    AsrModel(const AsrModel&) = delete;
    AsrModel& operator=(const AsrModel&) = delete;

    static std::shared_ptr<AsrModel> load(const ModelSettings& settings);

    DecoderKind decoder_kind() const;
    int feat_in() const;
    const std::string& device() const;
    void to(const std::string& device);

    Encoder& encoder();
    CtcHead& ctc_head();
    RnntHead& rnnt_head();
    const CtcGreedyDecoder& ctc_decoder() const;
    const RnntGreedyDecoder& rnnt_decoder() const;
    const Vocabulary& vocabulary() const;

private:
    std::unique_ptr<Encoder> encoder_;
    std::unique_ptr<CtcHead> ctc_head_;
    std::unique_ptr<RnntHead> rnnt_head_;
    std::unique_ptr<Vocabulary> vocabulary_;
    CtcGreedyDecoder ctc_decoder_;
    RnntGreedyDecoder rnnt_decoder_;
    DecoderKind kind_;
    int feat_in_;
    std::string device_;
};

}
}
