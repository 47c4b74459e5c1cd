#include "gigastream/asr/model.hpp"

#include <stdexcept>

#include "gigastream/asr/onnx_model.hpp"
#include "gigastream/logging.hpp"

namespace gigastream::asr {

const char* to_string(DecoderKind kind) {
    switch (kind) {
    case DecoderKind::Rnnt:
        return "rnnt";
    case DecoderKind::Ctc:
        return "ctc";
    }
    return "unknown";
}

AsrModel::AsrModel(std::unique_ptr<Encoder> encoder,
                   std::unique_ptr<CtcHead> head,
                   Vocabulary vocabulary,
                   int feat_in,
                   std::string device)
    : encoder_(std::move(encoder)),
      ctc_head_(std::move(head)),
      vocabulary_(std::make_unique<Vocabulary>(std::move(vocabulary))),
      ctc_decoder_(*vocabulary_),
      rnnt_decoder_(*vocabulary_),
      kind_(DecoderKind::Ctc),
      feat_in_(feat_in),
      device_(std::move(device)) {
    if (!encoder_ || !ctc_head_) {
        throw std::invalid_argument("ASR model requires an encoder and a CTC head");
    }
}

AsrModel::AsrModel(std::unique_ptr<Encoder> encoder,
                   std::unique_ptr<RnntHead> head,
                   Vocabulary vocabulary,
                   int feat_in,
                   std::string device)
    : encoder_(std::move(encoder)),
      rnnt_head_(std::move(head)),
      vocabulary_(std::make_unique<Vocabulary>(std::move(vocabulary))),
      ctc_decoder_(*vocabulary_),
      rnnt_decoder_(*vocabulary_),
      kind_(DecoderKind::Rnnt),
      feat_in_(feat_in),
      device_(std::move(device)) {
    if (!encoder_ || !rnnt_head_) {
        throw std::invalid_argument("ASR model requires an encoder and an RNNT head");
    }
}

std::shared_ptr<AsrModel> AsrModel::load(const ModelSettings& settings) {
    auto vocabulary = Vocabulary::load(settings.vocab_path);
    auto encoder = std::make_unique<OnnxEncoder>(settings.encoder_path, settings.device);

    std::shared_ptr<AsrModel> model;
    if (settings.rnnt_decoder_path && settings.rnnt_joint_path) {
        auto head = std::make_unique<OnnxRnntHead>(*settings.rnnt_decoder_path,
                                                   *settings.rnnt_joint_path,
                                                   vocabulary.size(),
                                                   settings.device);
        model = std::make_shared<AsrModel>(std::move(encoder), std::move(head),
                                           std::move(vocabulary), settings.feat_in,
                                           settings.device);
    } else if (settings.ctc_head_path) {
        auto head = std::make_unique<OnnxCtcHead>(*settings.ctc_head_path, settings.device);
        model = std::make_shared<AsrModel>(std::move(encoder), std::move(head),
                                           std::move(vocabulary), settings.feat_in,
                                           settings.device);
    } else {
        throw std::runtime_error("ASR model needs a CTC head or RNNT decoder and joint");
    }

    logging::info(
        "ASR model loaded",
        {kv("encoder", settings.encoder_path.string()),
         kv("decoder", to_string(model->decoder_kind())),
         kv("vocabulary", model->vocabulary().size()),
         kv("feat_in", settings.feat_in),
         kv("device", settings.device)});
    return model;
}

DecoderKind AsrModel::decoder_kind() const {
    return kind_;
}

int AsrModel::feat_in() const {
    return feat_in_;
}

const std::string& AsrModel::device() const {
    return device_;
}

void AsrModel::to(const std::string& device) {
    if (device == device_) {
        return;
    }
    encoder_->to(device);
    if (auto* head = dynamic_cast<OnnxCtcHead*>(ctc_head_.get())) {
        head->to(device);
    }
    if (auto* head = dynamic_cast<OnnxRnntHead*>(rnnt_head_.get())) {
        head->to(device);
    }
    device_ = device;
}

Encoder& AsrModel::encoder() {
    return *encoder_;
}

CtcHead& AsrModel::ctc_head() {
    if (!ctc_head_) {
        throw std::logic_error("model has no CTC head");
    }
    return *ctc_head_;
}

RnntHead& AsrModel::rnnt_head() {
    if (!rnnt_head_) {
        throw std::logic_error("model has no RNNT head");
    }
    return *rnnt_head_;
}

const CtcGreedyDecoder& AsrModel::ctc_decoder() const {
    return ctc_decoder_;
}

const RnntGreedyDecoder& AsrModel::rnnt_decoder() const {
    return rnnt_decoder_;
}

const Vocabulary& AsrModel::vocabulary() const {
    return *vocabulary_;
}

}
