#include "gigastream/stream/transcriber.hpp"

#include <chrono>
#include <stdexcept>

#include "gigastream/logging.hpp"
#include "gigastream/metrics.hpp"

namespace gigastream::stream {

TranscriptionBridge::TranscriptionBridge(std::shared_ptr<asr::AsrModel> model,
                                         std::unique_ptr<asr::FeatureExtractor> extractor)
    : model_(std::move(model)),
      extractor_(std::move(extractor)) {
    if (!model_) {
        throw std::invalid_argument("TranscriptionBridge requires a model");
    }
    if (!extractor_) {
        asr::LogMelSettings settings;
        settings.n_mels = model_->feat_in();
        extractor_ = std::make_unique<asr::LogMelExtractor>(settings);
    }
}

std::string TranscriptionBridge::recognize(const std::vector<float>& samples) {
    if (samples.empty()) {
        return {};
    }
    const auto started = std::chrono::steady_clock::now();
    const auto n = static_cast<int64_t>(samples.size());
    const auto& device = model_->device();
    const auto audio = asr::Tensor::floats(samples, {1, n}).to(device);
    const auto lengths = asr::Tensor::ints({n}, {1}).to(device);

    const auto features = extractor_->extract(audio, lengths);
    const auto encoded = model_->encoder().encode(features.features, features.lengths);

    std::vector<std::string> hypotheses;
    switch (model_->decoder_kind()) {
    case asr::DecoderKind::Rnnt:
        hypotheses = model_->rnnt_decoder().decode(
            model_->rnnt_head(), encoded.encoded, encoded.lengths);
        break;
    case asr::DecoderKind::Ctc:
        hypotheses = model_->ctc_decoder().decode(
            model_->ctc_head(), encoded.encoded, encoded.lengths);
        break;
    }

    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    Metrics::instance().observe_latency("transcribe", elapsed);
    logging::debug(
        "Block transcribed",
        {kv("samples", samples.size()),
         kv("decoder", asr::to_string(model_->decoder_kind())),
         kv("latency_sec", elapsed)});
    return hypotheses.empty() ? std::string{} : hypotheses.front();
}

asr::AsrModel& TranscriptionBridge::model() {
    return *model_;
}

}
