#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "gigastream/asr/decoding.hpp"
#include "gigastream/asr/features.hpp"
#include "gigastream/asr/model.hpp"
#include "gigastream/stream/transcriber.hpp"

#include <cmath>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gigastream::asr;
using gigastream::testing::ConstantEncoder;
using gigastream::testing::ScriptedCtcHead;

namespace {

const std::string kMarker = "\xE2\x96\x81";

Vocabulary make_vocabulary() {
    return Vocabulary({kMarker + "при", "вет", kMarker + "мир"});
}

// Frame value k >= 0 asks for token k once; negative frames are silent.
class ScriptedRnntHead : public RnntHead {
public:
    explicit ScriptedRnntHead(int64_t vocabulary_size)
        : vocabulary_size_(vocabulary_size) {}

    int64_t blank_id() const override { return vocabulary_size_; }
    RnntState initial_state() const override { return {}; }

    std::vector<float> predict(std::optional<int64_t> token, RnntState&) override {
        ++predictions;
        return {token ? static_cast<float>(*token) : -1.0f};
    }

    std::vector<float> joint(const std::vector<float>& frame,
                             const std::vector<float>& prediction) override {
        std::vector<float> logits(static_cast<size_t>(vocabulary_size_ + 1), 0.0f);
        const auto wanted = static_cast<int64_t>(std::lround(frame[0]));
        if (wanted >= 0 && prediction[0] != frame[0]) {
            logits[static_cast<size_t>(wanted)] = 1.0f;
        } else {
            logits[static_cast<size_t>(vocabulary_size_)] = 1.0f;
        }
        return logits;
    }

    int predictions = 0;

private:
    int64_t vocabulary_size_;
};

Tensor frames_tensor(const std::vector<float>& frames) {
    const auto count = static_cast<int64_t>(frames.size());
    return Tensor::floats(frames, {1, 1, count});
}

class FailingEncoder : public Encoder {
public:
    EncoderOutput encode(const Tensor&, const Tensor&) override {
        throw std::runtime_error("encoder crashed");
    }
};

}

TEST_CASE("Vocabulary detokenizes word pieces") {
    const auto vocabulary = make_vocabulary();
    REQUIRE(vocabulary.size() == 3);
    REQUIRE(vocabulary.detokenize({0, 1, 2}) == "привет мир");
    REQUIRE_THROWS_AS(vocabulary.token(3), std::out_of_range);
}

TEST_CASE("Vocabulary::load reads one token per line") {
    const auto path = std::filesystem::temp_directory_path() / "gigastream_tokens.txt";
    {
        std::ofstream out(path);
        out << kMarker << "да\r\n" << "нет\n";
    }
    const auto vocabulary = Vocabulary::load(path);
    REQUIRE(vocabulary.size() == 2);
    REQUIRE(vocabulary.token(1) == "нет");
    REQUIRE(vocabulary.detokenize({0}) == "да");
    std::filesystem::remove(path);
    REQUIRE_THROWS(Vocabulary::load(path));
}

TEST_CASE("CTC greedy decoding collapses repeats and drops blanks") {
    const auto vocabulary = make_vocabulary();
    CtcGreedyDecoder decoder(vocabulary);
    ScriptedCtcHead head({0, 0, 3, 1, 1, 3, 3, 2, 3, 2}, 4);
    const auto encoded = frames_tensor(std::vector<float>(10, 0.0f));

    const auto full = decoder.decode(head, encoded, Tensor::ints({10}, {1}));
    REQUIRE(full.size() == 1);
    REQUIRE(full[0] == "привет мир мир");

    const auto truncated = decoder.decode(head, encoded, Tensor::ints({5}, {1}));
    REQUIRE(truncated[0] == "привет");
}

TEST_CASE("RNNT greedy decoding emits tokens until the joint predicts blank") {
    const auto vocabulary = make_vocabulary();
    RnntGreedyDecoder decoder(vocabulary);
    ScriptedRnntHead head(3);
    const auto encoded = frames_tensor({0.0f, -1.0f, 1.0f, -1.0f, 2.0f});

    const auto result = decoder.decode(head, encoded, Tensor::ints({5}, {1}));
    REQUIRE(result.size() == 1);
    REQUIRE(result[0] == "привет мир");
    // One initial prediction plus one per emitted token.
    REQUIRE(head.predictions == 4);
}

TEST_CASE("AsrModel records its decoder kind") {
    AsrModel ctc(std::make_unique<ConstantEncoder>(2),
                 std::make_unique<ScriptedCtcHead>(std::vector<int64_t>{0, 3}, 4),
                 make_vocabulary(), 64);
    REQUIRE(ctc.decoder_kind() == DecoderKind::Ctc);
    REQUIRE_THROWS_AS(ctc.rnnt_head(), std::logic_error);

    AsrModel rnnt(std::make_unique<ConstantEncoder>(2),
                  std::make_unique<ScriptedRnntHead>(3),
                  make_vocabulary(), 64);
    REQUIRE(rnnt.decoder_kind() == DecoderKind::Rnnt);
    REQUIRE(std::string(to_string(rnnt.decoder_kind())) == "rnnt");
}

TEST_CASE("TranscriptionBridge runs features, encoder and the CTC decoder") {
    auto encoder = std::make_unique<ConstantEncoder>(4);
    auto* encoder_view = encoder.get();
    auto model = std::make_shared<AsrModel>(
        std::move(encoder),
        std::make_unique<ScriptedCtcHead>(std::vector<int64_t>{0, 1, 3, 2}, 4),
        make_vocabulary(), 64);
    gigastream::stream::TranscriptionBridge bridge(model);

    const std::vector<float> samples(16000, 0.1f);
    REQUIRE(bridge.recognize(samples) == "привет мир");
    REQUIRE(encoder_view->last_feature_shape == std::vector<int64_t>{1, 64, 101});
    REQUIRE(bridge.recognize({}).empty());
}

TEST_CASE("TranscriptionBridge propagates model failures") {
    auto model = std::make_shared<AsrModel>(
        std::make_unique<FailingEncoder>(),
        std::make_unique<ScriptedCtcHead>(std::vector<int64_t>{3}, 4),
        make_vocabulary(), 64);
    gigastream::stream::TranscriptionBridge bridge(model);
    REQUIRE_THROWS_AS(bridge.recognize(std::vector<float>(1600, 0.1f)), std::runtime_error);
}
