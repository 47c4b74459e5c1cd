#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "gigastream/vad/segmenter.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

using Catch::Approx;
using namespace gigastream;
using gigastream::testing::ScriptedOracle;

namespace {

constexpr int kRate = 16000;

asr::Tensor clip(double seconds) {
    const auto count = static_cast<int64_t>(seconds * kRate);
    return asr::Tensor::floats(std::vector<float>(static_cast<size_t>(count), 0.1f), {count});
}

vad::Timeline regions(std::vector<std::pair<double, double>> spans) {
    vad::Timeline timeline;
    for (const auto& span : spans) {
        timeline.add(vad::Segment{span.first, span.second, std::nullopt});
    }
    return timeline;
}

}

TEST_CASE("short pauses inside a chunk are merged") {
    ScriptedOracle oracle(regions({{0.0, 10.0}, {10.1, 12.0}}));
    const auto segments = vad::segment_audio(clip(40.0), kRate, oracle);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].start == Approx(0.0));
    REQUIRE(segments[0].end == Approx(12.0));
    REQUIRE(segments[0].samples.numel() == 12 * kRate);
    REQUIRE(segments[0].samples.rank() == 1);
}

TEST_CASE("long pauses are merged while the chunk is below the minimum duration") {
    ScriptedOracle oracle(regions({{0.0, 5.0}, {6.0, 8.0}}));
    const auto segments = vad::segment_audio(clip(40.0), kRate, oracle);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].end == Approx(8.0));
}

TEST_CASE("a pause after the minimum duration starts a new chunk") {
    ScriptedOracle oracle(regions({{0.0, 16.0}, {16.5, 20.0}}));
    const auto segments = vad::segment_audio(clip(40.0), kRate, oracle);
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].end == Approx(16.0));
    REQUIRE(segments[1].start == Approx(16.5));
    REQUIRE(segments[1].end == Approx(20.0));
}

TEST_CASE("a pause shorter than the threshold never splits") {
    ScriptedOracle oracle(regions({{0.0, 16.0}, {16.1, 18.0}}));
    const auto segments = vad::segment_audio(clip(40.0), kRate, oracle);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].end == Approx(18.0));
}

TEST_CASE("chunks never grow past the maximum duration") {
    ScriptedOracle oracle(regions({{0.0, 10.0}, {10.1, 20.0}, {20.1, 25.0}}));
    const auto segments = vad::segment_audio(clip(40.0), kRate, oracle);
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].end == Approx(20.0));
    REQUIRE(segments[1].start == Approx(20.1));
    REQUIRE(segments[1].end == Approx(25.0));
}

TEST_CASE("custom durations change where chunks are cut") {
    ScriptedOracle oracle(regions({{0.0, 2.0}, {2.5, 4.0}}));
    vad::SegmentOptions options;
    options.min_duration = 1.0;
    options.max_duration = 3.0;
    const auto segments = vad::segment_audio(clip(5.0), kRate, oracle, options);
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[1].start == Approx(2.5));
}

TEST_CASE("the first chunk starts at the beginning of the clip") {
    ScriptedOracle oracle(regions({{2.0, 5.0}}));
    const auto segments = vad::segment_audio(clip(10.0), kRate, oracle);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].start == Approx(0.0));
    REQUIRE(segments[0].end == Approx(5.0));
}

TEST_CASE("regions are clamped to the clip") {
    ScriptedOracle oracle(regions({{8.0, 12.0}}));
    const auto segments = vad::segment_audio(clip(10.0), kRate, oracle);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].end == Approx(10.0));
    REQUIRE(segments[0].samples.numel() == 10 * kRate);
}

TEST_CASE("a clip without speech has no chunks") {
    ScriptedOracle oracle;
    REQUIRE(vad::segment_audio(clip(3.0), kRate, oracle).empty());
}

TEST_CASE("the oracle sees the whole clip as WAV") {
    ScriptedOracle oracle;
    vad::segment_audio(clip(2.0), kRate, oracle);
    REQUIRE(oracle.calls.load() == 1);
    REQUIRE(oracle.last_wav.sample_rate == kRate);
    REQUIRE(oracle.last_wav.samples.size() == 2 * kRate);
}

TEST_CASE("a [1, N] clip is accepted") {
    ScriptedOracle oracle(regions({{0.0, 1.5}}));
    const auto count = static_cast<int64_t>(2 * kRate);
    const auto wav = asr::Tensor::floats(std::vector<float>(static_cast<size_t>(count), 0.1f),
                                         {1, count});
    REQUIRE(vad::segment_audio(wav, kRate, oracle).size() == 1);
}

TEST_CASE("clips shorter than one second are rejected") {
    ScriptedOracle oracle;
    const auto wav = asr::Tensor::floats(std::vector<float>(kRate - 1, 0.1f), {kRate - 1});
    REQUIRE_THROWS_AS(vad::segment_audio(wav, kRate, oracle), std::invalid_argument);
    REQUIRE(oracle.calls.load() == 0);
}

TEST_CASE("malformed tensors are rejected") {
    ScriptedOracle oracle;
    const auto stereo = asr::Tensor::floats(std::vector<float>(4 * kRate, 0.1f), {2, 2 * kRate});
    REQUIRE_THROWS_AS(vad::segment_audio(stereo, kRate, oracle), std::invalid_argument);

    const auto ints = asr::Tensor::ints(std::vector<int64_t>(2 * kRate, 1), {2 * kRate});
    REQUIRE_THROWS_AS(vad::segment_audio(ints, kRate, oracle), std::invalid_argument);

    REQUIRE_THROWS_AS(vad::segment_audio(clip(2.0), 0, oracle), std::invalid_argument);
}

TEST_CASE("oracle failures propagate") {
    ScriptedOracle oracle;
    oracle.fail = true;
    REQUIRE_THROWS_AS(vad::segment_audio(clip(2.0), kRate, oracle), std::runtime_error);
}
