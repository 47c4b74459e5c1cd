#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "gigastream/app.hpp"
#include "gigastream/audio/wav.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace gigastream;
using gigastream::testing::ConstantEncoder;
using gigastream::testing::ScriptedCtcHead;
using gigastream::testing::ScriptedOracle;
using gigastream::testing::silence;
using gigastream::testing::tone;

namespace {

const std::string kMarker = "\xE2\x96\x81";

std::shared_ptr<stream::TranscriptionBridge> make_bridge() {
    auto model = std::make_shared<asr::AsrModel>(
        std::make_unique<ConstantEncoder>(4),
        std::make_unique<ScriptedCtcHead>(std::vector<int64_t>{0, 1, 3, 2}, 4),
        asr::Vocabulary({kMarker + "при", "вет", kMarker + "мир"}),
        64);
    return std::make_shared<stream::TranscriptionBridge>(model);
}

Config test_config() {
    Config config;
    config.poll_interval_ms = 5;
    return config;
}

std::string pcm_bytes(const std::vector<float>& samples) {
    std::string bytes;
    bytes.reserve(samples.size() * 2);
    for (auto sample : samples) {
        const auto value = static_cast<int16_t>(sample * 32767.0f);
        bytes.push_back(static_cast<char>(value & 0xFF));
        bytes.push_back(static_cast<char>((value >> 8) & 0xFF));
    }
    return bytes;
}

std::vector<float> utterance() {
    auto audio = tone(16000);
    const auto quiet = silence(20000);
    audio.insert(audio.end(), quiet.begin(), quiet.end());
    return audio;
}

bool eventually(App& app, const std::string& id, size_t finals) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        const auto response = app.handle_session_results(id);
        if (response.body["final"].size() >= finals) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

}

TEST_CASE("sessions transcribe PCM uploads") {
    App app(test_config(), make_bridge(), nullptr);
    const auto created = app.handle_create_session({{"use_vad", false}});
    REQUIRE(created.status == 201);
    REQUIRE(created.body["detector"] == "energy");
    const auto id = created.body["session_id"].get<std::string>();
    REQUIRE(app.session_count() == 1);

    const auto appended = app.handle_append_audio(id, {"application/octet-stream",
                                                       pcm_bytes(utterance())});
    REQUIRE(appended.status == 202);
    REQUIRE(appended.body["accepted_samples"] == 36000);

    REQUIRE(eventually(app, id, 1));
    const auto results = app.handle_session_results(id);
    REQUIRE(results.status == 200);
    REQUIRE(results.body["final"][0]["text"] == "привет мир");
    REQUIRE(results.body["final"][0]["is_final"] == true);
    REQUIRE(results.body["final"][0]["start_time"] == "00:00:00");
}

TEST_CASE("WAV uploads must match the session rate") {
    App app(test_config(), make_bridge(), nullptr);
    const auto id = app.handle_create_session({{"use_vad", false}}).body["session_id"]
                        .get<std::string>();

    const auto ok = app.handle_append_audio(id, {"audio/wav", audio::encode_wav(utterance(), 16000)});
    REQUIRE(ok.status == 202);
    REQUIRE(eventually(app, id, 1));

    REQUIRE_THROWS_AS(app.handle_append_audio(id, {"audio/wav", audio::encode_wav(tone(800), 8000)}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(app.handle_append_audio(id, {"audio/x-wav", "not a wav file"}),
                      std::invalid_argument);
}

TEST_CASE("session options can be overridden per session") {
    const auto base = test_config().stream_options();
    const auto options = stream_options_from_json(
        base, {{"chunk_size", 1600}, {"min_silence_duration", 0.3}, {"force_speech", true}});
    REQUIRE(options.chunk_size == 1600);
    REQUIRE(options.min_silence_duration == 0.3);
    REQUIRE(options.force_speech);
    REQUIRE(options.stabilization_frames == base.stabilization_frames);

    REQUIRE_THROWS_AS(stream_options_from_json(base, {{"chunk_size", 0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(stream_options_from_json(base, {{"chunk_size", "big"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(stream_options_from_json(base, nlohmann::json::array()),
                      std::invalid_argument);
}

TEST_CASE("unknown sessions are reported as missing") {
    App app(test_config(), make_bridge(), nullptr);
    REQUIRE(app.handle_session_results("nope").status == 404);
    REQUIRE(app.handle_reset_session("nope").status == 404);
    REQUIRE(app.handle_delete_session("nope").status == 404);
    REQUIRE(app.handle_append_audio("nope", {"audio/wav", ""}).status == 404);
}

TEST_CASE("reset and delete manage the session lifecycle") {
    App app(test_config(), make_bridge(), nullptr);
    const auto id = app.handle_create_session({{"use_vad", false}}).body["session_id"]
                        .get<std::string>();
    const auto other = app.handle_create_session(nlohmann::json::object()).body["session_id"]
                           .get<std::string>();
    REQUIRE(id != other);

    app.handle_append_audio(id, {"application/octet-stream", pcm_bytes(utterance())});
    REQUIRE(eventually(app, id, 1));
    REQUIRE(app.handle_reset_session(id).status == 200);
    REQUIRE(app.handle_session_results(id).body["interim"].empty());

    const auto deleted = app.handle_delete_session(id);
    REQUIRE(deleted.status == 200);
    REQUIRE(deleted.body["final"].size() == 1);
    REQUIRE(app.session_count() == 1);
    REQUIRE(app.handle_session_results(id).status == 404);

    app.stop();
    app.stop();
    REQUIRE(app.session_count() == 0);
}

TEST_CASE("session creation stops at the configured limit") {
    auto config = test_config();
    config.max_sessions = 2;
    App app(config, make_bridge(), nullptr);
    const auto first = app.handle_create_session(nlohmann::json::object());
    REQUIRE(first.status == 201);
    REQUIRE(app.handle_create_session(nlohmann::json::object()).status == 201);

    const auto refused = app.handle_create_session(nlohmann::json::object());
    REQUIRE(refused.status == 503);
    REQUIRE(refused.body["message"] == "session limit reached");
    REQUIRE(app.session_count() == 2);

    REQUIRE(app.handle_delete_session(first.body["session_id"].get<std::string>()).status == 200);
    REQUIRE(app.handle_create_session(nlohmann::json::object()).status == 201);
    REQUIRE(app.session_count() == 2);
    app.stop();
}

TEST_CASE("offline segmentation needs an oracle") {
    const auto clip = audio::encode_wav(tone(32000), 16000);

    App without(test_config(), make_bridge(), nullptr);
    REQUIRE(without.handle_segment({"audio/wav", clip}).status == 503);

    vad::Timeline timeline;
    timeline.add(vad::Segment{0.5, 1.5, 0.9});
    auto oracle = std::make_shared<ScriptedOracle>(timeline);
    App with(test_config(), make_bridge(), oracle);
    const auto response = with.handle_segment({"audio/wav", clip});
    REQUIRE(response.status == 200);
    REQUIRE(response.body["segments"].size() == 1);
    REQUIRE(response.body["segments"][0]["end"] == 1.5);
    REQUIRE(response.body["segments"][0]["samples"] == 24000);

    REQUIRE_THROWS_AS(with.handle_segment({"audio/wav", audio::encode_wav(tone(8000), 16000)}),
                      std::invalid_argument);
}
