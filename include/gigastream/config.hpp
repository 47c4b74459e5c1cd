#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "gigastream/stream/options.hpp"

namespace gigastream {

struct Config {
    int sample_rate = 16000;
    int chunk_size = 4000;
    int buffer_size_sec = 30;
    double energy_threshold = 0.01;
    double min_silence_duration = 0.8;
    int stabilization_frames = 5;
    bool use_vad = true;
    double vad_threshold = 0.5;
    double vad_window_sec = 3.0;
    double vad_tail_sec = 0.5;
    bool force_speech = false;
    int poll_interval_ms = 10;
    int stop_timeout_ms = 1000;
    std::optional<std::string> hf_token;
    std::string device = "cpu";
    std::filesystem::path vad_model_path;
    std::string vad_model_url;
    std::filesystem::path asr_encoder_path;
    std::optional<std::filesystem::path> asr_ctc_head_path;
    std::optional<std::filesystem::path> asr_rnnt_decoder_path;
    std::optional<std::filesystem::path> asr_rnnt_joint_path;
    std::filesystem::path asr_vocab_path;
    int asr_feat_in = 64;
    double segment_min_duration = 15.0;
    double segment_max_duration = 22.0;
    double segment_new_chunk_threshold = 0.2;
    int rest_api_port = 8000;
    int max_sessions = 64;
    std::optional<std::string> authorization_token;
    std::string log_level = "INFO";
    std::string log_format = "text"; // text or json
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;

    static Config load();
    void validate() const;
    stream::StreamOptions stream_options() const;
};

}
