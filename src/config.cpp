#include "gigastream/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gigastream {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::filesystem::path> get_env_path(const char* name) {
    if (auto value = get_env_optional(name)) {
        return std::filesystem::path(*value);
    }
    return std::nullopt;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        value = strip_quotes(value);
        set_env_value(key, value);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.sample_rate = get_env_int("SAMPLE_RATE", 16000);
    config.chunk_size = get_env_int("CHUNK_SIZE", 4000);
    config.buffer_size_sec = get_env_int("BUFFER_SIZE_SEC", 30);
    config.energy_threshold = get_env_double("ENERGY_THRESHOLD", 0.01);
    config.min_silence_duration = get_env_double("MIN_SILENCE_DURATION", 0.8);
    config.stabilization_frames = get_env_int("STABILIZATION_FRAMES", 5);
    config.use_vad = get_env_bool("USE_VAD", true);
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);
    config.vad_window_sec = get_env_double("VAD_WINDOW_SEC", 3.0);
    config.vad_tail_sec = get_env_double("VAD_TAIL_SEC", 0.5);
    config.force_speech = get_env_bool("FORCE_SPEECH", false);
    config.poll_interval_ms = get_env_int("POLL_INTERVAL_MS", 10);
    config.stop_timeout_ms = get_env_int("STOP_TIMEOUT_MS", 1000);

    config.hf_token = get_env_optional("HF_TOKEN");
    config.device = get_env_str("DEVICE", "cpu");
    config.vad_model_path = std::filesystem::path(get_env_str("VAD_MODEL_PATH", cwd.string())) /
                            "silero_vad.onnx";
    config.vad_model_url = get_env_str(
        "VAD_MODEL_URL",
        "https://huggingface.co/onnx-community/silero-vad/resolve/main/onnx/model.onnx");

    config.asr_encoder_path = get_env_str("ASR_ENCODER_PATH", "");
    config.asr_ctc_head_path = get_env_path("ASR_CTC_HEAD_PATH");
    config.asr_rnnt_decoder_path = get_env_path("ASR_RNNT_DECODER_PATH");
    config.asr_rnnt_joint_path = get_env_path("ASR_RNNT_JOINT_PATH");
    config.asr_vocab_path = get_env_str("ASR_VOCAB_PATH", "");
    config.asr_feat_in = get_env_int("ASR_FEAT_IN", 64);

    config.segment_min_duration = get_env_double("SEGMENT_MIN_DURATION", 15.0);
    config.segment_max_duration = get_env_double("SEGMENT_MAX_DURATION", 22.0);
    config.segment_new_chunk_threshold = get_env_double("SEGMENT_NEW_CHUNK_THRESHOLD", 0.2);

    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.max_sessions = get_env_int("MAX_SESSIONS", 64);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    config.log_format = get_env_str("LOG_FORMAT", "text");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    return config;
}

void Config::validate() const {
    stream_options().validate();
    if (asr_encoder_path.empty()) {
        throw std::runtime_error("ASR_ENCODER_PATH is required");
    }
    if (asr_vocab_path.empty()) {
        throw std::runtime_error("ASR_VOCAB_PATH is required");
    }
    if (!asr_ctc_head_path && !(asr_rnnt_decoder_path && asr_rnnt_joint_path)) {
        throw std::runtime_error(
            "ASR_CTC_HEAD_PATH or ASR_RNNT_DECODER_PATH and ASR_RNNT_JOINT_PATH are required");
    }
    if (asr_feat_in <= 0) {
        throw std::runtime_error("ASR_FEAT_IN must be positive");
    }
    if (segment_min_duration < 0.0 || segment_max_duration <= 0.0) {
        throw std::runtime_error("SEGMENT_MIN_DURATION and SEGMENT_MAX_DURATION must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (max_sessions <= 0) {
        throw std::runtime_error("MAX_SESSIONS must be positive");
    }
    std::string format = log_format;
    std::transform(format.begin(), format.end(), format.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (format != "text" && format != "json") {
        throw std::runtime_error("LOG_FORMAT must be text or json");
    }
}

stream::StreamOptions Config::stream_options() const {
    stream::StreamOptions options;
    options.sample_rate = sample_rate;
    options.chunk_size = chunk_size;
    options.buffer_size = buffer_size_sec;
    options.energy_threshold = energy_threshold;
    options.min_silence_duration = min_silence_duration;
    options.stabilization_frames = stabilization_frames;
    options.use_vad = use_vad;
    options.vad_threshold = vad_threshold;
    options.vad_window_sec = vad_window_sec;
    options.vad_tail_sec = vad_tail_sec;
    options.force_speech = force_speech;
    options.poll_interval = std::chrono::milliseconds(poll_interval_ms);
    options.stop_timeout = std::chrono::milliseconds(stop_timeout_ms);
    return options;
}

}
