#include "gigastream/app.hpp"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include "gigastream/asr/model.hpp"
#include "gigastream/audio/wav.hpp"
#include "gigastream/logging.hpp"
#include "gigastream/vad/pipeline.hpp"
#include "gigastream/vad/segmenter.hpp"

namespace gigastream {

namespace {

bool is_wav_upload(const AudioUpload& upload) {
    return upload.content_type.rfind("audio/wav", 0) == 0 ||
           upload.content_type.rfind("audio/x-wav", 0) == 0 ||
           upload.content_type.rfind("audio/wave", 0) == 0;
}

audio::WavAudio decode_upload(const AudioUpload& upload) {
    try {
        return audio::decode_wav(upload.body);
    } catch (const audio::WavError& ex) {
        throw std::invalid_argument(ex.what());
    }
}

template <typename T>
void override_option(const nlohmann::json& overrides, const char* key, T& target) {
    const auto it = overrides.find(key);
    if (it != overrides.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

}

stream::StreamOptions stream_options_from_json(const stream::StreamOptions& base,
                                               const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        throw std::invalid_argument("session options must be a JSON object");
    }
    auto options = base;
    try {
        override_option(overrides, "chunk_size", options.chunk_size);
        override_option(overrides, "buffer_size", options.buffer_size);
        override_option(overrides, "energy_threshold", options.energy_threshold);
        override_option(overrides, "min_silence_duration", options.min_silence_duration);
        override_option(overrides, "stabilization_frames", options.stabilization_frames);
        override_option(overrides, "use_vad", options.use_vad);
        override_option(overrides, "vad_threshold", options.vad_threshold);
        override_option(overrides, "force_speech", options.force_speech);
    } catch (const nlohmann::json::exception& ex) {
        throw std::invalid_argument(std::string("invalid session option: ") + ex.what());
    }
    options.validate();
    return options;
}

App::App(Config config)
    : config_(std::move(config)) {}

App::App(Config config,
         std::shared_ptr<stream::TranscriptionBridge> bridge,
         std::shared_ptr<vad::VadOracle> oracle)
    : config_(std::move(config)),
      bridge_(std::move(bridge)),
      vad_oracle_(std::move(oracle)) {}

App::~App() {
    stop();
}

void App::init() {
    if (!bridge_) {
        init_model();
    }
    if (!vad_oracle_) {
        init_vad();
    }
    rest_server_ = std::make_unique<RestServer>(config_, make_handlers());
    rest_server_->start();
}

void App::init_model() {
    asr::ModelSettings settings;
    settings.encoder_path = config_.asr_encoder_path;
    settings.ctc_head_path = config_.asr_ctc_head_path;
    settings.rnnt_decoder_path = config_.asr_rnnt_decoder_path;
    settings.rnnt_joint_path = config_.asr_rnnt_joint_path;
    settings.vocab_path = config_.asr_vocab_path;
    settings.feat_in = config_.asr_feat_in;
    settings.device = config_.device;
    bridge_ = std::make_shared<stream::TranscriptionBridge>(asr::AsrModel::load(settings));
}

void App::init_vad() {
    if (!config_.use_vad) {
        logging::info("VAD disabled, sessions use energy detection");
        return;
    }
    vad::PipelineSettings settings;
    settings.hf_token = config_.hf_token;
    settings.model_path = config_.vad_model_path;
    settings.model_url = config_.vad_model_url;
    settings.sampling_rate = config_.sample_rate;
    try {
        vad_oracle_ = vad::get_pipeline(config_.device, settings);
    } catch (const vad::VadCredentialError& ex) {
        logging::warn(
            "VAD credential missing, VAD disabled",
            {kv("error", ex.what())});
    } catch (const vad::VadPipelineError& ex) {
        logging::warn(
            "Failed to load VAD pipeline, VAD disabled",
            {kv("error", ex.what())});
    }
}

void App::run() {
    std::unique_lock<std::mutex> lock(quit_mutex_);
    quit_cv_.wait(lock, [this]() { return quitting_.load(); });
}

void App::stop() {
    {
        std::lock_guard<std::mutex> lock(quit_mutex_);
        if (quitting_.exchange(true)) {
            return;
        }
    }
    quit_cv_.notify_all();
    if (rest_server_) {
        rest_server_->stop();
    }
    std::unordered_map<std::string, std::shared_ptr<stream::StreamSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& entry : sessions) {
        entry.second->stop();
    }
    logging::info("Application stopped", {kv("sessions_closed", sessions.size())});
}

const Config& App::config() const {
    return config_;
}

std::shared_ptr<vad::VadOracle> App::vad_oracle() const {
    return vad_oracle_;
}

size_t App::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::string App::next_session_id() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(16) << generator();
    out << '-' << std::dec << ++session_counter_;
    return out.str();
}

std::shared_ptr<stream::StreamSession> App::find_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

RestResponse App::handle_create_session(const nlohmann::json& body) {
    if (!bridge_) {
        throw std::runtime_error("ASR model is not loaded");
    }
    auto options = stream_options_from_json(config_.stream_options(), body);
    const auto session_id = next_session_id();
    options.label = session_id;
    std::shared_ptr<stream::StreamSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.size() >= static_cast<size_t>(config_.max_sessions)) {
            logging::warn("Session limit reached", {kv("max_sessions", config_.max_sessions)});
            return {503, {{"message", "session limit reached"}}};
        }
        session = std::make_shared<stream::StreamSession>(options, bridge_, vad_oracle_);
        sessions_.emplace(session_id, session);
    }
    logging::info(
        "Session created",
        {kv("session_id", session_id),
         kv("detector", session->detector_name())});
    return {201, {{"session_id", session_id}, {"detector", session->detector_name()}}};
}

RestResponse App::handle_append_audio(const std::string& session_id, const AudioUpload& upload) {
    auto session = find_session(session_id);
    if (!session) {
        return {404, {{"message", "session not found"}}};
    }
    size_t samples = 0;
    if (is_wav_upload(upload)) {
        const auto wav = decode_upload(upload);
        if (wav.sample_rate != session->options().sample_rate) {
            throw std::invalid_argument("WAV sample rate " + std::to_string(wav.sample_rate) +
                                        " does not match session rate " +
                                        std::to_string(session->options().sample_rate));
        }
        samples = wav.samples.size();
        session->append(wav.samples);
    } else {
        const auto pcm = audio::pcm16_from_bytes(upload.body);
        samples = pcm.size();
        session->append(pcm);
    }
    logging::trace(
        "Audio appended",
        {kv("session_id", session_id),
         kv("samples", samples)});
    return {202, {{"accepted_samples", samples}}};
}

RestResponse App::handle_session_results(const std::string& session_id) {
    auto session = find_session(session_id);
    if (!session) {
        return {404, {{"message", "session not found"}}};
    }
    return {200,
            {{"interim", stream::to_json(session->interim_results())},
             {"final", stream::to_json(session->final_results())}}};
}

RestResponse App::handle_reset_session(const std::string& session_id) {
    auto session = find_session(session_id);
    if (!session) {
        return {404, {{"message", "session not found"}}};
    }
    session->reset();
    return {200, {{"message", "ok"}}};
}

RestResponse App::handle_delete_session(const std::string& session_id) {
    std::shared_ptr<stream::StreamSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return {404, {{"message", "session not found"}}};
        }
        session = it->second;
        sessions_.erase(it);
    }
    session->stop();
    logging::info("Session closed", {kv("session_id", session_id)});
    return {200, {{"message", "ok"}, {"final", stream::to_json(session->final_results())}}};
}

RestResponse App::handle_segment(const AudioUpload& upload) {
    if (!vad_oracle_) {
        return {503, {{"message", "VAD is unavailable"}}};
    }
    const auto wav = decode_upload(upload);
    const auto count = static_cast<int64_t>(wav.samples.size());
    const auto tensor = asr::Tensor::floats(wav.samples, {count});

    vad::SegmentOptions options;
    options.min_duration = config_.segment_min_duration;
    options.max_duration = config_.segment_max_duration;
    options.new_chunk_threshold = config_.segment_new_chunk_threshold;
    const auto segments = vad::segment_audio(tensor, wav.sample_rate, *vad_oracle_, options);

    nlohmann::json boundaries = nlohmann::json::array();
    for (const auto& segment : segments) {
        boundaries.push_back(nlohmann::json{{"start", segment.start},
                                            {"end", segment.end},
                                            {"samples", segment.samples.numel()}});
    }
    return {200, {{"segments", boundaries}}};
}

RestHandlers App::make_handlers() {
    RestHandlers handlers;
    handlers.create_session = [this](const nlohmann::json& body) {
        return handle_create_session(body);
    };
    handlers.append_audio = [this](const std::string& id, const AudioUpload& upload) {
        return handle_append_audio(id, upload);
    };
    handlers.session_results = [this](const std::string& id) {
        return handle_session_results(id);
    };
    handlers.reset_session = [this](const std::string& id) {
        return handle_reset_session(id);
    };
    handlers.delete_session = [this](const std::string& id) {
        return handle_delete_session(id);
    };
    handlers.segment = [this](const AudioUpload& upload) {
        return handle_segment(upload);
    };
    return handlers;
}

}
