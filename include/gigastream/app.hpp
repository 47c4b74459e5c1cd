#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "gigastream/config.hpp"
#include "gigastream/server/rest_server.hpp"
#include "gigastream/stream/session.hpp"
#include "gigastream/stream/transcriber.hpp"
#include "gigastream/vad/oracle.hpp"

namespace gigastream {

// Owns the shared model, the VAD oracle and the live stream sessions, and
// serves them over REST.
class App {
public:
    explicit App(Config config);
    App(Config config,
        std::shared_ptr<stream::TranscriptionBridge> bridge,
        std::shared_ptr<vad::VadOracle> oracle);
    ~App();

    void init();
    void run();
    void stop();

    const Config& config() const;
    std::shared_ptr<vad::VadOracle> vad_oracle() const;
    size_t session_count() const;

    RestResponse handle_create_session(const nlohmann::json& body);
    RestResponse handle_append_audio(const std::string& session_id, const AudioUpload& upload);
    RestResponse handle_session_results(const std::string& session_id);
    RestResponse handle_reset_session(const std::string& session_id);
    RestResponse handle_delete_session(const std::string& session_id);
    RestResponse handle_segment(const AudioUpload& upload);

private:
    void init_model();
    void init_vad();
    std::shared_ptr<stream::StreamSession> find_session(const std::string& session_id) const;
    std::string next_session_id();
    RestHandlers make_handlers();

    Config config_;
    std::shared_ptr<stream::TranscriptionBridge> bridge_;
    std::shared_ptr<vad::VadOracle> vad_oracle_;
    std::unordered_map<std::string, std::shared_ptr<stream::StreamSession>> sessions_;
    mutable std::mutex sessions_mutex_;
    std::atomic<uint64_t> session_counter_{0};
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
    std::mutex quit_mutex_;
    std::condition_variable quit_cv_;
};

// Applies JSON overrides (snake_case option names) on top of base options.
stream::StreamOptions stream_options_from_json(const stream::StreamOptions& base,
                                               const nlohmann::json& overrides);

}
