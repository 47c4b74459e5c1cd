#include "gigastream/vad/pipeline.hpp"

#include <exception>
#include <map>
#include <mutex>

#include "gigastream/logging.hpp"
#include "gigastream/utils/http.hpp"
#include "gigastream/vad/silero_oracle.hpp"

namespace gigastream {
namespace vad {

namespace {

std::mutex& cache_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::map<std::string, std::shared_ptr<VadOracle>>& cache() {
    static std::map<std::string, std::shared_ptr<VadOracle>> pipelines;
    return pipelines;
}

void ensure_model_file(const PipelineSettings& settings, const std::string& token) {
    if (std::filesystem::exists(settings.model_path)) {
        return;
    }
    if (settings.model_url.empty()) {
        throw VadPipelineError("VAD model not found and no download URL configured: " +
                               settings.model_path.string());
    }
    logging::info(
        "Downloading VAD model",
        {kv("url", settings.model_url),
         kv("path", settings.model_path.string())});
    const utils::HeaderList headers = {{"Authorization", "Bearer " + token}};
    try {
        utils::download_file(settings.model_url, settings.model_path, headers);
    } catch (const std::exception& ex) {
        throw VadPipelineError("Failed to download VAD model from " + settings.model_url + ": " +
                               ex.what());
    }
}

}

std::shared_ptr<VadOracle> get_pipeline(const std::string& device,
                                        const PipelineSettings& settings) {
    std::lock_guard<std::mutex> lock(cache_mutex());
    auto& pipelines = cache();
    auto it = pipelines.find(device);
    if (it != pipelines.end()) {
        return it->second;
    }

    if (!settings.hf_token || settings.hf_token->empty()) {
        throw VadCredentialError("HF_TOKEN is not set, VAD is unavailable");
    }
    ensure_model_file(settings, *settings.hf_token);

    std::shared_ptr<VadOracle> oracle;
    try {
        SileroSettings silero;
        silero.sampling_rate = settings.sampling_rate;
        oracle = std::make_shared<SileroVadOracle>(settings.model_path, silero, device);
    } catch (const std::exception& ex) {
        throw VadPipelineError(std::string("Failed to load VAD model: ") + ex.what());
    }
    logging::info(
        "VAD pipeline ready",
        {kv("device", device),
         kv("model", settings.model_path.string())});
    pipelines.emplace(device, oracle);
    return oracle;
}

void clear_pipeline_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex());
    cache().clear();
}

}
}
