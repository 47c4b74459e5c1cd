#include "gigastream/vad/detector.hpp"

#include <chrono>
#include <stdexcept>

#include "gigastream/audio/wav.hpp"
#include "gigastream/logging.hpp"
#include "gigastream/metrics.hpp"

namespace gigastream {
namespace vad {

double mean_square(const std::vector<float>& audio) {
    if (audio.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (auto sample : audio) {
        sum += static_cast<double>(sample) * static_cast<double>(sample);
    }
    return sum / static_cast<double>(audio.size());
}

EnergyDetector::EnergyDetector(double threshold)
    : threshold_(threshold) {}

bool EnergyDetector::is_speech(const std::vector<float>& audio) {
    return mean_square(audio) > threshold_;
}

std::string EnergyDetector::name() const {
    return "energy";
}

double EnergyDetector::threshold() const {
    return threshold_;
}

VadDetector::VadDetector(std::shared_ptr<VadOracle> oracle,
                         int sample_rate,
                         size_t window_samples,
                         double tail_sec,
                         double vad_threshold,
                         double energy_threshold)
    : oracle_(std::move(oracle)),
      sample_rate_(sample_rate),
      window_samples_(window_samples),
      tail_sec_(tail_sec),
      vad_threshold_(vad_threshold),
      fallback_(energy_threshold) {
    if (!oracle_) {
        throw std::invalid_argument("VadDetector requires an oracle");
    }
}

bool VadDetector::is_speech(const std::vector<float>& audio) {
    window_.push_back(audio);
    buffered_ += audio.size();
    logging::trace(
        "VAD window updated",
        {kv("buffered", buffered_),
         kv("target", window_samples_)});
    if (buffered_ < window_samples_) {
        return false;
    }

    std::vector<float> window;
    window.reserve(buffered_);
    for (const auto& piece : window_) {
        window.insert(window.end(), piece.begin(), piece.end());
    }
    if (window.size() > window_samples_) {
        window.erase(window.begin(),
                     window.begin() + static_cast<std::ptrdiff_t>(window.size() - window_samples_));
    }
    buffered_ = window.size();
    window_.clear();
    window_.push_back(window);

    try {
        return classify_window(window_.front());
    } catch (const std::exception& ex) {
        Metrics::instance().increment_vad_fallback();
        logging::warn(
            "VAD inference failed, falling back to energy detection",
            {kv("error", ex.what())});
        return fallback_.is_speech(audio);
    }
}

bool VadDetector::classify_window(const std::vector<float>& window) const {
    const auto wav_bytes = audio::encode_wav(window, sample_rate_);
    const auto started = std::chrono::steady_clock::now();
    const auto timeline = oracle_->detect(wav_bytes);
    Metrics::instance().observe_latency(
        "vad",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    const double window_sec = static_cast<double>(window.size()) / sample_rate_;
    const double tail_start = window_sec - tail_sec_;
    for (const auto& segment : timeline.support()) {
        if (segment.end > tail_start) {
            const double score = segment.score.value_or(1.0);
            logging::trace(
                "VAD tail segment",
                {kv("start", segment.start),
                 kv("end", segment.end),
                 kv("score", score)});
            return score > vad_threshold_;
        }
    }
    return false;
}

void VadDetector::reset() {
    window_.clear();
    buffered_ = 0;
}

std::string VadDetector::name() const {
    return "vad";
}

size_t VadDetector::window_samples() const {
    return window_samples_;
}

size_t VadDetector::buffered_samples() const {
    return buffered_;
}

ForcedSpeechDetector::ForcedSpeechDetector(std::unique_ptr<SpeechDetector> inner)
    : inner_(std::move(inner)) {}

bool ForcedSpeechDetector::is_speech(const std::vector<float>& audio) {
    if (logging::should_log(spdlog::level::trace)) {
        logging::trace(
            "Speech forced",
            {kv("energy", mean_square(audio)),
             kv("detector", inner_ ? inner_->name() : "none")});
    }
    return true;
}

void ForcedSpeechDetector::reset() {
    if (inner_) {
        inner_->reset();
    }
}

std::string ForcedSpeechDetector::name() const {
    return "forced";
}

std::unique_ptr<SpeechDetector> make_detector(const stream::StreamOptions& options,
                                              std::shared_ptr<VadOracle> oracle) {
    std::unique_ptr<SpeechDetector> detector;
    if (options.use_vad && oracle) {
        detector = std::make_unique<VadDetector>(std::move(oracle),
                                                 options.sample_rate,
                                                 options.vad_window_samples(),
                                                 options.vad_tail_sec,
                                                 options.vad_threshold,
                                                 options.energy_threshold);
    } else {
        if (options.use_vad) {
            logging::warn("VAD requested but no oracle is available, using energy detection");
        }
        detector = std::make_unique<EnergyDetector>(options.energy_threshold);
    }
    if (options.force_speech) {
        return std::make_unique<ForcedSpeechDetector>(std::move(detector));
    }
    return detector;
}

}
}
