#include "gigastream/vad/silero_oracle.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "gigastream/audio/wav.hpp"
#include "gigastream/logging.hpp"

namespace gigastream {
namespace vad {

namespace {

struct Span {
    int64_t start = 0;
    int64_t end = 0;
    std::optional<double> score;
};

double mean_probability(const std::vector<float>& probabilities,
                        int64_t start,
                        int64_t end,
                        int window_samples) {
    const auto first = static_cast<size_t>(start / window_samples);
    const auto last = std::min(probabilities.size(),
                               static_cast<size_t>((end + window_samples - 1) / window_samples));
    double sum = 0.0;
    size_t count = 0;
    for (size_t i = first; i < last; ++i) {
        sum += probabilities[i];
        ++count;
    }
    return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

}

Timeline probabilities_to_timeline(const std::vector<float>& probabilities,
                                   int window_samples,
                                   size_t total_samples,
                                   const SileroSettings& settings) {
    if (window_samples <= 0 || settings.sampling_rate <= 0) {
        throw std::invalid_argument("invalid VAD window settings");
    }
    const int64_t sr = settings.sampling_rate;
    const int64_t audio_length = static_cast<int64_t>(total_samples);
    const int64_t min_speech_samples = sr * settings.min_speech_ms / 1000;
    const int64_t min_silence_samples = sr * settings.min_silence_ms / 1000;
    const int64_t speech_pad_samples = sr * settings.speech_pad_ms / 1000;
    const float neg_threshold = settings.threshold - 0.15f;

    std::vector<Span> spans;
    Span current;
    bool triggered = false;
    int64_t temp_end = 0;

    for (size_t i = 0; i < probabilities.size(); ++i) {
        const float prob = probabilities[i];
        const int64_t position = static_cast<int64_t>(i) * window_samples;
        if (prob >= settings.threshold && temp_end != 0) {
            temp_end = 0;
        }
        if (prob >= settings.threshold && !triggered) {
            triggered = true;
            current = Span{};
            current.start = position;
            continue;
        }
        if (prob < neg_threshold && triggered) {
            if (temp_end == 0) {
                temp_end = position;
            }
            if (position - temp_end < min_silence_samples) {
                continue;
            }
            current.end = temp_end;
            if (current.end - current.start > min_speech_samples) {
                spans.push_back(current);
            }
            current = Span{};
            temp_end = 0;
            triggered = false;
        }
    }
    if (triggered && audio_length - current.start > min_speech_samples) {
        current.end = audio_length;
        spans.push_back(current);
    }

    for (auto& span : spans) {
        span.score = mean_probability(probabilities, span.start, span.end, window_samples);
    }

    for (size_t i = 0; i < spans.size(); ++i) {
        if (i == 0) {
            spans[i].start = std::max<int64_t>(0, spans[i].start - speech_pad_samples);
        }
        if (i + 1 < spans.size()) {
            const int64_t silence = spans[i + 1].start - spans[i].end;
            if (silence < 2 * speech_pad_samples) {
                spans[i].end += silence / 2;
                spans[i + 1].start = std::max<int64_t>(0, spans[i + 1].start - silence / 2);
            } else {
                spans[i].end = std::min(audio_length, spans[i].end + speech_pad_samples);
                spans[i + 1].start = std::max<int64_t>(0, spans[i + 1].start - speech_pad_samples);
            }
        } else {
            spans[i].end = std::min(audio_length, spans[i].end + speech_pad_samples);
        }
    }

    Timeline timeline;
    for (const auto& span : spans) {
        Segment segment;
        segment.start = static_cast<double>(span.start) / static_cast<double>(sr);
        segment.end = static_cast<double>(span.end) / static_cast<double>(sr);
        segment.score = span.score;
        timeline.add(segment);
    }
    return timeline;
}

SileroVadOracle::SileroVadOracle(std::filesystem::path model_path,
                                 SileroSettings settings,
                                 const std::string& device)
    : model_path_(std::move(model_path)),
      settings_(settings),
      model_(std::make_unique<VadModel>(model_path_, settings_.sampling_rate, device)),
      device_(device) {}

Timeline SileroVadOracle::detect(const std::string& wav_bytes) {
    const auto wav = audio::decode_wav(wav_bytes);
    if (wav.sample_rate != settings_.sampling_rate) {
        throw std::runtime_error("VAD expects " + std::to_string(settings_.sampling_rate) +
                                 " Hz audio, got " + std::to_string(wav.sample_rate));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const int window = model_->window_size_samples();
    auto state = model_->initialize_state();
    std::vector<float> probabilities;
    probabilities.reserve(wav.samples.size() / static_cast<size_t>(window) + 1);
    std::vector<float> chunk(static_cast<size_t>(window));
    for (size_t offset = 0; offset < wav.samples.size(); offset += static_cast<size_t>(window)) {
        const size_t count = std::min(static_cast<size_t>(window), wav.samples.size() - offset);
        std::fill(chunk.begin(), chunk.end(), 0.0f);
        std::copy(wav.samples.begin() + static_cast<std::ptrdiff_t>(offset),
                  wav.samples.begin() + static_cast<std::ptrdiff_t>(offset + count),
                  chunk.begin());
        probabilities.push_back(model_->get_speech_prob(chunk, &state));
    }

    auto timeline = probabilities_to_timeline(probabilities, window, wav.samples.size(), settings_);
    logging::trace(
        "VAD timeline computed",
        {kv("windows", probabilities.size()),
         kv("segments", timeline.segments().size())});
    return timeline;
}

void SileroVadOracle::to(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (device == device_) {
        return;
    }
    model_ = std::make_unique<VadModel>(model_path_, settings_.sampling_rate, device);
    device_ = device;
    logging::info("VAD model moved", {kv("device", device)});
}

std::string SileroVadOracle::device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_;
}

const SileroSettings& SileroVadOracle::settings() const {
    return settings_;
}

}
}
