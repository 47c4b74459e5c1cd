#include "gigastream/stream/ingestor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "gigastream/audio/wav.hpp"
#include "gigastream/logging.hpp"
#include "gigastream/metrics.hpp"

namespace gigastream::stream {

void normalize_peak(std::vector<float>& chunk) {
    float peak = 0.0f;
    for (auto sample : chunk) {
        peak = std::max(peak, std::abs(sample));
    }
    if (peak > 1.0f) {
        for (auto& sample : chunk) {
            sample /= peak;
        }
    }
}

AudioIngestor::AudioIngestor(size_t max_samples)
    : max_samples_(max_samples) {}

void AudioIngestor::append(std::vector<float> chunk) {
    if (chunk.empty()) {
        return;
    }
    normalize_peak(chunk);

    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total_samples_ += chunk.size();
        chunks_.push_back(std::move(chunk));
        while (total_samples_ > max_samples_ && !chunks_.empty()) {
            evicted += chunks_.front().size();
            total_samples_ -= chunks_.front().size();
            chunks_.pop_front();
        }
    }
    cv_.notify_one();

    Metrics::instance().increment_chunks_appended();
    if (evicted > 0) {
        Metrics::instance().add_evicted_samples(evicted);
        logging::debug(
            "Stream buffer overflow, oldest audio dropped",
            {kv("evicted_samples", evicted),
             kv("max_samples", max_samples_)});
    }
}

void AudioIngestor::append(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return;
    }
    append(std::vector<float>(samples, samples + count));
}

void AudioIngestor::append(const std::vector<int16_t>& pcm) {
    append(audio::pcm16_to_float(pcm));
}

void AudioIngestor::append(const asr::Tensor& tensor) {
    if (tensor.dtype != asr::DType::Float32) {
        throw std::invalid_argument("audio tensor must be float32");
    }
    const bool mono = tensor.rank() == 1 || (tensor.rank() == 2 && tensor.dim(0) == 1);
    if (!mono) {
        throw std::invalid_argument("audio tensor must be 1-D or [1, N], got " +
                                    asr::shape_to_string(tensor.shape));
    }
    append(tensor.values);
}

std::vector<float> AudioIngestor::drain_locked() {
    std::vector<float> audio;
    audio.reserve(total_samples_);
    for (const auto& chunk : chunks_) {
        audio.insert(audio.end(), chunk.begin(), chunk.end());
    }
    chunks_.clear();
    total_samples_ = 0;
    return audio;
}

std::vector<float> AudioIngestor::drain_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return drain_locked();
}

std::vector<float> AudioIngestor::wait_and_drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return wake_ || !chunks_.empty(); });
    wake_ = false;
    return drain_locked();
}

std::vector<float> AudioIngestor::wait_and_drain(std::chrono::milliseconds timeout,
                                                 uint64_t& generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return wake_ || !chunks_.empty(); });
    wake_ = false;
    generation = generation_;
    return drain_locked();
}

void AudioIngestor::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.clear();
        total_samples_ = 0;
        ++generation_;
        wake_ = true;
    }
    cv_.notify_all();
}

void AudioIngestor::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_ = true;
    }
    cv_.notify_all();
}

size_t AudioIngestor::buffered_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_samples_;
}

size_t AudioIngestor::buffered_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

size_t AudioIngestor::max_samples() const {
    return max_samples_;
}

uint64_t AudioIngestor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}
