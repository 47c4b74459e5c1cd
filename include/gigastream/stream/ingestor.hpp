#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "gigastream/asr/tensor.hpp"

namespace gigastream {
namespace stream {

// Thread-safe FIFO of appended audio chunks capped at max_samples. Overflow
// evicts whole chunks from the front.
class AudioIngestor {
public:
    explicit AudioIngestor(size_t max_samples);

    void append(std::vector<float> chunk);
    void append(const float* samples, size_t count);
    void append(const std::vector<int16_t>& pcm);
    void append(const asr::Tensor& tensor);

    std::vector<float> drain_all();
    std::vector<float> wait_and_drain(std::chrono::milliseconds timeout);
    // Also reports the clear generation the drained audio was appended in.
    std::vector<float> wait_and_drain(std::chrono::milliseconds timeout, uint64_t& generation);
    // Drops buffered audio and starts a new generation.
    void clear();
    void notify();

    size_t buffered_samples() const;
    size_t buffered_chunks() const;
    size_t max_samples() const;
    uint64_t generation() const;

private:
    std::vector<float> drain_locked();

    const size_t max_samples_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<float>> chunks_;
    size_t total_samples_ = 0;
    uint64_t generation_ = 0;
    bool wake_ = false;
};

// Divides by the peak when it exceeds 1.0; leaves quieter audio untouched.
void normalize_peak(std::vector<float>& chunk);

}
}
