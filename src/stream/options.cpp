#include "gigastream/stream/options.hpp"

#include <stdexcept>

namespace gigastream::stream {

size_t StreamOptions::max_buffer_samples() const {
    return static_cast<size_t>(buffer_size) * static_cast<size_t>(sample_rate);
}

size_t StreamOptions::min_silence_samples() const {
    return static_cast<size_t>(min_silence_duration * sample_rate);
}

size_t StreamOptions::vad_window_samples() const {
    return static_cast<size_t>(vad_window_sec * sample_rate);
}

void StreamOptions::validate() const {
    if (sample_rate <= 0) {
        throw std::invalid_argument("sample_rate must be positive");
    }
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (buffer_size <= 0) {
        throw std::invalid_argument("buffer_size must be positive");
    }
    if (stabilization_frames <= 0) {
        throw std::invalid_argument("stabilization_frames must be positive");
    }
    if (energy_threshold < 0.0) {
        throw std::invalid_argument("energy threshold must not be negative");
    }
    if (min_silence_duration < 0.0) {
        throw std::invalid_argument("min_silence_duration must not be negative");
    }
    if (vad_threshold < 0.0) {
        throw std::invalid_argument("vad_threshold must not be negative");
    }
    if (vad_window_sec <= 0.0 || vad_tail_sec < 0.0) {
        throw std::invalid_argument("vad window must be positive");
    }
    if (poll_interval.count() <= 0 || stop_timeout.count() < 0) {
        throw std::invalid_argument("poll_interval must be positive");
    }
}

}
