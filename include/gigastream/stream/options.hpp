#pragma once

#include <chrono>
#include <string>

#include "gigastream/stream/results.hpp"

namespace gigastream {
namespace stream {

struct StreamOptions {
    int sample_rate = 16000;
    int chunk_size = 4000;
    int buffer_size = 30; // seconds
    double energy_threshold = 0.01;
    double min_silence_duration = 0.8; // seconds
    int stabilization_frames = 5;
    bool use_vad = true;
    double vad_threshold = 0.5;
    double vad_window_sec = 3.0;
    double vad_tail_sec = 0.5;
    // Classify every sub-chunk as speech regardless of the detector.
    bool force_speech = false;
    std::chrono::milliseconds poll_interval{10};
    std::chrono::milliseconds stop_timeout{1000};
    // Added to the session's log lines.
    std::string label;
    ResultCallback callback;

    size_t max_buffer_samples() const;
    size_t min_silence_samples() const;
    size_t vad_window_samples() const;

    void validate() const;
};

}
}
