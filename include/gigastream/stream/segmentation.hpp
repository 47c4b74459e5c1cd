#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "gigastream/stream/options.hpp"
#include "gigastream/stream/results.hpp"
#include "gigastream/vad/detector.hpp"

namespace gigastream {
namespace stream {

enum class SegmentState {
    Idle,
    Speaking
};

const char* to_string(SegmentState state);

// Classifies fixed-size sub-chunks as speech or silence and turns speech runs
// into interim and final results. Not thread-safe; the owning session
// serializes access.
class SegmentationStateMachine {
public:
    using RecognizeFn = std::function<std::string(const std::vector<float>&)>;
    using KeepRunningFn = std::function<bool()>;

    SegmentationStateMachine(const StreamOptions& options,
                             std::unique_ptr<vad::SpeechDetector> detector,
                             RecognizeFn recognize,
                             ResultSink& sink);

    // Returns the number of samples consumed before keep_running turned false.
    size_t process(const std::vector<float>& block, const KeepRunningFn& keep_running = {});
    void process_subchunk(const std::vector<float>& piece);
    void reset();

    SegmentState state() const;
    size_t run_samples() const;
    size_t run_chunks() const;
    size_t silence_samples() const;
    uint64_t stream_position() const;
    const vad::SpeechDetector& detector() const;

private:
    std::vector<float> concatenate_run() const;
    std::string recognize_safely(const std::vector<float>& audio, bool is_final);
    void emit_interim();
    void finalize();

    int sample_rate_;
    size_t chunk_size_;
    size_t min_silence_samples_;
    size_t stabilization_frames_;
    std::unique_ptr<vad::SpeechDetector> detector_;
    RecognizeFn recognize_;
    ResultSink& sink_;

    SegmentState state_ = SegmentState::Idle;
    std::vector<std::vector<float>> run_;
    size_t run_samples_ = 0;
    uint64_t run_start_ = 0;
    size_t silence_samples_ = 0;
    uint64_t position_ = 0;
};

}
}
