#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "gigastream/asr/tensor.hpp"
#include "gigastream/stream/ingestor.hpp"
#include "gigastream/stream/options.hpp"
#include "gigastream/stream/results.hpp"
#include "gigastream/stream/segmentation.hpp"
#include "gigastream/stream/transcriber.hpp"
#include "gigastream/vad/oracle.hpp"

namespace gigastream {
namespace stream {

// One live audio stream: producers append, a background worker segments and
// transcribes. The worker starts in the constructor.
class StreamSession {
public:
    StreamSession(StreamOptions options,
                  std::shared_ptr<TranscriptionBridge> bridge,
                  std::shared_ptr<vad::VadOracle> oracle = nullptr);
    StreamSession(StreamOptions options,
                  SegmentationStateMachine::RecognizeFn recognize,
                  std::shared_ptr<vad::VadOracle> oracle = nullptr);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    void append(std::vector<float> chunk);
    void append(const float* samples, size_t count);
    void append(const std::vector<int16_t>& pcm);
    void append(const asr::Tensor& tensor);

    std::vector<TranscriptionResult> final_results() const;
    std::vector<TranscriptionResult> interim_results() const;

    void reset();
    void stop();
    bool is_running() const;

    const StreamOptions& options() const;
    std::string detector_name() const;
    size_t buffered_samples() const;

private:
    struct State;

    static void run_worker(std::shared_ptr<State> state);

    StreamOptions options_;
    std::shared_ptr<State> state_;
    std::thread worker_;
    std::future<void> exited_;
    std::mutex stop_mutex_;
    bool stopped_ = false;
};

}
}
