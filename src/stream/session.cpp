#include "gigastream/stream/session.hpp"

#include <stdexcept>

#include "gigastream/logging.hpp"

namespace gigastream::stream {

namespace {

SegmentationStateMachine::RecognizeFn bridge_recognizer(
    std::shared_ptr<TranscriptionBridge> bridge) {
    if (!bridge) {
        throw std::invalid_argument("StreamSession requires a transcription bridge");
    }
    return [bridge](const std::vector<float>& samples) {
        return bridge->recognize(samples);
    };
}

}

struct StreamSession::State {
    State(const StreamOptions& options,
          SegmentationStateMachine::RecognizeFn recognize,
          std::shared_ptr<vad::VadOracle> oracle)
        : log(options.label.empty() ? logging::Fields{}
                                    : logging::Fields{kv("session", options.label)}),
          poll_interval(options.poll_interval),
          ingestor(options.max_buffer_samples()),
          sink(options.callback),
          machine(options,
                  vad::make_detector(options, std::move(oracle)),
                  std::move(recognize),
                  sink),
          detector_name(machine.detector().name()) {}

    const logging::Scope log;
    const std::chrono::milliseconds poll_interval;
    AudioIngestor ingestor;
    ResultSink sink;
    // Only the worker thread touches the machine once it has started.
    SegmentationStateMachine machine;
    const std::string detector_name;
    std::atomic<bool> running{true};
    std::promise<void> exited;
};

StreamSession::StreamSession(StreamOptions options,
                             std::shared_ptr<TranscriptionBridge> bridge,
                             std::shared_ptr<vad::VadOracle> oracle)
    : StreamSession(std::move(options), bridge_recognizer(std::move(bridge)),
                    std::move(oracle)) {}

StreamSession::StreamSession(StreamOptions options,
                             SegmentationStateMachine::RecognizeFn recognize,
                             std::shared_ptr<vad::VadOracle> oracle)
    : options_(std::move(options)) {
    options_.validate();
    state_ = std::make_shared<State>(options_, std::move(recognize), std::move(oracle));
    exited_ = state_->exited.get_future();
    state_->log.info(
        "Stream session started",
        {kv("sample_rate", options_.sample_rate),
         kv("chunk_size", options_.chunk_size),
         kv("detector", state_->detector_name)});
    worker_ = std::thread(&StreamSession::run_worker, state_);
}

StreamSession::~StreamSession() {
    stop();
}

void StreamSession::run_worker(std::shared_ptr<State> state) {
    try {
        uint64_t applied = state->ingestor.generation();
        while (state->running) {
            uint64_t generation = applied;
            auto block = state->ingestor.wait_and_drain(state->poll_interval, generation);
            if (generation != applied) {
                // reset() cleared the ingestor; the run state follows here, on
                // the thread that owns it.
                state->machine.reset();
                state->sink.clear_interim();
                applied = generation;
                state->log.debug("Applied session reset", {kv("generation", generation)});
            }
            if (block.empty()) {
                continue;
            }
            state->log.trace("Processing buffered audio", {kv("samples", block.size())});
            // A reset while the block is in flight discards the rest of it.
            state->machine.process(block, [&state, generation]() {
                return state->running && state->ingestor.generation() == generation;
            });
        }
    } catch (const std::exception& ex) {
        state->log.error("Stream worker failed", {kv("error", ex.what())});
    }
    state->running = false;
    state->exited.set_value();
}

void StreamSession::append(std::vector<float> chunk) {
    state_->ingestor.append(std::move(chunk));
}

void StreamSession::append(const float* samples, size_t count) {
    state_->ingestor.append(samples, count);
}

void StreamSession::append(const std::vector<int16_t>& pcm) {
    state_->ingestor.append(pcm);
}

void StreamSession::append(const asr::Tensor& tensor) {
    state_->ingestor.append(tensor);
}

std::vector<TranscriptionResult> StreamSession::final_results() const {
    return state_->sink.final_results();
}

std::vector<TranscriptionResult> StreamSession::interim_results() const {
    return state_->sink.interim_results();
}

void StreamSession::reset() {
    state_->ingestor.clear();
    state_->sink.clear_interim();
    state_->log.debug("Stream session reset requested");
}

void StreamSession::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;
    state_->running = false;
    state_->ingestor.notify();

    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        // Called from a result callback; the worker exits after the callback returns.
        worker_.detach();
        state_->log.info("Stream session stopping from its own worker");
        return;
    }
    if (exited_.wait_for(options_.stop_timeout) == std::future_status::ready) {
        worker_.join();
        state_->log.info("Stream session stopped");
    } else {
        state_->log.warn(
            "Stream worker did not stop in time, detaching",
            {kv("timeout_ms", options_.stop_timeout.count())});
        worker_.detach();
    }
}

bool StreamSession::is_running() const {
    return state_->running && exited_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

const StreamOptions& StreamSession::options() const {
    return options_;
}

std::string StreamSession::detector_name() const {
    return state_->detector_name;
}

size_t StreamSession::buffered_samples() const {
    return state_->ingestor.buffered_samples();
}

}
