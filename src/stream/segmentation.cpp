#include "gigastream/stream/segmentation.hpp"

#include <algorithm>
#include <stdexcept>

#include "gigastream/logging.hpp"

namespace gigastream::stream {

const char* to_string(SegmentState state) {
    switch (state) {
    case SegmentState::Idle:
        return "idle";
    case SegmentState::Speaking:
        return "speaking";
    }
    return "unknown";
}

SegmentationStateMachine::SegmentationStateMachine(const StreamOptions& options,
                                                   std::unique_ptr<vad::SpeechDetector> detector,
                                                   RecognizeFn recognize,
                                                   ResultSink& sink)
    : sample_rate_(options.sample_rate),
      chunk_size_(static_cast<size_t>(options.chunk_size)),
      min_silence_samples_(options.min_silence_samples()),
      stabilization_frames_(static_cast<size_t>(options.stabilization_frames)),
      detector_(std::move(detector)),
      recognize_(std::move(recognize)),
      sink_(sink) {
    if (!detector_) {
        throw std::invalid_argument("segmentation requires a speech detector");
    }
    if (!recognize_) {
        throw std::invalid_argument("segmentation requires a recognizer");
    }
    if (sample_rate_ <= 0 || chunk_size_ == 0 || stabilization_frames_ == 0) {
        throw std::invalid_argument("invalid segmentation options");
    }
}

size_t SegmentationStateMachine::process(const std::vector<float>& block,
                                         const KeepRunningFn& keep_running) {
    size_t offset = 0;
    while (offset < block.size()) {
        if (keep_running && !keep_running()) {
            break;
        }
        const size_t end = std::min(offset + chunk_size_, block.size());
        process_subchunk(std::vector<float>(block.begin() + static_cast<std::ptrdiff_t>(offset),
                                            block.begin() + static_cast<std::ptrdiff_t>(end)));
        offset = end;
    }
    return offset;
}

void SegmentationStateMachine::process_subchunk(const std::vector<float>& piece) {
    if (piece.empty()) {
        return;
    }
    const bool speech = detector_->is_speech(piece);
    const uint64_t piece_start = position_;
    position_ += piece.size();
    logging::trace(
        "Sub-chunk classified",
        {kv("samples", piece.size()),
         kv("speech", speech),
         kv("state", to_string(state_)),
         kv("detector", detector_->name())});

    if (speech) {
        if (state_ == SegmentState::Idle) {
            state_ = SegmentState::Speaking;
            run_.clear();
            run_samples_ = 0;
            run_start_ = piece_start;
            logging::debug(
                "Speech started",
                {kv("at_sec", static_cast<double>(piece_start) / sample_rate_)});
        }
        run_.push_back(piece);
        run_samples_ += piece.size();
        silence_samples_ = 0;
        if (run_.size() % stabilization_frames_ == 0) {
            emit_interim();
        }
        return;
    }

    if (state_ == SegmentState::Speaking) {
        run_.push_back(piece);
        run_samples_ += piece.size();
        silence_samples_ += piece.size();
        if (silence_samples_ >= min_silence_samples_) {
            finalize();
        }
    }
}

std::vector<float> SegmentationStateMachine::concatenate_run() const {
    std::vector<float> audio;
    audio.reserve(run_samples_);
    for (const auto& piece : run_) {
        audio.insert(audio.end(), piece.begin(), piece.end());
    }
    return audio;
}

std::string SegmentationStateMachine::recognize_safely(const std::vector<float>& audio,
                                                       bool is_final) {
    try {
        return recognize_(audio);
    } catch (const std::exception& ex) {
        logging::error(
            "Recognition failed",
            {kv("error", ex.what()),
             kv("samples", audio.size()),
             kv("final", is_final)});
        return {};
    }
}

void SegmentationStateMachine::emit_interim() {
    const auto audio = concatenate_run();
    auto text = recognize_safely(audio, false);
    const double start = static_cast<double>(run_start_) / sample_rate_;
    const double end = static_cast<double>(position_) / sample_rate_;
    sink_.emit(make_result(std::move(text), start, end, false));
}

void SegmentationStateMachine::finalize() {
    const auto audio = concatenate_run();
    auto text = recognize_safely(audio, true);
    const double start = static_cast<double>(run_start_) / sample_rate_;
    const double end = static_cast<double>(position_) / sample_rate_;
    logging::debug(
        "Speech finalized",
        {kv("start_sec", start),
         kv("end_sec", end),
         kv("chunks", run_.size())});
    sink_.emit(make_result(std::move(text), start, end, true));

    state_ = SegmentState::Idle;
    run_.clear();
    run_samples_ = 0;
    silence_samples_ = 0;
    detector_->reset();
}

void SegmentationStateMachine::reset() {
    state_ = SegmentState::Idle;
    run_.clear();
    run_samples_ = 0;
    run_start_ = position_;
    silence_samples_ = 0;
    detector_->reset();
}

SegmentState SegmentationStateMachine::state() const {
    return state_;
}

size_t SegmentationStateMachine::run_samples() const {
    return run_samples_;
}

size_t SegmentationStateMachine::run_chunks() const {
    return run_.size();
}

size_t SegmentationStateMachine::silence_samples() const {
    return silence_samples_;
}

uint64_t SegmentationStateMachine::stream_position() const {
    return position_;
}

const vad::SpeechDetector& SegmentationStateMachine::detector() const {
    return *detector_;
}

}
