#include "gigastream/vad/segmenter.hpp"

#include <algorithm>
#include <stdexcept>

#include "gigastream/audio/wav.hpp"
#include "gigastream/logging.hpp"

namespace gigastream {
namespace vad {

namespace {

class ClipSlicer {
public:
    ClipSlicer(const std::vector<float>& samples, int sample_rate)
        : samples_(samples), sample_rate_(sample_rate) {}

    // Slice by whole-millisecond boundaries.
    std::vector<float> slice(double start_sec, double end_sec) const {
        const auto start_ms = static_cast<int64_t>(start_sec * 1000.0);
        const auto end_ms = static_cast<int64_t>(end_sec * 1000.0);
        const size_t begin = std::min(samples_.size(), to_index(start_ms));
        const size_t end = std::min(samples_.size(), to_index(end_ms));
        if (end <= begin) {
            return {};
        }
        return std::vector<float>(samples_.begin() + static_cast<std::ptrdiff_t>(begin),
                                  samples_.begin() + static_cast<std::ptrdiff_t>(end));
    }

private:
    size_t to_index(int64_t ms) const {
        return static_cast<size_t>(std::max<int64_t>(0, ms * sample_rate_ / 1000));
    }

    const std::vector<float>& samples_;
    int sample_rate_;
};

void emit_chunk(const ClipSlicer& slicer,
                double start,
                double end,
                std::vector<AudioSegment>& out) {
    if (end <= start) {
        return;
    }
    auto samples = slicer.slice(start, end);
    if (samples.empty()) {
        return;
    }
    AudioSegment segment;
    const auto count = static_cast<int64_t>(samples.size());
    segment.samples = asr::Tensor::floats(std::move(samples), {count});
    segment.start = start;
    segment.end = end;
    out.push_back(std::move(segment));
}

}

std::vector<AudioSegment> segment_audio(const asr::Tensor& wav,
                                        int sample_rate,
                                        VadOracle& oracle,
                                        const SegmentOptions& options) {
    logging::info(
        "Segmenting audio",
        {kv("shape", asr::shape_to_string(wav.shape)),
         kv("sample_rate", sample_rate)});

    if (wav.dtype != asr::DType::Float32) {
        throw std::invalid_argument("segment_audio expects a float32 tensor");
    }
    const bool mono = wav.rank() == 1 || (wav.rank() == 2 && wav.dim(0) == 1);
    if (!mono) {
        throw std::invalid_argument("segment_audio expects a 1-D or [1, N] tensor, got " +
                                    asr::shape_to_string(wav.shape));
    }
    if (sample_rate <= 0) {
        throw std::invalid_argument("sample rate must be positive");
    }

    const auto& samples = wav.values;
    const auto length_ms =
        static_cast<int64_t>(samples.size()) * 1000 / static_cast<int64_t>(sample_rate);
    if (length_ms < 1000) {
        throw std::invalid_argument("Audio too short for segmentation");
    }
    const double clip_seconds = static_cast<double>(length_ms) / 1000.0;

    const auto timeline = oracle.detect(audio::encode_wav(samples, sample_rate));
    const ClipSlicer slicer(samples, sample_rate);

    std::vector<AudioSegment> segments;
    double curr_start = 0.0;
    double curr_end = 0.0;
    double curr_duration = 0.0;
    for (const auto& region : timeline.support()) {
        const double start = std::max(0.0, region.start);
        const double end = std::min(clip_seconds, region.end);

        const bool pause_split =
            curr_duration > options.min_duration &&
            start - curr_end > options.new_chunk_threshold;
        const bool overflow_split = curr_duration + (end - curr_end) > options.max_duration;
        if (pause_split || overflow_split) {
            emit_chunk(slicer, curr_start, curr_end, segments);
            curr_start = start;
        }
        curr_end = end;
        curr_duration = curr_end - curr_start;
    }
    if (curr_duration != 0.0) {
        emit_chunk(slicer, curr_start, curr_end, segments);
    }

    logging::info("Segmentation finished", {kv("segments", segments.size())});
    return segments;
}

}
}
