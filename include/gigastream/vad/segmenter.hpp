#pragma once

#include <vector>

#include "gigastream/asr/tensor.hpp"
#include "gigastream/vad/oracle.hpp"

namespace gigastream {
namespace vad {

struct SegmentOptions {
    double max_duration = 22.0;
    double min_duration = 15.0;
    double new_chunk_threshold = 0.2;
};

struct AudioSegment {
    asr::Tensor samples; // 1-D float32
    double start = 0.0;
    double end = 0.0;
};

// Groups the oracle's speech regions into chunks suited to offline
// recognition. The clip must be a float32 tensor, 1-D or [1, N], of at
// least one second.
std::vector<AudioSegment> segment_audio(const asr::Tensor& wav,
                                        int sample_rate,
                                        VadOracle& oracle,
                                        const SegmentOptions& options = {});

}
}
