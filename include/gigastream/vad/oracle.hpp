#pragma once

#include <string>

#include "gigastream/vad/timeline.hpp"

namespace gigastream {
namespace vad {

// Speech activity oracle answering for a complete WAV-encoded buffer.
class VadOracle {
public:
    virtual ~VadOracle() = default;

    virtual Timeline detect(const std::string& wav_bytes) = 0;
    virtual void to(const std::string& device) = 0;
    virtual std::string device() const = 0;
};

}
}
