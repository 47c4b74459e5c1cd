#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace gigastream {
namespace audio {

class WavError : public std::runtime_error {
public:
    explicit WavError(const std::string& message) : std::runtime_error(message) {}
};

struct WavAudio {
    int sample_rate = 0;
    int channels = 0;
    std::vector<float> samples; // mono, channels averaged
};

// 16-bit PCM mono RIFF/WAVE. Samples are clamped to [-1, 1].
std::string encode_wav(const std::vector<float>& audio, int sample_rate);

// Accepts PCM 16/32-bit integer and 32-bit IEEE float data, any channel count.
WavAudio decode_wav(const std::string& bytes);

std::vector<float> pcm16_to_float(const std::vector<int16_t>& samples);
std::vector<int16_t> pcm16_from_bytes(const std::string& bytes);

}
}
