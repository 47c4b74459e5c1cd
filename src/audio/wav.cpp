#include "gigastream/audio/wav.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace gigastream {
namespace audio {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t read_u16(const std::string& bytes, size_t offset) {
    if (offset + 2 > bytes.size()) {
        throw WavError("unexpected end of WAV data");
    }
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[offset]) |
                                 (static_cast<uint8_t>(bytes[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    if (offset + 4 > bytes.size()) {
        throw WavError("unexpected end of WAV data");
    }
    return static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 3])) << 24);
}

float read_sample(const std::string& bytes, size_t offset, uint16_t format, uint16_t bits) {
    if (format == kFormatFloat && bits == 32) {
        const uint32_t raw = read_u32(bytes, offset);
        float value = 0.0f;
        std::memcpy(&value, &raw, sizeof(value));
        return value;
    }
    if (bits == 16) {
        const auto raw = static_cast<int16_t>(read_u16(bytes, offset));
        return static_cast<float>(raw) / 32768.0f;
    }
    if (bits == 32) {
        const auto raw = static_cast<int32_t>(read_u32(bytes, offset));
        return static_cast<float>(static_cast<double>(raw) / 2147483648.0);
    }
    throw WavError("unsupported WAV sample width: " + std::to_string(bits));
}

}

std::string encode_wav(const std::vector<float>& audio, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint32_t rate = static_cast<uint32_t>(sample_rate);
    const uint16_t block_align = channels * (bits_per_sample / 8);
    const uint32_t byte_rate = rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(audio.size() * sizeof(int16_t));
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(44 + data_size);
    auto append = [&result](const void* data, size_t size) {
        result.append(static_cast<const char*>(data), size);
    };
    auto append_u16 = [&append](uint16_t value) {
        const uint8_t bytes[2] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };
    auto append_u32 = [&append](uint32_t value) {
        const uint8_t bytes[4] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 24) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };

    append("RIFF", 4);
    append_u32(chunk_size);
    append("WAVE", 4);
    append("fmt ", 4);
    append_u32(16);
    append_u16(kFormatPcm);
    append_u16(channels);
    append_u32(rate);
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(bits_per_sample);
    append("data", 4);
    append_u32(data_size);

    for (float sample : audio) {
        const float clamped = std::max(-1.0f, std::min(1.0f, sample));
        const auto pcm = static_cast<uint16_t>(static_cast<int16_t>(
            clamped * std::numeric_limits<int16_t>::max()));
        append_u16(pcm);
    }

    return result;
}

WavAudio decode_wav(const std::string& bytes) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 ||
        bytes.compare(8, 4, "WAVE") != 0) {
        throw WavError("not a RIFF/WAVE buffer");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;
    size_t data_offset = 0;
    size_t data_size = 0;
    bool have_data = false;

    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const std::string id = bytes.substr(offset, 4);
        const uint32_t size = read_u32(bytes, offset + 4);
        const size_t body = offset + 8;
        if (id == "fmt ") {
            format = read_u16(bytes, body);
            channels = read_u16(bytes, body + 2);
            sample_rate = read_u32(bytes, body + 4);
            bits = read_u16(bytes, body + 14);
            if (format == kFormatExtensible && size >= 26) {
                format = read_u16(bytes, body + 24);
            }
            have_fmt = true;
        } else if (id == "data") {
            data_offset = body;
            data_size = std::min<size_t>(size, bytes.size() - body);
            have_data = true;
            break;
        }
        offset = body + size + (size & 1u);
    }

    if (!have_fmt || !have_data) {
        throw WavError("WAV buffer is missing fmt or data chunk");
    }
    if (format != kFormatPcm && format != kFormatFloat) {
        throw WavError("unsupported WAV format tag: " + std::to_string(format));
    }
    if (channels == 0 || sample_rate == 0 || bits == 0 || bits % 8 != 0) {
        throw WavError("invalid WAV fmt chunk");
    }

    const size_t sample_bytes = bits / 8;
    const size_t frame_bytes = sample_bytes * channels;
    const size_t frames = data_size / frame_bytes;

    WavAudio result;
    result.sample_rate = static_cast<int>(sample_rate);
    result.channels = channels;
    result.samples.reserve(frames);
    for (size_t frame = 0; frame < frames; ++frame) {
        float mixed = 0.0f;
        for (uint16_t channel = 0; channel < channels; ++channel) {
            const size_t position = data_offset + frame * frame_bytes + channel * sample_bytes;
            mixed += read_sample(bytes, position, format, bits);
        }
        result.samples.push_back(mixed / static_cast<float>(channels));
    }
    return result;
}

std::vector<float> pcm16_to_float(const std::vector<int16_t>& samples) {
    std::vector<float> audio;
    audio.reserve(samples.size());
    for (auto sample : samples) {
        audio.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return audio;
}

std::vector<int16_t> pcm16_from_bytes(const std::string& bytes) {
    std::vector<int16_t> samples(bytes.size() / sizeof(int16_t));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(read_u16(bytes, i * sizeof(int16_t)));
    }
    return samples;
}

}
}
