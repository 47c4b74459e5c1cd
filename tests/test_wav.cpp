#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "gigastream/audio/wav.hpp"

#include <cstdint>
#include <string>
#include <vector>

using Catch::Approx;
using gigastream::audio::WavError;
using gigastream::audio::decode_wav;
using gigastream::audio::encode_wav;

namespace {

void put_u16(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void put_u32(std::string& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

std::string stereo_pcm16(const std::vector<int16_t>& interleaved, uint32_t rate) {
    std::string out = "RIFF";
    put_u32(out, 36 + static_cast<uint32_t>(interleaved.size() * 2));
    out += "WAVEfmt ";
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, 2);
    put_u32(out, rate);
    put_u32(out, rate * 4);
    put_u16(out, 4);
    put_u16(out, 16);
    out += "LIST";
    put_u32(out, 3);
    out += "abc";
    out.push_back('\0');
    out += "data";
    put_u32(out, static_cast<uint32_t>(interleaved.size() * 2));
    for (auto sample : interleaved) {
        put_u16(out, static_cast<uint16_t>(sample));
    }
    return out;
}

}

TEST_CASE("encode_wav writes a 16-bit mono header") {
    const auto bytes = encode_wav({0.0f, 0.5f, -0.5f}, 16000);
    REQUIRE(bytes.size() == 44 + 6);
    REQUIRE(bytes.compare(0, 4, "RIFF") == 0);
    REQUIRE(bytes.compare(8, 4, "WAVE") == 0);
    REQUIRE(bytes.compare(36, 4, "data") == 0);

    const auto decoded = decode_wav(bytes);
    REQUIRE(decoded.sample_rate == 16000);
    REQUIRE(decoded.channels == 1);
    REQUIRE(decoded.samples.size() == 3);
    REQUIRE(decoded.samples[1] == Approx(0.5f).margin(1e-3));
    REQUIRE(decoded.samples[2] == Approx(-0.5f).margin(1e-3));
}

TEST_CASE("encode_wav clamps out of range samples") {
    const auto decoded = decode_wav(encode_wav({2.0f, -3.0f}, 8000));
    REQUIRE(decoded.samples[0] == Approx(1.0f).margin(1e-3));
    REQUIRE(decoded.samples[1] == Approx(-1.0f).margin(1e-3));
}

TEST_CASE("decode_wav averages channels and skips unknown chunks") {
    const auto bytes = stereo_pcm16({16384, 0, -16384, -16384}, 22050);
    const auto decoded = decode_wav(bytes);
    REQUIRE(decoded.sample_rate == 22050);
    REQUIRE(decoded.channels == 2);
    REQUIRE(decoded.samples.size() == 2);
    REQUIRE(decoded.samples[0] == Approx(0.25f));
    REQUIRE(decoded.samples[1] == Approx(-0.5f));
}

TEST_CASE("decode_wav rejects malformed input") {
    REQUIRE_THROWS_AS(decode_wav("not a wav file"), WavError);
    REQUIRE_THROWS_AS(decode_wav(std::string("RIFF\0\0\0\0WAVE", 12)), WavError);
}

TEST_CASE("pcm16_from_bytes reads little-endian samples") {
    const std::string bytes{'\x01', '\x00', '\xFF', '\xFF', '\x7F'};
    const auto samples = gigastream::audio::pcm16_from_bytes(bytes);
    REQUIRE(samples == std::vector<int16_t>{1, -1});
    const auto floats = gigastream::audio::pcm16_to_float(samples);
    REQUIRE(floats[0] == Approx(1.0f / 32768.0f));
}
