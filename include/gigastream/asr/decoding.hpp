#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gigastream/asr/tensor.hpp"

namespace gigastream {
namespace asr {

class Vocabulary {
public:
    Vocabulary() = default;
    explicit Vocabulary(std::vector<std::string> tokens);

    // One token per line; the line content is the token verbatim.
    static Vocabulary load(const std::filesystem::path& path);

    size_t size() const;
    const std::string& token(int64_t id) const;
    std::string detokenize(const std::vector<int64_t>& ids) const;

private:
    std::vector<std::string> tokens_;
};

class CtcHead {
public:
    virtual ~CtcHead() = default;

    // encoded: [1, D, T] -> log probabilities [1, T, V] where the blank is
    // the last class.
    virtual Tensor log_probs(const Tensor& encoded) = 0;
};

struct RnntState {
    std::vector<float> hidden;
    std::vector<float> cell;
};

class RnntHead {
public:
    virtual ~RnntHead() = default;

    virtual int64_t blank_id() const = 0;
    virtual RnntState initial_state() const = 0;
    // Prediction network step. An empty token starts the sequence.
    virtual std::vector<float> predict(std::optional<int64_t> token, RnntState& state) = 0;
    virtual std::vector<float> joint(const std::vector<float>& encoded_frame,
                                     const std::vector<float>& prediction) = 0;
};

class CtcGreedyDecoder {
public:
    explicit CtcGreedyDecoder(const Vocabulary& vocabulary);

    std::vector<std::string> decode(CtcHead& head,
                                    const Tensor& encoded,
                                    const Tensor& encoded_len) const;

private:
    const Vocabulary& vocabulary_;
};

class RnntGreedyDecoder {
public:
    RnntGreedyDecoder(const Vocabulary& vocabulary, int max_symbols_per_step = 10);

    std::vector<std::string> decode(RnntHead& head,
                                    const Tensor& encoded,
                                    const Tensor& encoded_len) const;

private:
    const Vocabulary& vocabulary_;
    int max_symbols_per_step_;
};

// Column t of a [1, D, T] tensor.
std::vector<float> encoded_frame(const Tensor& encoded, int64_t t);

}
}
