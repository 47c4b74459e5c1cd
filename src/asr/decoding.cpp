#include "gigastream/asr/decoding.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "gigastream/utils/text.hpp"

namespace gigastream::asr {

namespace {

int64_t argmax(const float* values, size_t count) {
    return static_cast<int64_t>(std::max_element(values, values + count) - values);
}

int64_t valid_length(const Tensor& encoded_len, int64_t available) {
    if (encoded_len.dtype == DType::Int64 && !encoded_len.indices.empty()) {
        return std::min(available, encoded_len.indices.front());
    }
    return available;
}

}

Vocabulary::Vocabulary(std::vector<std::string> tokens)
    : tokens_(std::move(tokens)) {}

Vocabulary Vocabulary::load(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error("Failed to open vocabulary: " + path.string());
    }
    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        tokens.push_back(line);
    }
    if (tokens.empty()) {
        throw std::runtime_error("Vocabulary is empty: " + path.string());
    }
    return Vocabulary(std::move(tokens));
}

size_t Vocabulary::size() const {
    return tokens_.size();
}

const std::string& Vocabulary::token(int64_t id) const {
    if (id < 0 || static_cast<size_t>(id) >= tokens_.size()) {
        throw std::out_of_range("token id out of vocabulary range: " + std::to_string(id));
    }
    return tokens_[static_cast<size_t>(id)];
}

std::string Vocabulary::detokenize(const std::vector<int64_t>& ids) const {
    std::vector<std::string> pieces;
    pieces.reserve(ids.size());
    for (auto id : ids) {
        pieces.push_back(token(id));
    }
    return utils::join_tokens(pieces);
}

std::vector<float> encoded_frame(const Tensor& encoded, int64_t t) {
    const int64_t dims = encoded.dim(1);
    const int64_t frames = encoded.dim(2);
    std::vector<float> frame(static_cast<size_t>(dims));
    for (int64_t d = 0; d < dims; ++d) {
        frame[static_cast<size_t>(d)] = encoded.values[static_cast<size_t>(d * frames + t)];
    }
    return frame;
}

CtcGreedyDecoder::CtcGreedyDecoder(const Vocabulary& vocabulary)
    : vocabulary_(vocabulary) {}

std::vector<std::string> CtcGreedyDecoder::decode(CtcHead& head,
                                                  const Tensor& encoded,
                                                  const Tensor& encoded_len) const {
    const auto log_probs = head.log_probs(encoded);
    if (log_probs.rank() != 3 || log_probs.dim(0) != 1) {
        throw std::runtime_error("CTC head returned unexpected shape " +
                                 shape_to_string(log_probs.shape));
    }
    const int64_t classes = log_probs.dim(2);
    const int64_t blank = classes - 1;
    const int64_t frames = valid_length(encoded_len, log_probs.dim(1));

    std::vector<int64_t> ids;
    int64_t previous = blank;
    for (int64_t t = 0; t < frames; ++t) {
        const float* row = log_probs.values.data() + t * classes;
        const int64_t label = argmax(row, static_cast<size_t>(classes));
        if (label != blank && label != previous) {
            ids.push_back(label);
        }
        previous = label;
    }
    return {vocabulary_.detokenize(ids)};
}

RnntGreedyDecoder::RnntGreedyDecoder(const Vocabulary& vocabulary, int max_symbols_per_step)
    : vocabulary_(vocabulary),
      max_symbols_per_step_(std::max(1, max_symbols_per_step)) {}

std::vector<std::string> RnntGreedyDecoder::decode(RnntHead& head,
                                                   const Tensor& encoded,
                                                   const Tensor& encoded_len) const {
    if (encoded.rank() != 3 || encoded.dim(0) != 1) {
        throw std::runtime_error("RNNT decoder expects [1, D, T] encoder output, got " +
                                 shape_to_string(encoded.shape));
    }
    const int64_t frames = valid_length(encoded_len, encoded.dim(2));
    const int64_t blank = head.blank_id();

    std::vector<int64_t> ids;
    std::optional<int64_t> last_label;
    RnntState state = head.initial_state();
    auto prediction = head.predict(last_label, state);

    for (int64_t t = 0; t < frames; ++t) {
        const auto frame = encoded_frame(encoded, t);
        for (int emitted = 0; emitted < max_symbols_per_step_; ++emitted) {
            const auto logits = head.joint(frame, prediction);
            if (logits.empty()) {
                throw std::runtime_error("RNNT joint returned no logits");
            }
            const int64_t label = argmax(logits.data(), logits.size());
            if (label == blank) {
                break;
            }
            ids.push_back(label);
            last_label = label;
            prediction = head.predict(last_label, state);
        }
    }
    return {vocabulary_.detokenize(ids)};
}

}
