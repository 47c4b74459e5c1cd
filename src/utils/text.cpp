#include "gigastream/utils/text.hpp"

#include <cctype>

namespace gigastream::utils {

namespace {

const std::string kWordBoundary = "\xE2\x96\x81";

}

std::string collapse_whitespace(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    bool in_space = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!in_space) {
                normalized.push_back(' ');
                in_space = true;
            }
        } else {
            normalized.push_back(static_cast<char>(ch));
            in_space = false;
        }
    }
    if (!normalized.empty() && normalized.front() == ' ') {
        normalized.erase(normalized.begin());
    }
    if (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    return normalized;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        joined += token;
    }
    size_t pos = 0;
    while ((pos = joined.find(kWordBoundary, pos)) != std::string::npos) {
        joined.replace(pos, kWordBoundary.size(), " ");
        pos += 1;
    }
    return collapse_whitespace(joined);
}

}
