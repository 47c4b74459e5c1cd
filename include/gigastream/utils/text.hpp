#pragma once

#include <string>
#include <vector>

namespace gigastream::utils {

std::string collapse_whitespace(const std::string& text);

// Concatenates decoder tokens. The word-boundary marker U+2581 becomes a
// space and the result is whitespace-collapsed.
std::string join_tokens(const std::vector<std::string>& tokens);

}
