#include <catch2/catch_test_macros.hpp>

#include "gigastream/utils/text.hpp"

#include <string>
#include <vector>

TEST_CASE("collapse_whitespace trims and squeezes runs") {
    const std::string input = "  Привет\t\tмир \n ";
    REQUIRE(gigastream::utils::collapse_whitespace(input) == "Привет мир");
}

TEST_CASE("collapse_whitespace keeps case") {
    REQUIRE(gigastream::utils::collapse_whitespace("Hello WORLD") == "Hello WORLD");
}

TEST_CASE("join_tokens turns word markers into spaces") {
    const std::string marker = "\xE2\x96\x81";
    const std::vector<std::string> tokens = {marker + "при", "вет", marker + "мир"};
    REQUIRE(gigastream::utils::join_tokens(tokens) == "привет мир");
}

TEST_CASE("join_tokens of nothing is empty") {
    REQUIRE(gigastream::utils::join_tokens({}).empty());
}
