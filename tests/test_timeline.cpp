#include <catch2/catch_test_macros.hpp>

#include "gigastream/vad/timeline.hpp"

using gigastream::vad::Segment;
using gigastream::vad::Timeline;

TEST_CASE("support merges overlapping and touching segments in time order") {
    Timeline timeline;
    timeline.add({3.0, 4.0, 0.4});
    timeline.add({0.5, 1.0, 0.9});
    timeline.add({0.8, 2.0, 0.7});
    timeline.add({2.0, 2.5, std::nullopt});

    const auto support = timeline.support();
    REQUIRE(support.size() == 2);
    REQUIRE(support[0].start == 0.5);
    REQUIRE(support[0].end == 2.5);
    REQUIRE(support[0].score == 0.9);
    REQUIRE(support[1].start == 3.0);
    REQUIRE(support[1].end == 4.0);
    REQUIRE(support[1].score == 0.4);
}

TEST_CASE("support keeps the score absent when no member has one") {
    Timeline timeline({{0.0, 1.0, std::nullopt}, {0.5, 1.5, std::nullopt}});
    const auto support = timeline.support();
    REQUIRE(support.size() == 1);
    REQUIRE_FALSE(support[0].score.has_value());
    REQUIRE(support[0].duration() == 1.5);
}

TEST_CASE("support drops empty segments") {
    Timeline timeline({{1.0, 1.0, 0.5}, {2.0, 1.0, 0.5}});
    REQUIRE(timeline.support().empty());
    REQUIRE_FALSE(timeline.empty());
}
