#include <catch2/catch_test_macros.hpp>

#include "gigastream/metrics.hpp"
#include "gigastream/stream/results.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using gigastream::stream::ResultSink;
using gigastream::stream::TranscriptionResult;
using gigastream::stream::format_time;
using gigastream::stream::make_result;

TEST_CASE("format_time renders minutes seconds and centiseconds") {
    REQUIRE(format_time(0.0) == "00:00:00");
    REQUIRE(format_time(3.5) == "00:03:50");
    REQUIRE(format_time(65.25) == "01:05:25");
    REQUIRE(format_time(59.999) == "01:00:00");
}

TEST_CASE("format_time adds hours from one hour on") {
    REQUIRE(format_time(3599.99) == "59:59:99");
    REQUIRE(format_time(3600.0) == "01:00:00:00");
    REQUIRE(format_time(3723.45) == "01:02:03:45");
}

TEST_CASE("make_result formats the time fields") {
    const auto result = make_result("привет", 1.0, 3.5, true);
    REQUIRE(result.text == "привет");
    REQUIRE(result.start_time == "00:01:00");
    REQUIRE(result.end_time == "00:03:50");
    REQUIRE(result.duration == "00:02:50");
    REQUIRE(result.is_final);

    const auto json = gigastream::stream::to_json(result);
    REQUIRE(json.at("text") == "привет");
    REQUIRE(json.at("is_final") == true);
    REQUIRE(json.at("duration") == "00:02:50");
}

TEST_CASE("ResultSink routes results by kind and invokes the callback in order") {
    gigastream::Metrics::instance().reset();
    std::vector<std::string> seen;
    ResultSink sink([&seen](const TranscriptionResult& result) { seen.push_back(result.text); });

    sink.emit(make_result("a", 0.0, 1.0, false));
    sink.emit(make_result("b", 0.0, 2.0, true));
    sink.emit(make_result("c", 2.0, 3.0, false));

    REQUIRE(seen == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(sink.interim_results().size() == 2);
    REQUIRE(sink.final_results().size() == 1);
    REQUIRE(sink.final_results()[0].text == "b");
    REQUIRE(gigastream::Metrics::instance().results("interim") == 2);
    REQUIRE(gigastream::Metrics::instance().results("final") == 1);

    sink.clear_interim();
    REQUIRE(sink.interim_results().empty());
    REQUIRE(sink.final_results().size() == 1);
}

TEST_CASE("ResultSink survives a throwing callback") {
    ResultSink sink([](const TranscriptionResult&) { throw std::runtime_error("consumer bug"); });
    REQUIRE_NOTHROW(sink.emit(make_result("x", 0.0, 1.0, true)));
    REQUIRE(sink.final_results().size() == 1);
}
