#include <catch2/catch_test_macros.hpp>

#include "gigastream/logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

using namespace gigastream;

TEST_CASE("text lines append quoted fields") {
    const auto line = logging::render("Session created",
                                      {kv("session", "ab-1"), kv("detector", "vad window")},
                                      logging::Format::Text);
    REQUIRE(line == "Session created [session=ab-1, detector=\"vad window\"]");
    REQUIRE(logging::render("Idle", {}, logging::Format::Text) == "Idle");
}

TEST_CASE("json lines keep field order inside the sink braces") {
    const auto body = logging::render("Final result",
                                      {kv("text", "say \"hi\""), kv("final", true)},
                                      logging::Format::Json);
    const auto parsed = nlohmann::json::parse("{" + body + "}");
    REQUIRE(parsed["message"] == "Final result");
    REQUIRE(parsed["text"] == "say \"hi\"");
    REQUIRE(parsed["final"] == "true");
    REQUIRE(body.rfind("\"message\"", 0) == 0);
}

TEST_CASE("levels and formats parse case-insensitively") {
    REQUIRE(logging::parse_level("warning") == spdlog::level::warn);
    REQUIRE(logging::parse_level("Debug") == spdlog::level::debug);
    REQUIRE(logging::parse_level("bogus") == spdlog::level::info);
    REQUIRE(logging::parse_format("Json") == logging::Format::Json);
    REQUIRE(logging::parse_format("") == logging::Format::Text);
    REQUIRE_THROWS_AS(logging::parse_format("xml"), std::invalid_argument);
}

TEST_CASE("scopes prefix their fields") {
    const logging::Scope scope({kv("session", "s-1")});
    REQUIRE(scope.fields().size() == 1);
    REQUIRE(scope.fields()[0].value == "s-1");
    scope.debug("Scoped line", {kv("samples", 4000)});
}
