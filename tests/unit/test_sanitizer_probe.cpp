#include <catch2/catch_test_macros.hpp>
#include "SanitizerProbe.hpp"
#include <sstream>

TEST_CASE("describe reports clean versions") {
    CHECK(SanitizerProbe::describe("12.0") == "'12.0' -> '12.0' (extracted) parses as 12.0");
}

TEST_CASE("describe escapes control characters and flags normalization") {
    CHECK(SanitizerProbe::describe("5\n  7") == "'5\\n  7' -> '5.0' (extracted, normalized) parses as 5.0");
    CHECK(SanitizerProbe::describe("12.4\r\n") == "'12.4\\r\\n' -> '12.4' (extracted) parses as 12.4");
}

TEST_CASE("describe distinguishes empty input from fallback") {
    CHECK(SanitizerProbe::describe("") == "'' -> '' (empty) no version available");
    CHECK(SanitizerProbe::describe("n/a") == "'n/a' -> '0.0.0' (fallback) parses as 0.0");
}

TEST_CASE("run describes each argument on its own line") {
    std::istringstream in("ignored");
    std::ostringstream out;

    CHECK(SanitizerProbe::run({"11.8", "none"}, in, out) == 0);
    CHECK(out.str() ==
          "'11.8' -> '11.8' (extracted) parses as 11.8\n"
          "'none' -> '0.0.0' (fallback) parses as 0.0\n");
}

TEST_CASE("run reads all of stdin as one value when there are no arguments") {
    std::istringstream in("12.2\n      \n");
    std::ostringstream out;

    CHECK(SanitizerProbe::run({}, in, out) == 0);
    CHECK(out.str() == "'12.2\\n      \\n' -> '12.2' (extracted) parses as 12.2\n");
}
