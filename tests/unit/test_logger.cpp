#include <catch2/catch_test_macros.hpp>
#include "Logger.hpp"
#include "TestHelpers.hpp"
#include "VersionSanitizer.hpp"
#include <fstream>
#include <string>
#include <vector>
#include <sstream>

namespace {

struct LoggerReset {
    LoggerReset() { Logger::shutdown_loggers(); }
    ~LoggerReset() { Logger::shutdown_loggers(); }
};

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}

TEST_CASE("get_logger returns nullptr before setup and after shutdown") {
    LoggerReset reset;
    CHECK(Logger::get_logger("core_logger") == nullptr);

    Logger::setup_loggers(LoggingOptions{spdlog::level::off, {}});
    CHECK(Logger::get_logger("core_logger") != nullptr);
    CHECK(Logger::get_logger("process_logger") != nullptr);
    CHECK(Logger::get_logger("no_such_logger") == nullptr);

    Logger::shutdown_loggers();
    CHECK(Logger::get_logger("core_logger") == nullptr);
}

TEST_CASE("logger level follows the console level without a log file") {
    LoggerReset reset;
    Logger::setup_loggers(LoggingOptions{spdlog::level::err, {}});

    auto logger = Logger::get_logger("core_logger");
    REQUIRE(logger);
    CHECK(logger->level() == spdlog::level::err);
    CHECK_FALSE(logger->should_log(spdlog::level::warn));
}

TEST_CASE("a log file lowers the logger level to debug") {
    LoggerReset reset;
    TempDir dir;
    Logger::setup_loggers(LoggingOptions{spdlog::level::warn, (dir.path() / "launcher.log").string()});

    auto logger = Logger::get_logger("process_logger");
    REQUIRE(logger);
    CHECK(logger->level() == spdlog::level::debug);
}

TEST_CASE("setup_loggers can run twice") {
    LoggerReset reset;
    Logger::setup_loggers(LoggingOptions{spdlog::level::off, {}});
    CHECK_NOTHROW(Logger::setup_loggers(LoggingOptions{spdlog::level::off, {}}));
}

TEST_CASE("sanitizer fallback and normalization are written to the log file") {
    LoggerReset reset;
    TempDir dir;
    const auto log_path = dir.path() / "launcher.log";
    Logger::setup_loggers(LoggingOptions{spdlog::level::off, log_path.string()});

    CHECK(VersionSanitizer::sanitize_string("n/a") == "0.0.0");
    CHECK(VersionSanitizer::sanitize_string("5") == "5.0");
    Logger::shutdown_loggers();

    const std::string log = read_file(log_path);
    CHECK(log.find("[core_logger] [info] Could not parse accelerator version 'n/a', defaulting to 0.0.0")
          != std::string::npos);
    CHECK(log.find("[core_logger] [debug] Normalized single component to '5.0'") != std::string::npos);
}

TEST_CASE("sanitizer results do not depend on whether tracing is enabled") {
    LoggerReset reset;
    const std::vector<std::string> inputs = {"", "n/a", "5", "12.0\n", "5\n      7", " \t "};

    std::vector<SanitizedVersion> untraced;
    for (const auto& input : inputs) {
        untraced.push_back(VersionSanitizer::sanitize(input));
    }

    TempDir dir;
    Logger::setup_loggers(LoggingOptions{spdlog::level::off, (dir.path() / "trace.log").string()});
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        CAPTURE(inputs[i]);
        const auto traced = VersionSanitizer::sanitize(inputs[i]);
        CHECK(traced.value == untraced[i].value);
        CHECK(traced.source == untraced[i].source);
        CHECK(traced.normalized == untraced[i].normalized);
    }
}
