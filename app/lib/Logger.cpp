#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <vector>

namespace {

constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr std::array<const char*, 2> kLoggerNames = {"core_logger", "process_logger"};

}


void Logger::setup_loggers(const LoggingOptions& options)
{
    shutdown_loggers();

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(options.console_level);
    sinks.push_back(console_sink);

    auto logger_level = options.console_level;
    if (!options.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file_path, kMaxLogFileBytes, kMaxLogFiles);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
        logger_level = std::min(logger_level, spdlog::level::debug);
    }

    for (const char* name : kLoggerNames) {
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(logger_level);
        logger->set_pattern(default_pattern());
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::shutdown_loggers()
{
    for (const char* name : kLoggerNames) {
        if (auto logger = spdlog::get(name)) {
            logger->flush();
            spdlog::drop(name);
        }
    }
}


std::string Logger::default_pattern()
{
    return "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
}
