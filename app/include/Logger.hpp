#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

struct LoggingOptions {
    spdlog::level::level_enum console_level{spdlog::level::warn};
    std::string file_path;
};

class Logger {
public:
    /**
     * @brief Registers core_logger and process_logger with a stderr sink and,
     *        when options.file_path is set, a rotating file sink.
     * @throws spdlog::spdlog_ex when a sink cannot be created.
     */
    static void setup_loggers(const LoggingOptions& options = {});

    /**
     * @brief Looks up a registered logger.
     * @return The logger, or nullptr when setup_loggers has not run.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Drops every logger registered by setup_loggers.
     */
    static void shutdown_loggers();

    static std::string default_pattern();
};

#endif // LOGGER_HPP
