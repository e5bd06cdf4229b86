#include "AppException.hpp"
#include "LauncherCli.hpp"
#include "LauncherConfig.hpp"
#include "Logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>


namespace {

bool initialize_loggers(const LoggingOptions& options)
{
    try {
        Logger::setup_loggers(options);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

struct LoggerShutdown {
    ~LoggerShutdown() { Logger::shutdown_loggers(); }
};

} // namespace


int main(int argc, char** argv)
{
    LauncherConfig config;
    try {
        config = LauncherConfigLoader::load();
    } catch (const ErrorCodes::AppException& ex) {
        std::cerr << "foundry-cpu: " << ex.get_user_message() << "\n"
                  << ex.get_error_info().resolution << std::endl;
        return LauncherCli::kLaunchFailureExitCode;
    }

    if (!initialize_loggers(config.logging)) {
        return LauncherCli::kLaunchFailureExitCode;
    }
    LoggerShutdown logger_shutdown;

    return LauncherCli::run(LauncherCli::collect_arguments(argc, argv), config, std::cout, std::cerr);
}
