#include "LauncherCli.hpp"
#include "LauncherConfig.hpp"
#include "Logger.hpp"
#include "SanitizerProbe.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

// Reports how raw accelerator version strings are sanitized.
// FOUNDRY_CPU_LOG_LEVEL=debug shows the individual sanitizer steps.
int main(int argc, char** argv)
{
    LoggingOptions options;
    try {
        options = LauncherConfigLoader::apply_environment(LauncherConfig{}).logging;
        Logger::setup_loggers(options);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "foundry-cpu-sanitize: %s\n", e.what());
        return EXIT_FAILURE;
    }

    const int result = SanitizerProbe::run(LauncherCli::collect_arguments(argc, argv), std::cin, std::cout);
    Logger::shutdown_loggers();
    return result;
}
