#include "LauncherCli.hpp"
#include "AppException.hpp"
#include "CpuLauncher.hpp"
#include "Logger.hpp"

namespace LauncherCli {

int run(const std::vector<std::string>& args,
        const LauncherConfig& config,
        std::ostream& out,
        std::ostream& err)
{
    auto logger = Logger::get_logger("core_logger");
    try {
        CpuLauncher launcher(config, out, err);
        return launcher.run(args);
    } catch (const ErrorCodes::AppException& ex) {
        err << "Error running " << config.executable << ": " << ex.get_user_message() << "\n";
        const auto& resolution = ex.get_error_info().resolution;
        if (!resolution.empty()) {
            err << resolution << "\n";
        }
        err << std::flush;
        if (logger) {
            logger->debug("Launch failed [{}]: {}", ex.get_error_code_int(), ex.get_full_details());
        }
    } catch (const std::exception& ex) {
        err << "Error running " << config.executable << ": " << ex.what() << std::endl;
        if (logger) {
            logger->debug("Launch failed: {}", ex.what());
        }
    }
    return kLaunchFailureExitCode;
}


std::vector<std::string> collect_arguments(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (argv[i]) {
            args.emplace_back(argv[i]);
        }
    }
    return args;
}

} // namespace LauncherCli
