#include "CpuLauncher.hpp"
#include "AppException.hpp"
#include "ChildProcess.hpp"
#include "LineRelay.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include "VersionSanitizer.hpp"

#include <future>
#include <utility>

using ErrorCodes::Code;

namespace {

std::future<std::size_t> start_relay(int fd, std::ostream& sink)
{
    return std::async(std::launch::async, [fd, &sink]() {
        LineReader reader(fd);
        return relay_lines(reader, sink);
    });
}

}


CpuLauncher::CpuLauncher(LauncherConfig config, std::ostream& out, std::ostream& err)
    : config_(std::move(config)),
      out_(out),
      err_(err)
{
}


EnvironmentOverlay CpuLauncher::build_overlay() const
{
    const VersionString version = VersionSanitizer::sanitize_or_fallback(config_.accelerator_version);
    const auto forced = EnvironmentOverlay::force_cpu(version);

    // Extra entries go underneath; the CPU variables always win
    EnvironmentOverlay::Entries extras;
    for (const auto& [key, value] : config_.extra_environment) {
        if (forced.value_of(key)) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->warn("Ignoring configured {}={}: the CPU overlay sets it", key, value);
            }
            continue;
        }
        extras.emplace(key, value);
    }
    return EnvironmentOverlay(std::move(extras)).with(forced.entries());
}


std::vector<std::string> CpuLauncher::effective_args(const std::vector<std::string>& args) const
{
    return args.empty() ? config_.default_args : args;
}


std::filesystem::path CpuLauncher::resolve_executable() const
{
    auto resolved = Utils::find_executable_on_path(config_.executable);
    if (!resolved) {
        THROW_APP_ERROR(Code::SPAWN_EXECUTABLE_NOT_FOUND, config_.executable);
    }
    return *resolved;
}


int CpuLauncher::run(const std::vector<std::string>& args)
{
    auto core_logger = Logger::get_logger("core_logger");
    auto process_logger = Logger::get_logger("process_logger");

    const std::vector<std::string> child_args = effective_args(args);
    const std::filesystem::path executable = resolve_executable();
    const EnvironmentOverlay overlay = build_overlay();

    if (core_logger) {
        core_logger->info("Running: {} {}", config_.executable, Utils::join_arguments(child_args));
        for (const auto& [key, value] : overlay.entries()) {
            core_logger->debug("Overlay {}={}", key, value);
        }
    }

    std::vector<std::string> argv;
    argv.reserve(child_args.size() + 1);
    argv.push_back(config_.executable);
    argv.insert(argv.end(), child_args.begin(), child_args.end());

    auto child = ChildProcess::spawn(executable, argv,
                                     overlay.apply_to(EnvironmentOverlay::current_environment()));

    auto stdout_relay = start_relay(child->stdout_fd(), out_);
    auto stderr_relay = start_relay(child->stderr_fd(), err_);

    int exit_code = 0;
    try {
        exit_code = child->wait();
    } catch (const ErrorCodes::AppException&) {
        child->terminate();
        throw;
    }

    const std::size_t stdout_lines = stdout_relay.get();
    const std::size_t stderr_lines = stderr_relay.get();

    if (process_logger) {
        process_logger->debug("{} exited with code {} ({} stdout line(s), {} stderr line(s))",
                              config_.executable, exit_code, stdout_lines, stderr_lines);
    }
    return exit_code;
}
