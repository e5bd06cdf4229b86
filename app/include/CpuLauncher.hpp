#ifndef CPULAUNCHER_HPP
#define CPULAUNCHER_HPP

#include "EnvironmentOverlay.hpp"
#include "LauncherConfig.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

class CpuLauncher {
public:
    CpuLauncher(LauncherConfig config, std::ostream& out, std::ostream& err);

    /**
     * @brief Runs the runtime CLI on the CPU path and relays its output.
     * @param args Passed through untouched; empty means the configured default args.
     * @return The child's exit code (128 + signal when it was killed).
     * @throws ErrorCodes::AppException when the child cannot be started.
     */
    int run(const std::vector<std::string>& args);

    EnvironmentOverlay build_overlay() const;
    std::vector<std::string> effective_args(const std::vector<std::string>& args) const;
    std::filesystem::path resolve_executable() const;

    const LauncherConfig& config() const noexcept { return config_; }

private:
    LauncherConfig config_;
    std::ostream& out_;
    std::ostream& err_;
};

#endif // CPULAUNCHER_HPP
