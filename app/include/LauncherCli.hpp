#ifndef LAUNCHERCLI_HPP
#define LAUNCHERCLI_HPP

#include "LauncherConfig.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace LauncherCli {

inline constexpr int kLaunchFailureExitCode = 1;

/**
 * @brief Runs the launcher and turns every wrapper-side failure into a
 *        message on err plus kLaunchFailureExitCode.
 * @return The child's exit code, or kLaunchFailureExitCode.
 */
int run(const std::vector<std::string>& args,
        const LauncherConfig& config,
        std::ostream& out,
        std::ostream& err);

// argv[1..argc) as strings
std::vector<std::string> collect_arguments(int argc, char** argv);

} // namespace LauncherCli

#endif // LAUNCHERCLI_HPP
