#ifndef LAUNCHERCONFIG_HPP
#define LAUNCHERCONFIG_HPP

#include "EnvironmentOverlay.hpp"
#include "IniConfig.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ConfigEnv {
inline constexpr const char* kConfigPath = "FOUNDRY_CPU_CONFIG";
inline constexpr const char* kExecutable = "FOUNDRY_CPU_EXECUTABLE";
inline constexpr const char* kLogLevel = "FOUNDRY_CPU_LOG_LEVEL";
inline constexpr const char* kLogFile = "FOUNDRY_CPU_LOG_FILE";
} // namespace ConfigEnv

/**
 * @brief Everything the launcher needs to know before spawning the runtime CLI.
 *
 * Defaults match the stock Foundry Local install: "foundry model ls" with
 * an accelerator version override of 0.0.0.
 */
struct LauncherConfig {
    std::string executable{"foundry"};
    std::vector<std::string> default_args{"model", "ls"};
    std::string accelerator_version{"0.0.0"}; // raw; sanitized when the overlay is built
    EnvironmentOverlay::Entries extra_environment;
    LoggingOptions logging;
};

namespace LauncherConfigLoader {

/**
 * @brief Built-in defaults, then the INI file, then FOUNDRY_CPU_* variables.
 * @throws ErrorCodes::AppException CONFIG_FILE_UNREADABLE when FOUNDRY_CPU_CONFIG
 *         names a file that cannot be read, CONFIG_INVALID for bad values.
 */
LauncherConfig load();

/**
 * @brief Applies the [launcher], [accelerator], [environment] and [logging]
 *        sections of ini on top of base.
 */
LauncherConfig apply_ini(const IniConfig& ini, LauncherConfig base);

LauncherConfig apply_environment(LauncherConfig base);

// $XDG_CONFIG_HOME/foundry-cpu/config.ini, else $HOME/.config/foundry-cpu/config.ini
std::optional<std::filesystem::path> default_config_path();

spdlog::level::level_enum parse_log_level(std::string_view value);

} // namespace LauncherConfigLoader

#endif // LAUNCHERCONFIG_HPP
