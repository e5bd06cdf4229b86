#include "LauncherConfig.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using ErrorCodes::Code;

namespace {

template <typename... Args>
void config_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::optional<std::string> read_env(const char* key)
{
    const char* value = std::getenv(key);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void require_executable(const LauncherConfig& config, const std::string& origin)
{
    if (config.executable.empty()) {
        THROW_APP_ERROR(Code::CONFIG_INVALID, "executable is empty (" + origin + ")");
    }
}

}

namespace LauncherConfigLoader {

spdlog::level::level_enum parse_log_level(std::string_view value)
{
    const std::string lowered = Utils::to_lower_copy(Utils::trim_copy(value));
    if (lowered == "warning") {
        return spdlog::level::warn;
    }
    if (lowered == "error") {
        return spdlog::level::err;
    }
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        THROW_APP_ERROR(Code::CONFIG_INVALID, "unknown log level '" + std::string(value) + "'");
    }
    return level;
}


std::optional<std::filesystem::path> default_config_path()
{
    if (auto xdg = read_env("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "foundry-cpu" / "config.ini";
    }
    if (auto home = read_env("HOME")) {
        return std::filesystem::path(*home) / ".config" / "foundry-cpu" / "config.ini";
    }
    return std::nullopt;
}


LauncherConfig apply_ini(const IniConfig& ini, LauncherConfig base)
{
    if (ini.hasValue("launcher", "executable")) {
        base.executable = ini.getValue("launcher", "executable");
        require_executable(base, "[launcher] executable");
    }
    if (ini.hasValue("launcher", "default_args")) {
        base.default_args = Utils::split_whitespace(ini.getValue("launcher", "default_args"));
    }
    if (ini.hasValue("accelerator", "version_override")) {
        base.accelerator_version = ini.getValue("accelerator", "version_override");
    }
    for (const auto& [key, value] : ini.getSection("environment")) {
        base.extra_environment[key] = value;
    }
    if (ini.hasValue("logging", "level")) {
        base.logging.console_level = parse_log_level(ini.getValue("logging", "level"));
    }
    if (ini.hasValue("logging", "file")) {
        base.logging.file_path = ini.getValue("logging", "file");
    }
    return base;
}


LauncherConfig apply_environment(LauncherConfig base)
{
    if (auto executable = read_env(ConfigEnv::kExecutable)) {
        base.executable = *executable;
    }
    if (auto level = read_env(ConfigEnv::kLogLevel)) {
        base.logging.console_level = parse_log_level(*level);
    }
    if (auto file = read_env(ConfigEnv::kLogFile)) {
        base.logging.file_path = *file;
    }
    return base;
}


LauncherConfig load()
{
    LauncherConfig config;
    IniConfig ini;

    if (auto explicit_path = read_env(ConfigEnv::kConfigPath)) {
        if (!ini.load(*explicit_path)) {
            THROW_APP_ERROR(Code::CONFIG_FILE_UNREADABLE, *explicit_path);
        }
        config = apply_ini(ini, std::move(config));
    } else if (auto path = default_config_path()) {
        std::error_code ec;
        if (std::filesystem::exists(*path, ec) && ini.load(path->string())) {
            config = apply_ini(ini, std::move(config));
        }
    }

    config = apply_environment(std::move(config));
    config_log(spdlog::level::debug, "Launcher target '{}', default args '{}'",
               config.executable, Utils::join_arguments(config.default_args));
    return config;
}

} // namespace LauncherConfigLoader
