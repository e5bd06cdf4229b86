#include "EnvironmentOverlay.hpp"

#include <set>
#include <utility>

extern char **environ;

namespace {

std::string key_of(const std::string& entry)
{
    const auto equal_pos = entry.find('=');
    if (equal_pos == std::string::npos) {
        return entry;
    }
    return entry.substr(0, equal_pos);
}

}


EnvironmentOverlay::EnvironmentOverlay(Entries entries)
    : entries_(std::move(entries))
{
}


EnvironmentOverlay EnvironmentOverlay::force_cpu(const VersionString& version_override)
{
    return EnvironmentOverlay(Entries{
        {EnvNames::kExecutionProvider, EnvNames::kCpuExecutionProvider},
        {EnvNames::kVisibleDevices, EnvNames::kNoVisibleDevices},
        {EnvNames::kSkipAcceleratorCheck, "1"},
        {EnvNames::kVersionOverride, version_override.str()},
        {EnvNames::kAcceleratorVersion, version_override.str()},
    });
}


EnvironmentOverlay EnvironmentOverlay::with(const std::string& key, const std::string& value) const
{
    Entries merged = entries_;
    merged[key] = value;
    return EnvironmentOverlay(std::move(merged));
}


EnvironmentOverlay EnvironmentOverlay::with(const Entries& extra) const
{
    Entries merged = entries_;
    for (const auto& [key, value] : extra) {
        merged[key] = value;
    }
    return EnvironmentOverlay(std::move(merged));
}


std::optional<std::string> EnvironmentOverlay::value_of(const std::string& key) const
{
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}


std::vector<std::string> EnvironmentOverlay::apply_to(const std::vector<std::string>& base) const
{
    std::vector<std::string> merged;
    merged.reserve(base.size() + entries_.size());
    std::set<std::string> applied;

    for (const auto& entry : base) {
        const std::string key = key_of(entry);
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            merged.push_back(entry);
            continue;
        }
        // Duplicate keys in the base block collapse into the first occurrence
        if (applied.insert(key).second) {
            merged.push_back(key + "=" + it->second);
        }
    }

    for (const auto& [key, value] : entries_) {
        if (!applied.contains(key)) {
            merged.push_back(key + "=" + value);
        }
    }
    return merged;
}


std::vector<std::string> EnvironmentOverlay::current_environment()
{
    std::vector<std::string> env_vars;
    for (char **env = environ; env != nullptr && *env != nullptr; ++env) {
        env_vars.emplace_back(*env);
    }
    return env_vars;
}
