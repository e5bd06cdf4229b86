#ifndef ENVIRONMENTOVERLAY_HPP
#define ENVIRONMENTOVERLAY_HPP

#include "VersionString.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace EnvNames {
inline constexpr const char* kExecutionProvider = "FOUNDRY_EXECUTION_PROVIDER";
inline constexpr const char* kVisibleDevices = "CUDA_VISIBLE_DEVICES";
inline constexpr const char* kSkipAcceleratorCheck = "FOUNDRY_SKIP_CUDA_CHECK";
inline constexpr const char* kVersionOverride = "FOUNDRY_CUDA_VERSION_OVERRIDE";
inline constexpr const char* kAcceleratorVersion = "CUDA_VERSION";

inline constexpr const char* kCpuExecutionProvider = "CPUExecutionProvider";
inline constexpr const char* kNoVisibleDevices = "-1";
} // namespace EnvNames

/**
 * @brief Immutable set of variables forced into a child's environment.
 *
 * The overlay never touches the calling process' environment; apply_to()
 * works on a copy of an environment block.
 */
class EnvironmentOverlay {
public:
    using Entries = std::map<std::string, std::string>;

    EnvironmentOverlay() = default;
    explicit EnvironmentOverlay(Entries entries);

    /**
     * @brief Overlay that hides every accelerator and pins the CPU provider.
     * @param version_override Reported accelerator version for the version probe.
     */
    static EnvironmentOverlay force_cpu(const VersionString& version_override);

    // Copy with key set to value; later calls win
    EnvironmentOverlay with(const std::string& key, const std::string& value) const;
    EnvironmentOverlay with(const Entries& extra) const;

    const Entries& entries() const noexcept { return entries_; }
    std::optional<std::string> value_of(const std::string& key) const;
    bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Merges the overlay into a KEY=VALUE environment block.
     *
     * Existing keys are replaced in place, missing keys are appended in key
     * order and unrelated entries are kept untouched.
     */
    std::vector<std::string> apply_to(const std::vector<std::string>& base) const;

    // Snapshot of this process' environ as KEY=VALUE strings
    static std::vector<std::string> current_environment();

private:
    Entries entries_;
};

#endif // ENVIRONMENTOVERLAY_HPP
