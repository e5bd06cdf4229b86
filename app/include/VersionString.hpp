#ifndef VERSIONSTRING_HPP
#define VERSIONSTRING_HPP

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Dotted numeric version with at least major.minor components.
 *
 * Only parse() and fallback() create values, so every instance satisfies
 * ^\d+(\.\d+)+$. The original spelling (including leading zeros) is kept
 * in str(); comparisons are numeric and pad missing components with zero.
 */
class VersionString {
public:
    /**
     * @brief Strict parse of a clean version such as "12.0.1".
     * @return std::nullopt for anything else, including "12", "12.0\n",
     *         or components that overflow 64 bits.
     */
    static std::optional<VersionString> parse(std::string_view text);

    /**
     * @brief The fixed "0.0.0" used when no real version can be recovered.
     */
    static VersionString fallback();

    const std::vector<std::uint64_t>& components() const noexcept { return components_; }
    std::uint64_t major_component() const noexcept { return components_[0]; }
    std::uint64_t minor_component() const noexcept { return components_[1]; }
    const std::string& str() const noexcept { return text_; }

    std::strong_ordering operator<=>(const VersionString& other) const;
    bool operator==(const VersionString& other) const;

private:
    VersionString(std::string text, std::vector<std::uint64_t> components);

    std::string text_;
    std::vector<std::uint64_t> components_;
};

#endif // VERSIONSTRING_HPP
