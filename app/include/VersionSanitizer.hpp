#ifndef VERSIONSANITIZER_HPP
#define VERSIONSANITIZER_HPP

#include "VersionString.hpp"

#include <optional>
#include <string>
#include <string_view>

struct SanitizedVersion {
    enum class Source {
        Empty,      // no input; value is ""
        Extracted,  // first dotted-numeric run in the raw text
        Compacted,  // whole input after removing whitespace
        Fallback    // nothing usable; value is "0.0.0"
    };

    Source source{Source::Empty};
    std::string value;
    bool normalized{false}; // ".0" was appended to a bare integer

    bool is_fallback() const { return source == Source::Fallback; }
    bool is_empty() const { return source == Source::Empty; }

    // Parsed form of value; nullopt only for Empty (or components beyond 64 bits)
    std::optional<VersionString> version() const { return VersionString::parse(value); }
};

const char* to_string(SanitizedVersion::Source source);

namespace VersionSanitizer {

inline constexpr std::string_view kFallbackVersion = "0.0.0";

/**
 * @brief Turns a raw accelerator version string into a dotted-numeric one.
 *
 * Never throws. The first run matching \d+(\.\d+)* wins, so "5\n      7"
 * becomes "5.0". Each step is traced on core_logger when it is registered.
 */
SanitizedVersion sanitize(std::string_view raw);

// Absent input behaves like empty input
SanitizedVersion sanitize(const char* raw);

std::string sanitize_string(std::string_view raw);

/**
 * @brief Sanitizes raw and parses the result, falling back to 0.0.0 when
 *        there is nothing to parse.
 */
VersionString sanitize_or_fallback(std::string_view raw);

} // namespace VersionSanitizer

#endif // VERSIONSANITIZER_HPP
