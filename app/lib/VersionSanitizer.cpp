#include "VersionSanitizer.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cctype>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

template <typename... Args>
void sanitizer_trace(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto logger = Logger::get_logger("core_logger");
    if (!logger || !logger->should_log(level)) {
        return;
    }
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    logger->log(level, "{}", message);
}

bool is_digit(char ch)
{
    return ch >= '0' && ch <= '9';
}

// End of the run \d+(\.\d+)* starting at begin. Scanned by hand because
// std::regex recursion depth grows with the match length.
std::size_t dotted_run_end(std::string_view text, std::size_t begin)
{
    std::size_t pos = begin;
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    while (pos + 1 < text.size() && text[pos] == '.' && is_digit(text[pos + 1])) {
        pos += 2;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
        }
    }
    return pos;
}

std::optional<std::string_view> first_dotted_run(std::string_view text)
{
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (is_digit(text[pos])) {
            return text.substr(pos, dotted_run_end(text, pos) - pos);
        }
    }
    return std::nullopt;
}

bool is_dotted_version(std::string_view text)
{
    return !text.empty() && is_digit(text.front()) && dotted_run_end(text, 0) == text.size();
}

std::string remove_whitespace(std::string_view text)
{
    std::string compacted;
    compacted.reserve(text.size());
    for (const char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            compacted += ch;
        }
    }
    return compacted;
}

bool ensure_major_minor(std::string& version)
{
    if (version.find('.') != std::string::npos) {
        return false;
    }
    version += ".0";
    return true;
}

}


const char* to_string(SanitizedVersion::Source source)
{
    switch (source) {
    case SanitizedVersion::Source::Empty: return "empty";
    case SanitizedVersion::Source::Extracted: return "extracted";
    case SanitizedVersion::Source::Compacted: return "compacted";
    case SanitizedVersion::Source::Fallback: return "fallback";
    }
    return "unknown";
}

namespace VersionSanitizer {

SanitizedVersion sanitize(std::string_view raw)
{
    SanitizedVersion result;
    if (raw.empty()) {
        return result;
    }

    const std::string input(raw);
    const std::string escaped = Utils::escape_control_chars(input);

    if (auto run = first_dotted_run(input)) {
        result.source = SanitizedVersion::Source::Extracted;
        result.value = std::string(*run);
        result.normalized = ensure_major_minor(result.value);
        if (result.normalized) {
            sanitizer_trace(spdlog::level::debug, "Normalized single component to '{}'", result.value);
        }
        sanitizer_trace(spdlog::level::debug, "Extracted version '{}' from '{}'", result.value, escaped);
        return result;
    }

    std::string compacted = remove_whitespace(input);
    if (is_dotted_version(compacted)) {
        result.source = SanitizedVersion::Source::Compacted;
        result.normalized = ensure_major_minor(compacted);
        result.value = std::move(compacted);
        sanitizer_trace(spdlog::level::debug, "Compacted version '{}' from '{}'", result.value, escaped);
        return result;
    }

    result.source = SanitizedVersion::Source::Fallback;
    result.value = std::string(kFallbackVersion);
    sanitizer_trace(spdlog::level::info,
                    "Could not parse accelerator version '{}', defaulting to {}", escaped, kFallbackVersion);
    return result;
}


SanitizedVersion sanitize(const char* raw)
{
    if (raw == nullptr) {
        return SanitizedVersion{};
    }
    return sanitize(std::string_view(raw));
}


std::string sanitize_string(std::string_view raw)
{
    return sanitize(raw).value;
}


VersionString sanitize_or_fallback(std::string_view raw)
{
    const SanitizedVersion sanitized = sanitize(raw);
    if (auto version = sanitized.version()) {
        return *version;
    }
    sanitizer_trace(spdlog::level::info,
                    "No usable accelerator version in '{}', using {}",
                    Utils::escape_control_chars(raw), kFallbackVersion);
    return VersionString::fallback();
}

} // namespace VersionSanitizer
