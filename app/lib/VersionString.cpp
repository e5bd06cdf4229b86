#include "VersionString.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace {

constexpr std::string_view kFallbackVersion = "0.0.0";

bool is_digit(char ch)
{
    return ch >= '0' && ch <= '9';
}

}


VersionString::VersionString(std::string text, std::vector<std::uint64_t> components)
    : text_(std::move(text)),
      components_(std::move(components))
{
}


std::optional<VersionString> VersionString::parse(std::string_view text)
{
    std::vector<std::uint64_t> components;
    std::size_t pos = 0;
    while (true) {
        const std::size_t start = pos;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }

        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data() + start, text.data() + pos, value);
        if (ec != std::errc() || ptr != text.data() + pos) {
            return std::nullopt;
        }
        components.push_back(value);

        if (pos == text.size()) {
            break;
        }
        if (text[pos] != '.') {
            return std::nullopt;
        }
        ++pos;
    }

    if (components.size() < 2) {
        return std::nullopt;
    }
    return VersionString(std::string(text), std::move(components));
}


VersionString VersionString::fallback()
{
    return VersionString(std::string(kFallbackVersion), {0, 0, 0});
}


std::strong_ordering VersionString::operator<=>(const VersionString& other) const
{
    const std::size_t count = std::max(components_.size(), other.components_.size());
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint64_t lhs = i < components_.size() ? components_[i] : 0;
        const std::uint64_t rhs = i < other.components_.size() ? other.components_[i] : 0;
        if (lhs != rhs) {
            return lhs <=> rhs;
        }
    }
    return std::strong_ordering::equal;
}


bool VersionString::operator==(const VersionString& other) const
{
    return (*this <=> other) == std::strong_ordering::equal;
}
