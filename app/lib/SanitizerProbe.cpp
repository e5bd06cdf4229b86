#include "SanitizerProbe.hpp"
#include "Utils.hpp"
#include "VersionSanitizer.hpp"

#include <iterator>
#include <sstream>

namespace SanitizerProbe {

std::string describe(std::string_view raw)
{
    const SanitizedVersion sanitized = VersionSanitizer::sanitize(raw);

    std::ostringstream line;
    line << "'" << Utils::escape_control_chars(raw) << "' -> '" << sanitized.value << "' ("
         << to_string(sanitized.source);
    if (sanitized.normalized) {
        line << ", normalized";
    }
    line << ")";

    if (sanitized.is_empty()) {
        line << " no version available";
    } else if (auto version = sanitized.version()) {
        line << " parses as " << version->major_component() << "." << version->minor_component();
    } else {
        line << " not representable";
    }
    return line.str();
}


int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out)
{
    if (args.empty()) {
        const std::string raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        out << describe(raw) << "\n";
        return 0;
    }

    for (const auto& raw : args) {
        out << describe(raw) << "\n";
    }
    return 0;
}

} // namespace SanitizerProbe
