#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace {

bool is_executable_file(const std::filesystem::path& candidate)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        return false;
    }
    return access(candidate.c_str(), X_OK) == 0;
}

}

namespace Utils {

std::optional<std::filesystem::path> find_executable(const std::string& name,
                                                     const std::string& path_list)
{
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        const std::filesystem::path direct(name);
        if (is_executable_file(direct)) {
            return direct;
        }
        return std::nullopt;
    }

    std::size_t start = 0;
    while (start <= path_list.size()) {
        const std::size_t end = std::min(path_list.find(':', start), path_list.size());
        std::string dir = path_list.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}


std::optional<std::filesystem::path> find_executable_on_path(const std::string& name)
{
    const char* path_env = std::getenv("PATH");
    return find_executable(name, path_env ? std::string(path_env) : std::string("/usr/bin:/bin"));
}


std::vector<std::string> split_whitespace(std::string_view text)
{
    std::vector<std::string> parts;
    std::istringstream stream{std::string(text)};
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}


std::string join_arguments(const std::vector<std::string>& args)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << args[i];
    }
    return oss.str();
}


std::string escape_control_chars(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char ch : text) {
        switch (ch) {
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        default:
            if (std::iscntrl(static_cast<unsigned char>(ch))) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\x%02X",
                              static_cast<unsigned>(static_cast<unsigned char>(ch)));
                escaped += buffer;
            } else {
                escaped += ch;
            }
        }
    }
    return escaped;
}


std::string to_lower_copy(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}


std::string trim_copy(std::string_view text)
{
    const char* whitespace = " \t\n\r\f\v";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(whitespace);
    return std::string(text.substr(begin, end - begin + 1));
}

} // namespace Utils
