#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

/**
 * @brief Resolves an executable name the way execvp does.
 * @param name Bare name searched in path_list, or a path when it contains '/'.
 * @param path_list Colon-separated directory list; empty entries mean ".".
 * @return Path of the first regular, executable match.
 */
std::optional<std::filesystem::path> find_executable(const std::string& name,
                                                     const std::string& path_list);

/**
 * @brief Resolves an executable against the current PATH.
 */
std::optional<std::filesystem::path> find_executable_on_path(const std::string& name);

std::vector<std::string> split_whitespace(std::string_view text);

std::string join_arguments(const std::vector<std::string>& args);

/**
 * @brief Makes control characters visible: \n, \r, \t and \xHH for the rest.
 */
std::string escape_control_chars(std::string_view text);

std::string to_lower_copy(std::string_view text);

std::string trim_copy(std::string_view text);

} // namespace Utils

#endif // UTILS_HPP
