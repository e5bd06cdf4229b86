#ifndef SANITIZERPROBE_HPP
#define SANITIZERPROBE_HPP

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace SanitizerProbe {

/**
 * @brief One report line, e.g. "'5\n  7' -> '5.0' (extracted, normalized)".
 */
std::string describe(std::string_view raw);

/**
 * @brief Reports every argument, or all of in as a single raw string when
 *        args is empty.
 * @return Process exit code (always 0).
 */
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out);

} // namespace SanitizerProbe

#endif // SANITIZERPROBE_HPP
