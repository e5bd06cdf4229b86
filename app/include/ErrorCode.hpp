#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Numeric error codes grouped by category.
enum class Code : int {
    // Configuration (1000-1099)
    CONFIG_FILE_UNREADABLE = 1000,
    CONFIG_INVALID = 1001,

    // Child process (1100-1199)
    SPAWN_EXECUTABLE_NOT_FOUND = 1100,
    SPAWN_PIPE_FAILED = 1101,
    SPAWN_FORK_FAILED = 1102,
    SPAWN_EXEC_FAILED = 1103,
    PROCESS_WAIT_FAILED = 1104,
    OUTPUT_RELAY_FAILED = 1105,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string technical_details;

    ErrorInfo(Code code,
              std::string message,
              std::string resolution,
              std::string technical_details = "");

    // Message followed by the technical context, if any
    std::string get_user_message() const;

    // Everything, including the numeric code and the resolution steps
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
