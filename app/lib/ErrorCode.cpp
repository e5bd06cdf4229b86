#include "ErrorCode.hpp"

#include <sstream>
#include <utility>

namespace ErrorCodes {

ErrorInfo::ErrorInfo(Code code,
                     std::string message,
                     std::string resolution,
                     std::string technical_details)
    : code(code),
      message(std::move(message)),
      resolution(std::move(resolution)),
      technical_details(std::move(technical_details))
{
}


std::string ErrorInfo::get_user_message() const
{
    if (technical_details.empty()) {
        return message;
    }
    return message + " (" + technical_details + ")";
}


std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error Code: " << static_cast<int>(code) << "\n"
        << "Message: " << message << "\n";
    if (!resolution.empty()) {
        oss << "Resolution: " << resolution << "\n";
    }
    if (!technical_details.empty()) {
        oss << "Details: " << technical_details << "\n";
    }
    return oss.str();
}


ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
    case Code::CONFIG_FILE_UNREADABLE:
        return ErrorInfo(code,
            "Configuration file could not be read",
            "Check that FOUNDRY_CPU_CONFIG points at a readable INI file.",
            context);
    case Code::CONFIG_INVALID:
        return ErrorInfo(code,
            "Configuration value is invalid",
            "Fix the value in the configuration file or the matching FOUNDRY_CPU_* variable.",
            context);
    case Code::SPAWN_EXECUTABLE_NOT_FOUND:
        return ErrorInfo(code,
            "Executable not found on PATH",
            "Install the runtime CLI, add its directory to PATH, "
            "or set FOUNDRY_CPU_EXECUTABLE to its full path.",
            context);
    case Code::SPAWN_PIPE_FAILED:
        return ErrorInfo(code,
            "Failed to create output pipes for the child process",
            "Check the open file descriptor limit (ulimit -n).",
            context);
    case Code::SPAWN_FORK_FAILED:
        return ErrorInfo(code,
            "Failed to create the child process",
            "Check the process limit and available memory.",
            context);
    case Code::SPAWN_EXEC_FAILED:
        return ErrorInfo(code,
            "Failed to execute the runtime CLI",
            "Check that the file is executable and built for this platform.",
            context);
    case Code::PROCESS_WAIT_FAILED:
        return ErrorInfo(code,
            "Lost track of the child process",
            "",
            context);
    case Code::OUTPUT_RELAY_FAILED:
        return ErrorInfo(code,
            "Failed to read output from the child process",
            "",
            context);
    case Code::UNKNOWN_ERROR:
        break;
    }
    return ErrorInfo(Code::UNKNOWN_ERROR, "Unknown error", "", context);
}

} // namespace ErrorCodes
