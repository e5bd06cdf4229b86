#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace ErrorCodes {

// Launcher exception carrying a catalog error code
class AppException : public std::runtime_error {
public:
    // Catalog message, with the context as technical details
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    // Custom message; resolution still comes from the catalog
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(ErrorInfo(code,
                                 custom_message,
                                 ErrorCatalog::get_error_info(code).resolution,
                                 context)) {}

    Code get_error_code() const noexcept { return error_info_.code; }

    const ErrorInfo& get_error_info() const noexcept { return error_info_; }

    std::string get_user_message() const { return error_info_.get_user_message(); }

    std::string get_full_details() const { return error_info_.get_full_details(); }

    int get_error_code_int() const noexcept { return static_cast<int>(error_info_.code); }

private:
    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.get_user_message()),
          error_info_(std::move(info)) {}

    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
