#pragma once
#include <string>

namespace ticker::core {

enum class ErrorCode {
    OK,
    INVALID_ARGUMENT
};

struct Status {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    Status();
    Status(ErrorCode c, std::string msg);

    bool ok() const;

    static Status success();
    static Status invalid_argument(const std::string& msg);
};

const char* to_string(ErrorCode code);

} // namespace ticker::core
