#include <ticker/core/status.hpp>
#include <utility>

namespace ticker::core {

Status::Status()
    : code(ErrorCode::OK) {}

Status::Status(ErrorCode c, std::string msg)
    : code(c), message(std::move(msg)) {}

bool Status::ok() const {
    return code == ErrorCode::OK;
}

Status Status::success() {
    return Status();
}

Status Status::invalid_argument(const std::string& msg) {
    return Status(ErrorCode::INVALID_ARGUMENT, msg);
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

} // namespace ticker::core
