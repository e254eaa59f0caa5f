#include "rigd/core/types.hpp"

namespace rigd::core {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "OK";
        case ErrorCode::BadRequest:
            return "BAD_REQUEST";
        case ErrorCode::Forbidden:
            return "FORBIDDEN";
        case ErrorCode::Busy:
            return "BUSY";
        case ErrorCode::NotConnected:
            return "NOT_CONNECTED";
        case ErrorCode::Transport:
            return "TRANSPORT";
        case ErrorCode::Fault:
            return "FAULT";
        case ErrorCode::Timeout:
            return "TIMEOUT";
        case ErrorCode::Internal:
            return "INTERNAL";
    }

    return "UNKNOWN";
}

int httpStatus(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return 200;
        case ErrorCode::BadRequest:
            return 400;
        case ErrorCode::Forbidden:
            return 403;
        default:
            return 500;
    }
}

}  // namespace rigd::core
