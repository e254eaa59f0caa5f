#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace rigd::core {

enum class ErrorCode {
    Ok,
    BadRequest,
    Forbidden,
    Busy,
    NotConnected,
    Transport,
    Fault,
    Timeout,
    Internal,
};

struct CommandResult {
    ErrorCode code{ErrorCode::Ok};
    std::string message{};

    bool ok() const noexcept { return code == ErrorCode::Ok; }
};

using CompletionHandler = std::function<void(const CommandResult&)>;
using ResponseHandler = std::function<void(const CommandResult&, const std::string&)>;

std::string_view to_string(ErrorCode code) noexcept;

// HTTP status the gateway answers with for a failed command.
int httpStatus(ErrorCode code) noexcept;

}  // namespace rigd::core
