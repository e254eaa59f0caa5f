#pragma once

#include "rigd/core/types.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rigd::adapter {

struct CommandRequest {
    std::string command;
    core::ResponseHandler handler;
    // Lines the backend answers with; they are joined by a single space.
    std::size_t responseLines{1};
};

// FIFO of commands for a link without request IDs. At most one request is on
// the wire; the next received line always belongs to it.
class CommandQueue {
public:
    using Writer = std::function<void(const std::string& command)>;
    // Lines that end a response early (error replies).
    using TerminalLine = std::function<bool(const std::string& line)>;

    explicit CommandQueue(Writer writer, TerminalLine terminal = {});

    // Fails immediately with NotConnected while the link is down.
    void enqueue(CommandRequest request);

    // Returns false for a line nobody asked for.
    bool onResponse(const std::string& line);

    // Going down resolves the in-flight and queued requests with `reason`.
    void setLinkUp(bool up, const core::CommandResult& reason = {core::ErrorCode::NotConnected,
                                                                  "connection lost"});

    bool linkUp() const noexcept { return linkUp_; }
    bool hasPending() const noexcept { return pending_.has_value(); }
    const CommandRequest* pending() const noexcept { return pending_ ? &*pending_ : nullptr; }
    std::size_t queued() const noexcept { return queue_.size(); }

private:
    void process();
    void failAll(const core::CommandResult& reason);

    Writer writer_;
    TerminalLine terminal_;
    std::deque<CommandRequest> queue_;
    std::optional<CommandRequest> pending_;
    std::vector<std::string> partial_;
    bool linkUp_{false};
};

}  // namespace rigd::adapter
