#include "rigd/adapter/command_queue.hpp"

#include <utility>

namespace rigd::adapter {

CommandQueue::CommandQueue(Writer writer, TerminalLine terminal)
    : writer_{std::move(writer)},
      terminal_{std::move(terminal)} {}

void CommandQueue::enqueue(CommandRequest request) {
    if (!linkUp_) {
        if (request.handler) {
            request.handler({core::ErrorCode::NotConnected, "not connected"}, {});
        }
        return;
    }
    queue_.push_back(std::move(request));
    process();
}

bool CommandQueue::onResponse(const std::string& line) {
    if (!pending_) {
        return false;
    }

    partial_.push_back(line);
    const bool terminal = terminal_ && terminal_(line);
    if (!terminal && partial_.size() < pending_->responseLines) {
        return true;
    }

    std::string response;
    for (const auto& part : partial_) {
        if (!response.empty()) {
            response.push_back(' ');
        }
        response += part;
    }
    partial_.clear();

    auto request = std::move(*pending_);
    pending_.reset();
    if (request.handler) {
        request.handler({}, response);
    }
    process();
    return true;
}

void CommandQueue::setLinkUp(bool up, const core::CommandResult& reason) {
    if (linkUp_ == up) {
        return;
    }
    linkUp_ = up;
    if (up) {
        process();
    } else {
        failAll(reason);
    }
}

void CommandQueue::process() {
    if (pending_ || queue_.empty() || !linkUp_) {
        return;
    }
    pending_ = std::move(queue_.front());
    queue_.pop_front();
    writer_(pending_->command);
}

void CommandQueue::failAll(const core::CommandResult& reason) {
    std::deque<CommandRequest> dropped;
    if (pending_) {
        dropped.push_back(std::move(*pending_));
        pending_.reset();
    }
    partial_.clear();
    while (!queue_.empty()) {
        dropped.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    for (auto& request : dropped) {
        if (request.handler) {
            request.handler(reason, {});
        }
    }
}

}  // namespace rigd::adapter
