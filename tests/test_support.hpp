#pragma once

#include <asio/io_context.hpp>

#include <chrono>
#include <functional>

namespace rigd::test {

// Runs the context in small slices until `done` holds or the timeout expires.
inline bool runUntil(asio::io_context& io, const std::function<bool()>& done,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds{3000}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io.restart();
        io.run_for(std::chrono::milliseconds{10});
    }
    return done();
}

inline void runFor(asio::io_context& io, std::chrono::milliseconds duration) {
    runUntil(io, [] { return false; }, duration);
}

}  // namespace rigd::test
