#pragma once

#include "rigd/core/types.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace rigd::adapter {

// Idle -> TryNative -> Idle on success, otherwise
// FallbackKeyDown -> (keyDuration) -> FallbackKeyUp -> Idle.
class TuneSequencer : public std::enable_shared_from_this<TuneSequencer> {
public:
    enum class State {
        Idle,
        TryNative,
        FallbackKeyDown,
        FallbackKeyUp
    };

    using NativeStep = std::function<void(core::CompletionHandler)>;
    using KeyStep = std::function<void(bool, core::CompletionHandler)>;

    TuneSequencer(asio::io_context& io,
                  std::chrono::milliseconds keyDuration,
                  bool keyingAllowed,
                  NativeStep native,
                  KeyStep key);

    void run(core::CompletionHandler handler);

    // Cuts a running sequence short. A key-down that is still in progress is
    // followed by the release as soon as it completes.
    void cancel();

    State state() const noexcept { return state_; }

private:
    void fallback(core::CompletionHandler handler);
    void release(core::CompletionHandler handler);
    void finish(const core::CommandResult& result, const core::CompletionHandler& handler);

    asio::steady_timer timer_;
    std::chrono::milliseconds keyDuration_;
    bool keyingAllowed_;
    NativeStep native_;
    KeyStep key_;
    State state_{State::Idle};
    bool cancelled_{false};
};

std::string_view to_string(TuneSequencer::State state) noexcept;

}  // namespace rigd::adapter
