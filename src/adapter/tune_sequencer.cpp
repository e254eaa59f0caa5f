#include "rigd/adapter/tune_sequencer.hpp"

#include "rigd/logging/logger.hpp"

#include <utility>

namespace rigd::adapter {

TuneSequencer::TuneSequencer(asio::io_context& io,
                             std::chrono::milliseconds keyDuration,
                             bool keyingAllowed,
                             NativeStep native,
                             KeyStep key)
    : timer_{io},
      keyDuration_{keyDuration},
      keyingAllowed_{keyingAllowed},
      native_{std::move(native)},
      key_{std::move(key)} {}

void TuneSequencer::run(core::CompletionHandler handler) {
    if (state_ != State::Idle) {
        if (handler) {
            handler({core::ErrorCode::Busy, "tune already in progress"});
        }
        return;
    }

    state_ = State::TryNative;
    cancelled_ = false;
    native_([self = shared_from_this(), handler = std::move(handler)](const core::CommandResult& result) mutable {
        if (result.ok()) {
            RIGD_LOG_INFO("[Tune] Native tune command accepted");
            self->finish(result, handler);
            return;
        }
        if (self->cancelled_) {
            self->finish({core::ErrorCode::NotConnected, "tune cancelled"}, handler);
            return;
        }
        RIGD_LOG_WARN("[Tune] Native tune failed ({}), falling back to PTT keying", result.message);
        self->fallback(std::move(handler));
    });
}

void TuneSequencer::cancel() {
    if (state_ == State::Idle) {
        return;
    }
    cancelled_ = true;
    timer_.cancel();
}

void TuneSequencer::fallback(core::CompletionHandler handler) {
    if (!keyingAllowed_) {
        finish({core::ErrorCode::Forbidden, "PTT disabled in configuration"}, handler);
        return;
    }

    state_ = State::FallbackKeyDown;
    key_(true, [self = shared_from_this(), handler = std::move(handler)](const core::CommandResult& result) mutable {
        if (!result.ok()) {
            self->finish(result, handler);
            return;
        }
        if (self->cancelled_) {
            self->release(std::move(handler));
            return;
        }
        self->timer_.expires_after(self->keyDuration_);
        self->timer_.async_wait([self, handler = std::move(handler)](const asio::error_code&) mutable {
            self->release(std::move(handler));
        });
    });
}

void TuneSequencer::release(core::CompletionHandler handler) {
    state_ = State::FallbackKeyUp;
    key_(false, [self = shared_from_this(), handler = std::move(handler)](const core::CommandResult& result) {
        if (result.ok()) {
            RIGD_LOG_INFO("[Tune] Fallback tune (PTT) completed");
        } else {
            RIGD_LOG_ERROR("[Tune] Failed to release PTT after fallback tune: {}", result.message);
        }
        self->finish(result, handler);
    });
}

void TuneSequencer::finish(const core::CommandResult& result, const core::CompletionHandler& handler) {
    state_ = State::Idle;
    if (handler) {
        handler(result);
    }
}

std::string_view to_string(TuneSequencer::State state) noexcept {
    switch (state) {
        case TuneSequencer::State::Idle:
            return "idle";
        case TuneSequencer::State::TryNative:
            return "try_native";
        case TuneSequencer::State::FallbackKeyDown:
            return "fallback_key_down";
        case TuneSequencer::State::FallbackKeyUp:
            return "fallback_key_up";
    }
    return "idle";
}

}  // namespace rigd::adapter
