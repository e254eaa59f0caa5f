#include "rigd/adapter/mock_adapter.hpp"

#include "rigd/adapter/rigctld_protocol.hpp"
#include "rigd/logging/logger.hpp"
#include "rigd/radio/state_store.hpp"

#include <utility>

namespace rigd::adapter {

MockAdapter::MockAdapter(asio::io_context& io, const config::RadioConfig& config, radio::StateStore& state)
    : config_{config},
      state_{state},
      refreshTimer_{io},
      tuneTimer_{io} {}

std::string MockAdapter::id() const {
    return "mock";
}

void MockAdapter::connect() {
    if (running_) {
        return;
    }
    running_ = true;

    radio::RadioState seeded;
    seeded.frequencyHz = kSeedFrequency;
    seeded.mode = kSeedMode;
    seeded.passbandHz = kSeedPassband;
    seeded.transmitEnabled = false;
    seeded.connected = false;
    state_.seed(seeded);
    state_.updateConnected(true);
    state_.touch();

    RIGD_LOG_INFO("[Mock] Simulated radio ready at {} Hz {}", kSeedFrequency, kSeedMode);
    scheduleRefresh();
}

void MockAdapter::disconnect() {
    if (!running_) {
        return;
    }
    running_ = false;
    refreshTimer_.cancel();
    tuneTimer_.cancel();
    state_.updateConnected(false);
}

void MockAdapter::poll() {
    state_.touch();
}

void MockAdapter::scheduleRefresh() {
    refreshTimer_.expires_after(config_.pollInterval);
    refreshTimer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (ec || !self->running_) {
            return;
        }
        self->poll();
        self->scheduleRefresh();
    });
}

void MockAdapter::sendCommand(const std::string& command, core::ResponseHandler handler) {
    const auto& state = state_.snapshot();
    std::string reply;
    if (command == rigctld::kGetFrequency) {
        reply = std::to_string(state.frequencyHz);
    } else if (command == rigctld::kGetMode) {
        reply = state.mode + " " + std::to_string(state.passbandHz);
    } else if (command == rigctld::kGetPtt) {
        reply = state.transmitEnabled ? "1" : "0";
    } else {
        reply = "RPRT 0";
    }
    RIGD_LOG_DEBUG("[Mock] {} -> {}", command, reply);
    if (handler) {
        handler({}, reply);
    }
}

void MockAdapter::setFrequency(std::uint64_t hz, core::CompletionHandler handler) {
    state_.updateFrequency(hz);
    state_.touch();
    if (handler) {
        handler({});
    }
}

void MockAdapter::setMode(const std::string& mode, std::uint32_t passbandHz, core::CompletionHandler handler) {
    state_.updateMode(mode);
    if (passbandHz > 0) {
        state_.updatePassband(passbandHz);
    }
    state_.touch();
    if (handler) {
        handler({});
    }
}

void MockAdapter::setPtt(bool enabled, core::CompletionHandler handler) {
    state_.updateTransmit(enabled);
    state_.touch();
    if (handler) {
        handler({});
    }
}

void MockAdapter::tune(core::CompletionHandler handler) {
    if (tuning_) {
        if (handler) {
            handler({core::ErrorCode::Busy, "tune already in progress"});
        }
        return;
    }
    tuning_ = true;
    RIGD_LOG_INFO("[Mock] Simulating tune cycle");
    tuneTimer_.expires_after(kSimulatedTune);
    tuneTimer_.async_wait([self = shared_from_this(), handler = std::move(handler)](const asio::error_code& ec) {
        self->tuning_ = false;
        if (ec) {
            if (handler) {
                handler({core::ErrorCode::NotConnected, "adapter stopped"});
            }
            return;
        }
        RIGD_LOG_INFO("[Mock] Tune cycle complete");
        if (handler) {
            handler({});
        }
    });
}

}  // namespace rigd::adapter
