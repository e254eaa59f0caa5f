#pragma once

#include "rigd/radio/radio_state.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace rigd::telemetry {
class TelemetryHub;
}  // namespace rigd::telemetry

namespace rigd::radio {

// Owns the shared RadioState. Every update is diffed against the stored value;
// only real changes are written and published to the telemetry hub.
class StateStore {
public:
    explicit StateStore(telemetry::TelemetryHub& telemetry);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    const RadioState& snapshot() const noexcept { return state_; }

    // Replaces the whole record without publishing.
    void seed(const RadioState& state);

    bool updateFrequency(std::uint64_t hz);
    bool updateMode(const std::string& mode);
    bool updatePassband(std::uint32_t hz);
    bool updateTransmit(bool enabled);
    bool updateConnected(bool connected);

    // Marks a successful poll or write confirmation.
    void touch();

private:
    template <typename T>
    bool apply(T& field, const T& value, std::string_view prop);

    telemetry::TelemetryHub& telemetry_;
    RadioState state_{};
};

}  // namespace rigd::radio
