#include "rigd/radio/state_store.hpp"

#include "rigd/telemetry/telemetry_hub.hpp"

namespace rigd::radio {

StateStore::StateStore(telemetry::TelemetryHub& telemetry)
    : telemetry_{telemetry} {}

void StateStore::seed(const RadioState& state) {
    state_ = state;
}

template <typename T>
bool StateStore::apply(T& field, const T& value, std::string_view prop) {
    if (field == value) {
        return false;
    }
    field = value;
    telemetry_.publishUpdate(prop, nlohmann::json(value));
    return true;
}

bool StateStore::updateFrequency(std::uint64_t hz) {
    return apply(state_.frequencyHz, hz, "freq");
}

bool StateStore::updateMode(const std::string& mode) {
    return apply(state_.mode, mode, "mode");
}

bool StateStore::updatePassband(std::uint32_t hz) {
    return apply(state_.passbandHz, hz, "width");
}

bool StateStore::updateTransmit(bool enabled) {
    return apply(state_.transmitEnabled, enabled, "ptt");
}

bool StateStore::updateConnected(bool connected) {
    return apply(state_.connected, connected, "connected");
}

void StateStore::touch() {
    state_.lastUpdateAt = std::chrono::system_clock::now();
}

}  // namespace rigd::radio
