#include "rigd/radio/radio_state.hpp"

namespace rigd::radio {

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json toStatusJson(const RadioState& state) {
    return nlohmann::json{
        {"connected", state.connected},
        {"freq", state.frequencyHz},
        {"mode", state.mode},
        {"width", state.passbandHz},
        {"ptt", state.transmitEnabled},
        {"timestamp", toEpochMillis(state.lastUpdateAt)},
    };
}

nlohmann::json toInitEvent(const RadioState& state) {
    return nlohmann::json{
        {"type", "init"},
        {"connected", state.connected},
        {"freq", state.frequencyHz},
        {"mode", state.mode},
        {"width", state.passbandHz},
        {"ptt", state.transmitEnabled},
    };
}

}  // namespace rigd::radio
