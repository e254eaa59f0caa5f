#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace rigd::radio {

struct RadioState {
    std::uint64_t frequencyHz{0};
    std::string mode{};
    std::uint32_t passbandHz{0};
    bool transmitEnabled{false};
    bool connected{false};
    std::chrono::system_clock::time_point lastUpdateAt{};
};

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) noexcept;

// GET /status body.
nlohmann::json toStatusJson(const RadioState& state);

// First event of every /stream subscription.
nlohmann::json toInitEvent(const RadioState& state);

}  // namespace rigd::radio
