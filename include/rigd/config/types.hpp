#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rigd::config {

enum class RadioType {
    Rigctld,
    Flrig,
    Mock
};

std::optional<RadioType> parseRadioType(std::string_view value);
std::string_view to_string(RadioType type) noexcept;

inline constexpr std::uint16_t kDefaultRigctldPort{4532};
inline constexpr std::uint16_t kDefaultFlrigPort{12345};
inline constexpr std::chrono::milliseconds kDefaultTuneDelay{3000};

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{5555};
};

struct RadioConfig {
    RadioType type{RadioType::Rigctld};
    std::string host{"127.0.0.1"};
    std::uint16_t rigPort{kDefaultRigctldPort};
    std::chrono::milliseconds pollInterval{1000};
    bool pttEnabled{false};
    std::chrono::milliseconds tuneDelay{kDefaultTuneDelay};
    // Zero waits for the link itself to fail.
    std::chrono::milliseconds commandTimeout{0};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};
};

struct Config {
    ServerConfig server{};
    RadioConfig radio{};
    LoggingConfig logging{};
};

}  // namespace rigd::config
