#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rigd::adapter::rigctld {

inline constexpr char kGetFrequency[] = "f";
inline constexpr char kGetMode[] = "m";
inline constexpr char kGetPtt[] = "t";
inline constexpr char kTuneOn[] = "U TUNER 1";

struct ModeReading {
    std::string mode;
    std::uint32_t passbandHz{0};
};

std::string setFrequency(std::uint64_t hz);
std::string setMode(std::string_view mode, std::uint32_t passbandHz);
std::string setPtt(bool enabled);

// `m` is answered with the mode and the passband on separate lines.
std::size_t responseLines(std::string_view command) noexcept;

std::optional<std::uint64_t> parseFrequency(std::string_view line);
std::optional<ModeReading> parseMode(std::string_view line);
bool parsePtt(std::string_view line) noexcept;

// Value of an "RPRT <n>" reply, if the line is one.
std::optional<int> parseReplyCode(std::string_view line);

}  // namespace rigd::adapter::rigctld
