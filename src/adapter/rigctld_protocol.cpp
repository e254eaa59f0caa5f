#include "rigd/adapter/rigctld_protocol.hpp"

#include <charconv>
#include <cmath>
#include <sstream>
#include <vector>

namespace rigd::adapter::rigctld {

namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> tokens(std::string_view text) {
    std::vector<std::string_view> out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = text.find_first_of(" \t", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        out.push_back(text.substr(start, end - start));
        pos = end;
    }
    return out;
}

template <typename T>
std::optional<T> parseInteger(std::string_view text) {
    T value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string setFrequency(std::uint64_t hz) {
    return "F " + std::to_string(hz);
}

std::string setMode(std::string_view mode, std::uint32_t passbandHz) {
    std::ostringstream oss;
    oss << "M " << mode << ' ' << passbandHz;
    return oss.str();
}

std::string setPtt(bool enabled) {
    return enabled ? "T 1" : "T 0";
}

std::size_t responseLines(std::string_view command) noexcept {
    return command == kGetMode ? 2 : 1;
}

std::optional<std::uint64_t> parseFrequency(std::string_view line) {
    const auto text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }
    // Some backends print the frequency with a fractional part.
    if (text.find('.') != std::string_view::npos) {
        try {
            const double value = std::stod(std::string{text});
            if (value < 0.0 || !std::isfinite(value)) {
                return std::nullopt;
            }
            return static_cast<std::uint64_t>(std::llround(value));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return parseInteger<std::uint64_t>(text);
}

std::optional<ModeReading> parseMode(std::string_view line) {
    const auto parts = tokens(trim(line));
    if (parts.empty()) {
        return std::nullopt;
    }
    ModeReading reading;
    reading.mode = std::string{parts[0]};
    if (parts.size() > 1) {
        reading.passbandHz = parseInteger<std::uint32_t>(parts[1]).value_or(0);
    }
    return reading;
}

bool parsePtt(std::string_view line) noexcept {
    return trim(line) == "1";
}

std::optional<int> parseReplyCode(std::string_view line) {
    const auto parts = tokens(trim(line));
    if (parts.size() != 2 || parts[0] != "RPRT") {
        return std::nullopt;
    }
    return parseInteger<int>(parts[1]);
}

}  // namespace rigd::adapter::rigctld
