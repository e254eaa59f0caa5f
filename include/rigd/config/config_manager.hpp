#pragma once

#include "rigd/config/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rigd::config {

struct CommandLineOptions {
    std::filesystem::path configPath{"rig-config.json"};
    std::optional<std::string> type;
    std::optional<std::string> rigHost;
    std::optional<std::uint16_t> rigPort;
    std::optional<std::uint16_t> httpPort;
    std::optional<std::string> logLevel;
    bool showHelp{false};
};

// Startup is refused for a radio type no adapter implements, whether it comes
// from the file or the command line.
class UnknownRadioTypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Throws std::invalid_argument on unknown flags or bad values.
CommandLineOptions parseCommandLine(int argc, const char* const argv[]);
std::string usage(std::string_view program);

// Parses a configuration document (JSON or YAML) on top of `base`.
Config parseConfig(std::string_view document, Config base = Config{});

class ConfigManager {
public:
    explicit ConfigManager(CommandLineOptions options);

    const Config& get() const noexcept { return config_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    bool loadedFromFile() const noexcept { return loadedFromFile_; }

private:
    Config load(const CommandLineOptions& options);

    std::filesystem::path path_;
    bool loadedFromFile_{false};
    Config config_;
};

}  // namespace rigd::config
