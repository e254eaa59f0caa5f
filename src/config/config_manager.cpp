#include "rigd/config/config_manager.hpp"

#include "rigd/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace rigd::config {

namespace {

std::uint16_t toPort(long long value, std::string_view what) {
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("Invalid " + std::string{what} + ": " + std::to_string(value));
    }
    return static_cast<std::uint16_t>(value);
}

std::uint16_t parsePortArgument(std::string_view flag, const std::string& value) {
    std::size_t consumed = 0;
    long long port = 0;
    try {
        port = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Expected a port number after " + std::string{flag});
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Expected a port number after " + std::string{flag});
    }
    return toPort(port, flag);
}

RadioType requireRadioType(const std::string& value) {
    const auto type = parseRadioType(value);
    if (!type) {
        throw UnknownRadioTypeError("Unknown radio type '" + value +
                                    "' (expected rigctld, flrig or mock)");
    }
    return *type;
}

void parseServer(const YAML::Node& node, ServerConfig& server) {
    if (!node || !node.IsMap()) {
        return;
    }
    if (const auto host = node["host"]) {
        server.host = host.as<std::string>();
    }
    if (const auto port = node["port"]) {
        server.port = toPort(port.as<long long>(), "server.port");
    }
}

std::chrono::milliseconds parseTuneDelay(const YAML::Node& node) {
    try {
        const auto delay = node.as<double>();
        if (delay >= 0.0) {
            return std::chrono::milliseconds{static_cast<long long>(delay)};
        }
    } catch (const YAML::BadConversion&) {
    }
    return kDefaultTuneDelay;
}

void parseRadio(const YAML::Node& node, RadioConfig& radio) {
    if (!node || !node.IsMap()) {
        return;
    }
    if (const auto type = node["type"]) {
        radio.type = requireRadioType(type.as<std::string>());
    }
    if (const auto host = node["host"]) {
        radio.host = host.as<std::string>();
    }
    if (const auto port = node["rigPort"]) {
        radio.rigPort = toPort(port.as<long long>(), "radio.rigPort");
    }
    if (const auto port = node["port"]) {
        radio.rigPort = toPort(port.as<long long>(), "radio.port");
    }
    if (const auto interval = node["pollInterval"]) {
        const auto ms = interval.as<long long>();
        if (ms <= 0) {
            throw std::invalid_argument("radio.pollInterval must be positive");
        }
        radio.pollInterval = std::chrono::milliseconds{ms};
    }
    if (const auto ptt = node["pttEnabled"]) {
        radio.pttEnabled = ptt.as<bool>();
    }
    if (const auto delay = node["tuneDelay"]) {
        radio.tuneDelay = parseTuneDelay(delay);
    }
    if (const auto timeout = node["commandTimeout"]) {
        const auto ms = timeout.as<long long>();
        radio.commandTimeout = std::chrono::milliseconds{ms > 0 ? ms : 0};
    }
}

void parseLogging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node || !node.IsMap()) {
        return;
    }
    if (const auto level = node["level"]) {
        logging.level = level.as<std::string>();
    }
    if (const auto file = node["file"]) {
        logging.file = file.as<std::string>();
    }
}

}  // namespace

std::optional<RadioType> parseRadioType(std::string_view value) {
    std::string lowered;
    lowered.reserve(value.size());
    for (const char c : value) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lowered == "rigctld") {
        return RadioType::Rigctld;
    }
    if (lowered == "flrig") {
        return RadioType::Flrig;
    }
    if (lowered == "mock") {
        return RadioType::Mock;
    }
    return std::nullopt;
}

std::string_view to_string(RadioType type) noexcept {
    switch (type) {
        case RadioType::Rigctld:
            return "rigctld";
        case RadioType::Flrig:
            return "flrig";
        case RadioType::Mock:
            return "mock";
    }
    return "rigctld";
}

CommandLineOptions parseCommandLine(int argc, const char* const argv[]) {
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string_view flag{argv[i]};
        if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + std::string{flag});
        }
        const std::string value{argv[++i]};

        if (flag == "--config") {
            options.configPath = value;
        } else if (flag == "--type") {
            options.type = value;
        } else if (flag == "--rig-host") {
            options.rigHost = value;
        } else if (flag == "--rig-port") {
            options.rigPort = parsePortArgument(flag, value);
        } else if (flag == "--http-port") {
            options.httpPort = parsePortArgument(flag, value);
        } else if (flag == "--log-level") {
            options.logLevel = value;
        } else {
            throw std::invalid_argument("Unknown option " + std::string{flag});
        }
    }

    return options;
}

std::string usage(std::string_view program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --config <path>      configuration file (default rig-config.json)\n"
        << "  --type <kind>        rigctld | flrig | mock\n"
        << "  --rig-host <host>    rig control backend host\n"
        << "  --rig-port <port>    rig control backend port\n"
        << "  --http-port <port>   HTTP API port\n"
        << "  --log-level <level>  trace | debug | info | warn | error\n"
        << "  --help               show this message\n";
    return oss.str();
}

Config parseConfig(std::string_view document, Config base) {
    const YAML::Node root = YAML::Load(std::string{document});
    if (!root || root.IsNull()) {
        return base;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("Configuration root must be an object");
    }

    parseServer(root["server"], base.server);
    parseRadio(root["radio"], base.radio);
    parseLogging(root["logging"], base.logging);
    return base;
}

ConfigManager::ConfigManager(CommandLineOptions options)
    : path_{options.configPath},
      config_{load(options)} {}

Config ConfigManager::load(const CommandLineOptions& options) {
    Config cfg{};

    const bool fileExists = std::filesystem::exists(path_);
    if (fileExists) {
        std::ifstream in{path_};
        std::stringstream buffer;
        buffer << in.rdbuf();
        try {
            cfg = parseConfig(buffer.str());
            loadedFromFile_ = true;
            RIGD_LOG_INFO("[Config] Loaded configuration from {}", path_.string());
        } catch (const UnknownRadioTypeError&) {
            throw;
        } catch (const YAML::Exception& e) {
            RIGD_LOG_ERROR("[Config] Error loading {}: {}. Using defaults.", path_.string(), e.what());
            cfg = Config{};
        } catch (const std::invalid_argument& e) {
            RIGD_LOG_ERROR("[Config] Invalid {}: {}. Using defaults.", path_.string(), e.what());
            cfg = Config{};
        }
    }

    if (options.type) {
        cfg.radio.type = requireRadioType(*options.type);
    }
    if (options.rigHost) {
        cfg.radio.host = *options.rigHost;
    }
    if (options.rigPort) {
        cfg.radio.rigPort = *options.rigPort;
    }
    if (options.httpPort) {
        cfg.server.port = *options.httpPort;
    }
    if (options.logLevel) {
        cfg.logging.level = *options.logLevel;
    }

    // flrig listens on 12345; only guess when nothing pinned the port.
    if (cfg.radio.type == RadioType::Flrig && cfg.radio.rigPort == kDefaultRigctldPort &&
        !options.rigPort && !fileExists) {
        cfg.radio.rigPort = kDefaultFlrigPort;
    }

    return cfg;
}

}  // namespace rigd::config
