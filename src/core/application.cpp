#include "rigd/core/application.hpp"

#include "rigd/api/api_gateway.hpp"
#include "rigd/audit/audit_logger.hpp"
#include "rigd/command/orchestrator.hpp"
#include "rigd/config/config_manager.hpp"
#include "rigd/logging/logger.hpp"
#include "rigd/radio/radio_manager.hpp"
#include "rigd/radio/state_store.hpp"
#include "rigd/telemetry/telemetry_hub.hpp"
#include "rigd/version.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace rigd::core {

Application::Application() = default;

Application::~Application() {
    stop();
}

int Application::run(int argc, const char* const argv[]) {
    const std::string_view program = argc > 0 ? argv[0] : "rigd";

    config::CommandLineOptions options;
    try {
        options = config::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::usage(program);
        return 1;
    }
    if (options.showHelp) {
        std::cout << config::usage(program);
        return 0;
    }

    // Console logging until the configuration file has been read.
    logging::LogConfig early;
    if (options.logLevel) {
        early.level = logging::stringToLevel(*options.logLevel);
    }
    logging::initialize(early);

    try {
        config::ConfigManager config{options};
        const auto& settings = config.get();

        logging::LogConfig logConfig;
        logConfig.level = logging::stringToLevel(settings.logging.level);
        logConfig.filePath = settings.logging.file;
        logging::initialize(logConfig);

        RIGD_LOG_INFO("Rig daemon starting...");
        RIGD_LOG_INFO("Version: {} ({})", kVersion, kGitVersion);
        RIGD_LOG_INFO("Build Time: {}", kBuildTimestamp);
        RIGD_LOG_INFO("Configuration: {} ({})", config.path().string(),
                      config.loadedFromFile() ? "loaded" : "defaults");
        RIGD_LOG_INFO("Log level: {}", logging::levelToString(logConfig.level));

        initialize(config);
        start();
    } catch (const std::invalid_argument& e) {
        RIGD_LOG_ERROR("Configuration error: {}", e.what());
        logging::shutdown();
        return 1;
    } catch (const std::system_error& e) {
        RIGD_LOG_ERROR("Startup failed: {}", e.what());
        stop();
        logging::shutdown();
        return 1;
    }

    ioContext_->run();
    stop();

    RIGD_LOG_INFO("Rig daemon stopped");
    logging::shutdown();
    return 0;
}

void Application::initialize(config::ConfigManager& config) {
    const auto& settings = config.get();

    ioContext_ = std::make_unique<asio::io_context>(1);
    signals_ = std::make_unique<asio::signal_set>(*ioContext_, SIGINT, SIGTERM);

    telemetry_ = std::make_unique<telemetry::TelemetryHub>(*ioContext_);
    state_ = std::make_unique<radio::StateStore>(*telemetry_);
    auditLogger_ = std::make_unique<audit::AuditLogger>();
    radioManager_ = std::make_unique<radio::RadioManager>(*ioContext_, settings.radio, *state_);
    orchestrator_ = std::make_unique<command::Orchestrator>(*ioContext_, settings.radio, radioManager_->adapter(),
                                                            *auditLogger_);
    apiGateway_ = std::make_unique<api::ApiGateway>(*ioContext_, settings.server, *orchestrator_, *state_,
                                                    *telemetry_);

    RIGD_LOG_INFO("Radio: {} at {}:{} (PTT {})", config::to_string(settings.radio.type), settings.radio.host,
                  settings.radio.rigPort, settings.radio.pttEnabled ? "enabled" : "disabled");
}

void Application::start() {
    running_ = true;
    signals_->async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        RIGD_LOG_INFO("Received signal {}, shutting down...", signal);
        stop();
    });

    telemetry_->start();
    radioManager_->start();
    apiGateway_->start();
}

void Application::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    if (apiGateway_) {
        apiGateway_->stop();
    }
    if (radioManager_) {
        radioManager_->stop();
    }
    if (telemetry_) {
        telemetry_->stop();
    }
    if (signals_) {
        asio::error_code ignored;
        signals_->cancel(ignored);
    }
    if (ioContext_) {
        ioContext_->stop();
    }
}

}  // namespace rigd::core
