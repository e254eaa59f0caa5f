#pragma once

#include <memory>

namespace asio {
class io_context;
class signal_set;
}  // namespace asio

namespace rigd::api {
class ApiGateway;
}  // namespace rigd::api

namespace rigd::audit {
class AuditLogger;
}  // namespace rigd::audit

namespace rigd::command {
class Orchestrator;
}  // namespace rigd::command

namespace rigd::config {
class ConfigManager;
}  // namespace rigd::config

namespace rigd::radio {
class RadioManager;
class StateStore;
}  // namespace rigd::radio

namespace rigd::telemetry {
class TelemetryHub;
}  // namespace rigd::telemetry

namespace rigd::core {

class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) noexcept = delete;
    Application& operator=(Application&&) noexcept = delete;

    // Returns the process exit code.
    int run(int argc, const char* const argv[]);

private:
    void initialize(config::ConfigManager& config);
    void start();
    void stop();

    std::unique_ptr<asio::io_context> ioContext_;
    std::unique_ptr<asio::signal_set> signals_;
    std::unique_ptr<telemetry::TelemetryHub> telemetry_;
    std::unique_ptr<radio::StateStore> state_;
    std::unique_ptr<audit::AuditLogger> auditLogger_;
    std::unique_ptr<radio::RadioManager> radioManager_;
    std::unique_ptr<command::Orchestrator> orchestrator_;
    std::unique_ptr<api::ApiGateway> apiGateway_;
    bool running_{false};
};

}  // namespace rigd::core
