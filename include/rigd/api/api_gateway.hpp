#pragma once

#include "rigd/config/types.hpp"

#include <cstdint>
#include <memory>

namespace asio {
class io_context;
}  // namespace asio

namespace rigd::command {
class Orchestrator;
}  // namespace rigd::command

namespace rigd::radio {
class StateStore;
}  // namespace rigd::radio

namespace rigd::telemetry {
class TelemetryHub;
}  // namespace rigd::telemetry

namespace rigd::api {

/**
 * @brief HTTP/1.1 front end.
 *
 * GET /status and GET /stream (SSE) read the shared state; POST /freq, /mode
 * and /ptt go through the orchestrator. Every connection except /stream is
 * closed after one response.
 */
class ApiGateway {
public:
    ApiGateway(asio::io_context& io,
               const config::ServerConfig& config,
               command::Orchestrator& orchestrator,
               radio::StateStore& state,
               telemetry::TelemetryHub& telemetry);
    ~ApiGateway();

    ApiGateway(const ApiGateway&) = delete;
    ApiGateway& operator=(const ApiGateway&) = delete;
    ApiGateway(ApiGateway&&) noexcept = delete;
    ApiGateway& operator=(ApiGateway&&) noexcept = delete;

    // Throws std::system_error if the listen socket cannot be bound.
    void start();
    void stop();

    // Actual listening port; differs from the configured one when that is 0.
    std::uint16_t boundPort() const;

    std::size_t sessionCount() const;

private:
    class Impl;
    class Session;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rigd::api
