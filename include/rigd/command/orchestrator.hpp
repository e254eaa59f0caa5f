#pragma once

#include "rigd/adapter/radio_adapter.hpp"
#include "rigd/config/types.hpp"
#include "rigd/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace asio {
class io_context;
}  // namespace asio

namespace rigd::audit {
class AuditLogger;
}  // namespace rigd::audit

namespace rigd::command {

// Applies HTTP write requests to the active adapter. Enforces the transmit
// gate, schedules the confirming re-poll and the optional tune cycle, and
// audits every request.
class Orchestrator {
public:
    static constexpr std::chrono::milliseconds kConfirmDelay{100};

    Orchestrator(asio::io_context& io,
                 const config::RadioConfig& config,
                 adapter::AdapterPtr adapter,
                 audit::AuditLogger& auditLogger);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void setFrequency(const std::string& actor, std::uint64_t hz, bool tune, core::CompletionHandler handler);
    void setMode(const std::string& actor, const std::string& mode, std::uint32_t passbandHz,
                 core::CompletionHandler handler);
    void setPtt(const std::string& actor, bool enabled, core::CompletionHandler handler);

    bool pttEnabled() const noexcept { return config_.pttEnabled; }

private:
    void scheduleConfirm();
    void scheduleTune(const std::string& actor);
    void audit(const std::string& actor, const std::string& action, nlohmann::json parameters,
               const core::CommandResult& result) const;

    asio::io_context& io_;
    config::RadioConfig config_;
    adapter::AdapterPtr adapter_;
    audit::AuditLogger& auditLogger_;
};

}  // namespace rigd::command
