#include "rigd/command/orchestrator.hpp"

#include "rigd/audit/audit_logger.hpp"
#include "rigd/logging/logger.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <memory>
#include <utility>

namespace rigd::command {

namespace {

void complete(const core::CompletionHandler& handler, const core::CommandResult& result) {
    if (handler) {
        handler(result);
    }
}

}  // namespace

Orchestrator::Orchestrator(asio::io_context& io,
                           const config::RadioConfig& config,
                           adapter::AdapterPtr adapter,
                           audit::AuditLogger& auditLogger)
    : io_{io},
      config_{config},
      adapter_{std::move(adapter)},
      auditLogger_{auditLogger} {}

Orchestrator::~Orchestrator() = default;

void Orchestrator::setFrequency(const std::string& actor, std::uint64_t hz, bool tune,
                                core::CompletionHandler handler) {
    nlohmann::json parameters{{"freq", hz}, {"tune", tune}};
    if (hz == 0) {
        core::CommandResult result{core::ErrorCode::BadRequest, "Missing freq"};
        audit(actor, "setFrequency", std::move(parameters), result);
        complete(handler, result);
        return;
    }

    adapter_->setFrequency(hz, [this, actor, hz, tune, parameters = std::move(parameters),
                                handler = std::move(handler)](const core::CommandResult& result) {
        audit(actor, "setFrequency", parameters, result);
        if (result.ok()) {
            RIGD_LOG_INFO("[Orchestrator] Frequency set to {} Hz", hz);
            scheduleConfirm();
            if (tune) {
                scheduleTune(actor);
            }
        } else {
            RIGD_LOG_ERROR("[Orchestrator] Set frequency failed: {}", result.message);
        }
        complete(handler, result);
    });
}

void Orchestrator::setMode(const std::string& actor, const std::string& mode, std::uint32_t passbandHz,
                           core::CompletionHandler handler) {
    nlohmann::json parameters{{"mode", mode}, {"passband", passbandHz}};
    if (mode.empty()) {
        core::CommandResult result{core::ErrorCode::BadRequest, "Missing mode"};
        audit(actor, "setMode", std::move(parameters), result);
        complete(handler, result);
        return;
    }

    adapter_->setMode(mode, passbandHz, [this, actor, mode, parameters = std::move(parameters),
                                         handler = std::move(handler)](const core::CommandResult& result) {
        audit(actor, "setMode", parameters, result);
        if (result.ok()) {
            RIGD_LOG_INFO("[Orchestrator] Mode set to {}", mode);
            scheduleConfirm();
        } else {
            RIGD_LOG_ERROR("[Orchestrator] Set mode failed: {}", result.message);
        }
        complete(handler, result);
    });
}

void Orchestrator::setPtt(const std::string& actor, bool enabled, core::CompletionHandler handler) {
    nlohmann::json parameters{{"ptt", enabled}};
    if (enabled && !config_.pttEnabled) {
        core::CommandResult result{core::ErrorCode::Forbidden, "PTT disabled in configuration"};
        RIGD_LOG_WARN("[Orchestrator] Rejected transmit request from {}", actor);
        audit(actor, "setPtt", std::move(parameters), result);
        complete(handler, result);
        return;
    }

    adapter_->setPtt(enabled, [this, actor, parameters = std::move(parameters),
                               handler = std::move(handler)](const core::CommandResult& result) {
        audit(actor, "setPtt", parameters, result);
        complete(handler, result);
    });
}

void Orchestrator::scheduleConfirm() {
    auto timer = std::make_shared<asio::steady_timer>(io_, kConfirmDelay);
    timer->async_wait([timer, adapter = adapter_](const asio::error_code& ec) {
        if (!ec) {
            adapter->poll();
        }
    });
}

void Orchestrator::scheduleTune(const std::string& actor) {
    RIGD_LOG_INFO("[Orchestrator] Tune scheduled in {} ms", config_.tuneDelay.count());
    auto timer = std::make_shared<asio::steady_timer>(io_, config_.tuneDelay);
    timer->async_wait([this, timer, actor, adapter = adapter_](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        adapter->tune([this, actor](const core::CommandResult& result) {
            audit(actor, "tune", nlohmann::json::object(), result);
            if (!result.ok()) {
                RIGD_LOG_ERROR("[Orchestrator] Tune failed: {}", result.message);
            }
        });
    });
}

void Orchestrator::audit(const std::string& actor, const std::string& action, nlohmann::json parameters,
                         const core::CommandResult& result) const {
    auditLogger_.record(audit::AuditRecord{actor, action, std::move(parameters), result.code, result.message});
}

}  // namespace rigd::command
