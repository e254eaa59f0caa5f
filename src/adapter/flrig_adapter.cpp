#include "rigd/adapter/flrig_adapter.hpp"

#include "rigd/adapter/xmlrpc_codec.hpp"
#include "rigd/common/json_text.hpp"
#include "rigd/logging/logger.hpp"
#include "rigd/radio/state_store.hpp"

#include <cmath>
#include <utility>

namespace rigd::adapter {

namespace methods {
constexpr auto GET_VFO = "rig.get_vfo";
constexpr auto GET_MODE = "rig.get_mode";
constexpr auto GET_PTT = "rig.get_ptt";
constexpr auto GET_MODES = "rig.get_modes";
constexpr auto SET_FREQUENCY = "rig.set_frequency";
constexpr auto SET_MODE = "rig.set_mode";
constexpr auto SET_PTT = "rig.set_ptt";
constexpr auto TUNE = "rig.tune";
}  // namespace methods

std::optional<std::uint64_t> frequencyFromValue(const nlohmann::json& value) {
    double hz = 0.0;
    if (value.is_number()) {
        hz = value.get<double>();
    } else if (value.is_string()) {
        try {
            hz = std::stod(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(hz) || hz < 0.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::llround(hz));
}

bool truthy(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        return !text.empty() && text != "0";
    }
    return false;
}

FlrigAdapter::FlrigAdapter(asio::io_context& io,
                           const config::RadioConfig& config,
                           radio::StateStore& state,
                           std::shared_ptr<IXmlRpcClient> client)
    : io_{io},
      config_{config},
      state_{state},
      client_{std::move(client)},
      pollTimer_{io} {}

std::string FlrigAdapter::id() const {
    return "flrig";
}

void FlrigAdapter::connect() {
    if (running_) {
        return;
    }
    running_ = true;
    RIGD_LOG_INFO("[Flrig] Client initialized for {}:{} (XML-RPC is connectionless)", config_.host,
                  config_.rigPort);
    logSupportedModes();
    schedulePoll();
}

void FlrigAdapter::disconnect() {
    if (!running_) {
        return;
    }
    running_ = false;
    pollTimer_.cancel();
    if (tuner_) {
        tuner_->cancel();
    }
    state_.updateConnected(false);
}

void FlrigAdapter::logSupportedModes() {
    client_->call(methods::GET_MODES, nlohmann::json::array(),
                  [](const core::CommandResult& result, const nlohmann::json& value) {
                      if (result.ok()) {
                          RIGD_LOG_INFO("[Flrig] Supported modes: {}", common::dumpJson(value));
                      } else {
                          RIGD_LOG_WARN("[Flrig] Could not fetch modes: {}", result.message);
                      }
                  });
}

void FlrigAdapter::schedulePoll() {
    pollTimer_.expires_after(config_.pollInterval);
    pollTimer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (ec || !self->running_) {
            return;
        }
        self->poll();
        self->schedulePoll();
    });
}

void FlrigAdapter::onPollResult(const core::CommandResult& result, const std::string& method) {
    if (result.ok()) {
        if (state_.updateConnected(true)) {
            RIGD_LOG_INFO("[Flrig] Backend reachable");
        }
        return;
    }
    if (state_.snapshot().connected) {
        RIGD_LOG_ERROR("[Flrig] Poll error on {}: {}", method, result.message);
    }
    state_.updateConnected(false);
}

void FlrigAdapter::poll() {
    auto self = shared_from_this();

    client_->call(methods::GET_VFO, nlohmann::json::array(),
                  [self](const core::CommandResult& result, const nlohmann::json& value) {
                      self->onPollResult(result, methods::GET_VFO);
                      if (!result.ok()) {
                          return;
                      }
                      if (const auto hz = frequencyFromValue(value)) {
                          self->state_.updateFrequency(*hz);
                      } else {
                          RIGD_LOG_WARN("[Flrig] Unparseable frequency {}", common::dumpJson(value));
                      }
                      self->state_.touch();
                  });

    client_->call(methods::GET_MODE, nlohmann::json::array(),
                  [self](const core::CommandResult& result, const nlohmann::json& value) {
                      self->onPollResult(result, methods::GET_MODE);
                      if (result.ok()) {
                          self->state_.updateMode(xmlrpc::valueToText(value));
                      }
                  });

    client_->call(methods::GET_PTT, nlohmann::json::array(),
                  [self](const core::CommandResult& result, const nlohmann::json& value) {
                      self->onPollResult(result, methods::GET_PTT);
                      if (result.ok()) {
                          self->state_.updateTransmit(truthy(value));
                      }
                  });
}

void FlrigAdapter::sendCommand(const std::string& command, core::ResponseHandler handler) {
    client_->call(command, nlohmann::json::array(),
                  [handler = std::move(handler)](const core::CommandResult& result, const nlohmann::json& value) {
                      if (handler) {
                          handler(result, result.ok() ? xmlrpc::valueToText(value) : std::string{});
                      }
                  });
}

void FlrigAdapter::setFrequency(std::uint64_t hz, core::CompletionHandler handler) {
    const double value = static_cast<double>(hz) + kFrequencyEpsilon;
    client_->call(methods::SET_FREQUENCY, nlohmann::json::array({value}),
                  [self = shared_from_this(), handler = std::move(handler)](const core::CommandResult& result,
                                                                            const nlohmann::json&) {
                      if (result.ok()) {
                          self->state_.touch();
                      }
                      if (handler) {
                          handler(result);
                      }
                  });
}

void FlrigAdapter::setMode(const std::string& mode, std::uint32_t /*passbandHz*/, core::CompletionHandler handler) {
    client_->call(methods::SET_MODE, nlohmann::json::array({mode}),
                  [self = shared_from_this(), handler = std::move(handler)](const core::CommandResult& result,
                                                                            const nlohmann::json&) {
                      if (result.ok()) {
                          self->state_.touch();
                      }
                      if (handler) {
                          handler(result);
                      }
                  });
}

void FlrigAdapter::setPtt(bool enabled, core::CompletionHandler handler) {
    client_->call(methods::SET_PTT, nlohmann::json::array({enabled ? 1 : 0}),
                  [self = shared_from_this(), enabled, handler = std::move(handler)](
                      const core::CommandResult& result, const nlohmann::json&) {
                      if (result.ok()) {
                          self->state_.updateTransmit(enabled);
                          self->state_.touch();
                      }
                      if (handler) {
                          handler(result);
                      }
                  });
}

void FlrigAdapter::tune(core::CompletionHandler handler) {
    if (!tuner_) {
        std::weak_ptr<FlrigAdapter> weak = weak_from_this();
        tuner_ = std::make_shared<TuneSequencer>(
            io_, config_.tuneDelay, config_.pttEnabled,
            [weak](core::CompletionHandler done) {
                auto self = weak.lock();
                if (!self) {
                    done({core::ErrorCode::NotConnected, "adapter stopped"});
                    return;
                }
                self->client_->call(methods::TUNE, nlohmann::json::array({1}),
                                    [done = std::move(done)](const core::CommandResult& result,
                                                             const nlohmann::json&) { done(result); });
            },
            [weak](bool on, core::CompletionHandler done) {
                if (auto self = weak.lock()) {
                    self->setPtt(on, std::move(done));
                } else {
                    done({core::ErrorCode::NotConnected, "adapter stopped"});
                }
            });
    }
    RIGD_LOG_INFO("[Flrig] Sending tune command...");
    tuner_->run(std::move(handler));
}

TuneSequencer::State FlrigAdapter::tuneState() const noexcept {
    return tuner_ ? tuner_->state() : TuneSequencer::State::Idle;
}

}  // namespace rigd::adapter
