#include "rigd/adapter/rigctld_adapter.hpp"

#include "rigd/adapter/rigctld_protocol.hpp"
#include "rigd/adapter/tune_sequencer.hpp"
#include "rigd/logging/logger.hpp"
#include "rigd/radio/state_store.hpp"

#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <utility>

namespace rigd::adapter {

namespace {

std::string trimLine(std::string line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

}  // namespace

RigctldAdapter::RigctldAdapter(asio::io_context& io,
                               const config::RadioConfig& config,
                               radio::StateStore& state,
                               std::chrono::milliseconds reconnectDelay)
    : io_{io},
      config_{config},
      state_{state},
      reconnectDelay_{reconnectDelay},
      resolver_{io},
      reconnectTimer_{io},
      pollTimer_{io},
      commandTimer_{io},
      queue_{[this](const std::string& command) { writeCommand(command); },
             [](const std::string& line) { return rigctld::parseReplyCode(line).has_value(); }} {}

RigctldAdapter::~RigctldAdapter() = default;

std::string RigctldAdapter::id() const {
    return "rigctld";
}

void RigctldAdapter::connect() {
    if (running_) {
        return;
    }
    running_ = true;
    startConnect();
    schedulePoll();
}

void RigctldAdapter::disconnect() {
    if (!running_) {
        return;
    }
    releaseTransmitter();
    running_ = false;
    ++generation_;

    reconnectTimer_.cancel();
    pollTimer_.cancel();
    commandTimer_.cancel();
    resolver_.cancel();
    if (tuner_) {
        tuner_->cancel();
    }
    if (socket_) {
        asio::error_code ignored;
        socket_->close(ignored);
    }
    connecting_ = false;
    queue_.setLinkUp(false, {core::ErrorCode::NotConnected, "adapter stopped"});
    state_.updateConnected(false);
}

void RigctldAdapter::releaseTransmitter() {
    if (!tuner_ || !socket_ || !queue_.linkUp()) {
        return;
    }
    const auto tuneState = tuner_->state();
    if (tuneState != TuneSequencer::State::FallbackKeyDown && tuneState != TuneSequencer::State::FallbackKeyUp) {
        return;
    }

    // The queue is about to fail, so the release goes straight to the socket.
    RIGD_LOG_WARN("[Rigctld] Releasing PTT before disconnect ({})", to_string(tuneState));
    const std::string command = rigctld::setPtt(false) + "\n";
    asio::error_code ec;
    asio::write(*socket_, asio::buffer(command), ec);
    if (ec) {
        RIGD_LOG_ERROR("[Rigctld] Failed to release PTT: {}", ec.message());
        return;
    }
    state_.updateTransmit(false);
}

void RigctldAdapter::startConnect() {
    if (!running_ || connecting_ || queue_.linkUp()) {
        return;
    }
    connecting_ = true;
    ++connectAttempts_;
    RIGD_LOG_INFO("[Rigctld] Connecting to {}:{}...", config_.host, config_.rigPort);

    socket_ = std::make_unique<asio::ip::tcp::socket>(io_);
    resolver_.async_resolve(
        config_.host, std::to_string(config_.rigPort),
        [self = shared_from_this(), gen = generation_](const asio::error_code& ec,
                                                         asio::ip::tcp::resolver::results_type results) {
            if (gen != self->generation_ || !self->running_) {
                return;
            }
            if (ec) {
                RIGD_LOG_ERROR("[Rigctld] Error: cannot resolve {}: {}", self->config_.host, ec.message());
                self->connecting_ = false;
                self->scheduleReconnect();
                return;
            }
            asio::async_connect(
                *self->socket_, results,
                [self, gen](const asio::error_code& connectEc, const asio::ip::tcp::endpoint&) {
                    if (gen != self->generation_ || !self->running_) {
                        return;
                    }
                    self->connecting_ = false;
                    if (connectEc) {
                        RIGD_LOG_ERROR("[Rigctld] Error: {}", connectEc.message());
                        self->scheduleReconnect();
                        return;
                    }
                    self->onConnected();
                });
        });
}

void RigctldAdapter::onConnected() {
    RIGD_LOG_INFO("[Rigctld] Connected");
    asio::error_code ignored;
    socket_->set_option(asio::ip::tcp::no_delay{true}, ignored);
    readBuffer_.clear();
    state_.updateConnected(true);
    queue_.setLinkUp(true);
    startRead();
}

void RigctldAdapter::startRead() {
    asio::async_read_until(
        *socket_, asio::dynamic_buffer(readBuffer_, kMaxLineBytes), '\n',
        [self = shared_from_this(), gen = generation_](const asio::error_code& ec, std::size_t n) {
            if (gen != self->generation_ || !self->running_) {
                return;
            }
            if (ec == asio::error::not_found) {
                self->dropLink("reply line too long", core::ErrorCode::Transport);
                return;
            }
            if (ec) {
                self->dropLink(ec == asio::error::eof ? "closed by peer" : ec.message());
                return;
            }

            const auto line = trimLine(self->readBuffer_.substr(0, n));
            self->readBuffer_.erase(0, n);
            if (!line.empty()) {
                if (!self->queue_.onResponse(line)) {
                    RIGD_LOG_DEBUG("[Rigctld] Ignoring unsolicited line '{}'", line);
                }
                if (!self->queue_.hasPending()) {
                    self->commandTimer_.cancel();
                }
            }

            // A response handler may have torn the link down.
            if (gen == self->generation_) {
                self->startRead();
            }
        });
}

void RigctldAdapter::writeCommand(const std::string& command) {
    RIGD_LOG_DEBUG("[Rigctld] > {}", command);
    writeBuffer_ = command + "\n";
    armCommandTimer();
    asio::async_write(*socket_, asio::buffer(writeBuffer_),
                      [self = shared_from_this(), gen = generation_](const asio::error_code& ec, std::size_t) {
                          if (gen != self->generation_ || !self->running_) {
                              return;
                          }
                          if (ec) {
                              self->dropLink(ec.message());
                          }
                      });
}

void RigctldAdapter::armCommandTimer() {
    if (config_.commandTimeout.count() <= 0) {
        return;
    }
    commandTimer_.expires_after(config_.commandTimeout);
    commandTimer_.async_wait([self = shared_from_this(), gen = generation_](const asio::error_code& ec) {
        if (ec || gen != self->generation_ || !self->queue_.hasPending()) {
            return;
        }
        RIGD_LOG_WARN("[Rigctld] No reply to '{}' within {} ms", self->queue_.pending()->command,
                      self->config_.commandTimeout.count());
        self->dropLink("command timeout", core::ErrorCode::Timeout);
    });
}

void RigctldAdapter::dropLink(const std::string& reason, core::ErrorCode code) {
    RIGD_LOG_WARN("[Rigctld] Disconnected ({})", reason);
    ++generation_;
    commandTimer_.cancel();
    if (socket_) {
        asio::error_code ignored;
        socket_->close(ignored);
    }
    state_.updateConnected(false);
    queue_.setLinkUp(false, {code, reason});
    scheduleReconnect();
}

void RigctldAdapter::scheduleReconnect() {
    if (!running_) {
        return;
    }
    RIGD_LOG_INFO("[Rigctld] Reconnecting in {} ms", reconnectDelay_.count());
    reconnectTimer_.expires_after(reconnectDelay_);
    reconnectTimer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (!ec) {
            self->startConnect();
        }
    });
}

void RigctldAdapter::schedulePoll() {
    pollTimer_.expires_after(config_.pollInterval);
    pollTimer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (ec || !self->running_) {
            return;
        }
        self->poll();
        self->schedulePoll();
    });
}

void RigctldAdapter::poll() {
    if (!queue_.linkUp()) {
        return;
    }
    if (queue_.queued() > 0) {
        RIGD_LOG_DEBUG("[Rigctld] Skipping poll, {} commands still queued", queue_.queued());
        return;
    }
    sendCommand(rigctld::kGetFrequency, nullptr);
    sendCommand(rigctld::kGetMode, nullptr);
    sendCommand(rigctld::kGetPtt, nullptr);
}

void RigctldAdapter::sendCommand(const std::string& command, core::ResponseHandler handler) {
    CommandRequest request;
    request.command = command;
    request.responseLines = rigctld::responseLines(command);
    request.handler = [self = shared_from_this(), command, handler = std::move(handler)](
                          const core::CommandResult& result, const std::string& line) {
        core::CommandResult outcome = result;
        if (outcome.ok()) {
            if (const auto code = rigctld::parseReplyCode(line); code && *code != 0) {
                outcome = {core::ErrorCode::Fault, "rigctld error " + std::to_string(*code)};
            } else {
                self->applyResponse(command, line);
            }
        }
        if (handler) {
            handler(outcome, line);
        }
    };
    queue_.enqueue(std::move(request));
}

void RigctldAdapter::applyResponse(const std::string& command, const std::string& line) {
    if (command == rigctld::kGetFrequency) {
        if (const auto hz = rigctld::parseFrequency(line)) {
            state_.updateFrequency(*hz);
        } else {
            RIGD_LOG_WARN("[Rigctld] Unparseable frequency reply '{}'", line);
        }
    } else if (command == rigctld::kGetMode) {
        if (const auto reading = rigctld::parseMode(line)) {
            state_.updateMode(reading->mode);
            state_.updatePassband(reading->passbandHz);
        }
    } else if (command == rigctld::kGetPtt) {
        state_.updateTransmit(rigctld::parsePtt(line));
    }
    state_.touch();
}

void RigctldAdapter::sendWrite(const std::string& command, core::CompletionHandler handler,
                               std::function<void()> onSuccess) {
    sendCommand(command, [handler = std::move(handler), onSuccess = std::move(onSuccess)](
                             const core::CommandResult& result, const std::string&) {
        if (result.ok() && onSuccess) {
            onSuccess();
        }
        if (handler) {
            handler(result);
        }
    });
}

void RigctldAdapter::setFrequency(std::uint64_t hz, core::CompletionHandler handler) {
    sendWrite(rigctld::setFrequency(hz), std::move(handler));
}

void RigctldAdapter::setMode(const std::string& mode, std::uint32_t passbandHz, core::CompletionHandler handler) {
    sendWrite(rigctld::setMode(mode, passbandHz), std::move(handler));
}

void RigctldAdapter::setPtt(bool enabled, core::CompletionHandler handler) {
    sendWrite(rigctld::setPtt(enabled), std::move(handler),
              [self = shared_from_this(), enabled] { self->state_.updateTransmit(enabled); });
}

void RigctldAdapter::tune(core::CompletionHandler handler) {
    if (!tuner_) {
        std::weak_ptr<RigctldAdapter> weak = weak_from_this();
        tuner_ = std::make_shared<TuneSequencer>(
            io_, config_.tuneDelay, config_.pttEnabled,
            [weak](core::CompletionHandler done) {
                if (auto self = weak.lock()) {
                    self->sendWrite(rigctld::kTuneOn, std::move(done));
                } else if (done) {
                    done({core::ErrorCode::NotConnected, "adapter stopped"});
                }
            },
            [weak](bool on, core::CompletionHandler done) {
                if (auto self = weak.lock()) {
                    self->setPtt(on, std::move(done));
                } else if (done) {
                    done({core::ErrorCode::NotConnected, "adapter stopped"});
                }
            });
    }
    RIGD_LOG_INFO("[Rigctld] Sending tune command...");
    tuner_->run(std::move(handler));
}

}  // namespace rigd::adapter
