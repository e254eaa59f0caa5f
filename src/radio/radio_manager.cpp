#include "rigd/radio/radio_manager.hpp"

#include "rigd/adapter/flrig_adapter.hpp"
#include "rigd/adapter/mock_adapter.hpp"
#include "rigd/adapter/rigctld_adapter.hpp"
#include "rigd/adapter/xmlrpc_client.hpp"
#include "rigd/logging/logger.hpp"
#include "rigd/radio/state_store.hpp"

#include <asio/io_context.hpp>

#include <stdexcept>

namespace rigd::radio {

RadioManager::RadioManager(asio::io_context& io, const config::RadioConfig& config, StateStore& state)
    : config_{config},
      adapter_{createAdapter(io, config, state)} {}

RadioManager::~RadioManager() {
    stop();
}

adapter::AdapterPtr RadioManager::createAdapter(asio::io_context& io,
                                                const config::RadioConfig& config,
                                                StateStore& state) {
    switch (config.type) {
        case config::RadioType::Rigctld:
            return std::make_shared<adapter::RigctldAdapter>(io, config, state);
        case config::RadioType::Flrig:
            return std::make_shared<adapter::FlrigAdapter>(
                io, config, state,
                std::make_shared<adapter::HttpXmlRpcClient>(io, config.host, config.rigPort));
        case config::RadioType::Mock:
            return std::make_shared<adapter::MockAdapter>(io, config, state);
    }
    throw std::invalid_argument("unsupported radio type");
}

void RadioManager::start() {
    if (started_) {
        return;
    }
    started_ = true;
    RIGD_LOG_INFO("[RadioManager] Starting {} adapter ({}:{}, poll every {} ms)", adapter_->id(), config_.host,
                  config_.rigPort, config_.pollInterval.count());
    adapter_->connect();
}

void RadioManager::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    RIGD_LOG_INFO("[RadioManager] Stopping {} adapter", adapter_->id());
    adapter_->disconnect();
}

}  // namespace rigd::radio
