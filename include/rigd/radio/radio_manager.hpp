#pragma once

#include "rigd/adapter/radio_adapter.hpp"
#include "rigd/config/types.hpp"

#include <memory>

namespace asio {
class io_context;
}  // namespace asio

namespace rigd::radio {

class StateStore;

// Owns the single adapter selected by `radio.type`.
class RadioManager {
public:
    RadioManager(asio::io_context& io, const config::RadioConfig& config, StateStore& state);
    ~RadioManager();

    RadioManager(const RadioManager&) = delete;
    RadioManager& operator=(const RadioManager&) = delete;

    void start();
    void stop();

    adapter::AdapterPtr adapter() const noexcept { return adapter_; }
    config::RadioType type() const noexcept { return config_.type; }

    static adapter::AdapterPtr createAdapter(asio::io_context& io,
                                             const config::RadioConfig& config,
                                             StateStore& state);

private:
    config::RadioConfig config_;
    adapter::AdapterPtr adapter_;
    bool started_{false};
};

}  // namespace rigd::radio
