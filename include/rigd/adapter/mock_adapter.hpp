#pragma once

#include "rigd/adapter/radio_adapter.hpp"
#include "rigd/config/types.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace rigd::radio {
class StateStore;
}  // namespace rigd::radio

namespace rigd::adapter {

// Simulated radio with no I/O. Writes land in the state store immediately.
class MockAdapter : public IRadioAdapter, public std::enable_shared_from_this<MockAdapter> {
public:
    static constexpr std::uint64_t kSeedFrequency{14074000};
    static constexpr const char* kSeedMode{"USB"};
    static constexpr std::uint32_t kSeedPassband{2400};
    static constexpr std::chrono::milliseconds kSimulatedTune{3000};

    MockAdapter(asio::io_context& io, const config::RadioConfig& config, radio::StateStore& state);

    std::string id() const override;

    void connect() override;
    void disconnect() override;
    void poll() override;

    void sendCommand(const std::string& command, core::ResponseHandler handler) override;
    void setFrequency(std::uint64_t hz, core::CompletionHandler handler) override;
    void setMode(const std::string& mode, std::uint32_t passbandHz, core::CompletionHandler handler) override;
    void setPtt(bool enabled, core::CompletionHandler handler) override;
    void tune(core::CompletionHandler handler) override;

    bool tuning() const noexcept { return tuning_; }

private:
    void scheduleRefresh();

    config::RadioConfig config_;
    radio::StateStore& state_;
    asio::steady_timer refreshTimer_;
    asio::steady_timer tuneTimer_;
    bool running_{false};
    bool tuning_{false};
};

}  // namespace rigd::adapter
