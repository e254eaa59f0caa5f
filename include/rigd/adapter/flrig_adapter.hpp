#pragma once

#include "rigd/adapter/radio_adapter.hpp"
#include "rigd/adapter/tune_sequencer.hpp"
#include "rigd/adapter/xmlrpc_client.hpp"
#include "rigd/config/types.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <memory>
#include <optional>
#include <string>

namespace rigd::radio {
class StateStore;
}  // namespace rigd::radio

namespace rigd::adapter {

// flrig XML-RPC backend. Every call is independent; there is no queue.
class FlrigAdapter : public IRadioAdapter, public std::enable_shared_from_this<FlrigAdapter> {
public:
    // Keeps whole-Hz values from being serialized as <i4>, which flrig rejects.
    static constexpr double kFrequencyEpsilon{0.1};

    FlrigAdapter(asio::io_context& io,
                 const config::RadioConfig& config,
                 radio::StateStore& state,
                 std::shared_ptr<IXmlRpcClient> client);

    std::string id() const override;

    void connect() override;
    void disconnect() override;
    void poll() override;

    void sendCommand(const std::string& command, core::ResponseHandler handler) override;
    void setFrequency(std::uint64_t hz, core::CompletionHandler handler) override;
    void setMode(const std::string& mode, std::uint32_t passbandHz, core::CompletionHandler handler) override;
    void setPtt(bool enabled, core::CompletionHandler handler) override;
    void tune(core::CompletionHandler handler) override;

    TuneSequencer::State tuneState() const noexcept;

private:
    void schedulePoll();
    void onPollResult(const core::CommandResult& result, const std::string& method);
    void logSupportedModes();

    asio::io_context& io_;
    config::RadioConfig config_;
    radio::StateStore& state_;
    std::shared_ptr<IXmlRpcClient> client_;
    asio::steady_timer pollTimer_;
    std::shared_ptr<TuneSequencer> tuner_;
    bool running_{false};
};

std::optional<std::uint64_t> frequencyFromValue(const nlohmann::json& value);
bool truthy(const nlohmann::json& value);

}  // namespace rigd::adapter
