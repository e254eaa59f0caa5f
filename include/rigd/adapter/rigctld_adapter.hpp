#pragma once

#include "rigd/adapter/command_queue.hpp"
#include "rigd/adapter/radio_adapter.hpp"
#include "rigd/config/types.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rigd::radio {
class StateStore;
}  // namespace rigd::radio

namespace rigd::adapter {

class TuneSequencer;

// rigctld line protocol over one TCP connection.
class RigctldAdapter : public IRadioAdapter, public std::enable_shared_from_this<RigctldAdapter> {
public:
    static constexpr std::chrono::milliseconds kReconnectDelay{5000};
    // Longest reply line accepted before the link is treated as broken.
    static constexpr std::size_t kMaxLineBytes{4096};

    RigctldAdapter(asio::io_context& io,
                   const config::RadioConfig& config,
                   radio::StateStore& state,
                   std::chrono::milliseconds reconnectDelay = kReconnectDelay);
    ~RigctldAdapter() override;

    std::string id() const override;

    void connect() override;
    void disconnect() override;
    void poll() override;

    void sendCommand(const std::string& command, core::ResponseHandler handler) override;
    void setFrequency(std::uint64_t hz, core::CompletionHandler handler) override;
    void setMode(const std::string& mode, std::uint32_t passbandHz, core::CompletionHandler handler) override;
    void setPtt(bool enabled, core::CompletionHandler handler) override;
    void tune(core::CompletionHandler handler) override;

    bool linkUp() const noexcept { return queue_.linkUp(); }
    std::uint64_t connectAttempts() const noexcept { return connectAttempts_; }

private:
    void startConnect();
    void onConnected();
    void startRead();
    void writeCommand(const std::string& command);
    void releaseTransmitter();
    void dropLink(const std::string& reason, core::ErrorCode code = core::ErrorCode::NotConnected);
    void scheduleReconnect();
    void schedulePoll();
    void armCommandTimer();
    void applyResponse(const std::string& command, const std::string& line);
    void sendWrite(const std::string& command, core::CompletionHandler handler,
                   std::function<void()> onSuccess = {});

    asio::io_context& io_;
    config::RadioConfig config_;
    radio::StateStore& state_;
    std::chrono::milliseconds reconnectDelay_;

    asio::ip::tcp::resolver resolver_;
    std::unique_ptr<asio::ip::tcp::socket> socket_;
    asio::steady_timer reconnectTimer_;
    asio::steady_timer pollTimer_;
    asio::steady_timer commandTimer_;

    CommandQueue queue_;
    std::shared_ptr<TuneSequencer> tuner_;
    std::string readBuffer_;
    std::string writeBuffer_;

    bool running_{false};
    bool connecting_{false};
    std::uint64_t generation_{0};
    std::uint64_t connectAttempts_{0};
};

}  // namespace rigd::adapter
