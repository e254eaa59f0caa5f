#pragma once

#include "rigd/core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rigd::adapter {

// One implementation per backend kind, chosen once at startup.
class IRadioAdapter {
public:
    virtual ~IRadioAdapter() = default;

    virtual std::string id() const = 0;

    // Starts the link (where there is one) and the poll loop.
    virtual void connect() = 0;
    // Cancels timers and closes the link; pending handlers are dropped.
    virtual void disconnect() = 0;

    // Issues one round of read commands.
    virtual void poll() = 0;

    virtual void sendCommand(const std::string& command, core::ResponseHandler handler) = 0;
    virtual void setFrequency(std::uint64_t hz, core::CompletionHandler handler) = 0;
    virtual void setMode(const std::string& mode, std::uint32_t passbandHz,
                         core::CompletionHandler handler) = 0;
    virtual void setPtt(bool enabled, core::CompletionHandler handler) = 0;
    virtual void tune(core::CompletionHandler handler) = 0;
};

using AdapterPtr = std::shared_ptr<IRadioAdapter>;

}  // namespace rigd::adapter
