#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace asio {
class io_context;
}  // namespace asio

namespace rigd::telemetry {

using SubscriberId = std::uint64_t;

// Receives fully framed SSE text.
using EventSink = std::function<void(const std::string& frame)>;

class TelemetryHub {
public:
    static constexpr std::chrono::seconds kDefaultHeartbeat{15};

    TelemetryHub(asio::io_context& io, std::chrono::seconds heartbeatInterval = kDefaultHeartbeat);
    ~TelemetryHub();

    TelemetryHub(const TelemetryHub&) = delete;
    TelemetryHub& operator=(const TelemetryHub&) = delete;
    TelemetryHub(TelemetryHub&&) noexcept = delete;
    TelemetryHub& operator=(TelemetryHub&&) noexcept = delete;

    void start();
    void stop();

    SubscriberId subscribe(EventSink sink);
    void unsubscribe(SubscriberId id);
    std::size_t subscriberCount() const noexcept;

    void publish(const nlohmann::json& event);
    void publishUpdate(std::string_view prop, nlohmann::json value);

    static std::string formatEvent(const nlohmann::json& event);

private:
    void deliver(const std::string& frame);
    void scheduleHeartbeat();

    class Heartbeat;
    std::unique_ptr<Heartbeat> heartbeat_;
    std::map<SubscriberId, EventSink> subscribers_;
    SubscriberId nextId_{1};
};

}  // namespace rigd::telemetry
