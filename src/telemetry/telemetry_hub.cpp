#include "rigd/telemetry/telemetry_hub.hpp"

#include "rigd/common/json_text.hpp"
#include "rigd/logging/logger.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <utility>
#include <vector>

namespace rigd::telemetry {

namespace {
constexpr auto kHeartbeatFrame = ": keepalive\n\n";
}  // namespace

class TelemetryHub::Heartbeat {
public:
    Heartbeat(asio::io_context& io, std::chrono::seconds interval)
        : timer_{io},
          interval_{interval} {}

    asio::steady_timer timer_;
    std::chrono::seconds interval_;
    bool running_{false};
};

TelemetryHub::TelemetryHub(asio::io_context& io, std::chrono::seconds heartbeatInterval)
    : heartbeat_{std::make_unique<Heartbeat>(io, heartbeatInterval)} {}

TelemetryHub::~TelemetryHub() = default;

void TelemetryHub::start() {
    heartbeat_->running_ = true;
    scheduleHeartbeat();
}

void TelemetryHub::stop() {
    heartbeat_->running_ = false;
    heartbeat_->timer_.cancel();
    subscribers_.clear();
}

SubscriberId TelemetryHub::subscribe(EventSink sink) {
    const auto id = nextId_++;
    subscribers_.emplace(id, std::move(sink));
    RIGD_LOG_DEBUG("[Telemetry] subscriber {} attached ({} total)", id, subscribers_.size());
    return id;
}

void TelemetryHub::unsubscribe(SubscriberId id) {
    if (subscribers_.erase(id) > 0) {
        RIGD_LOG_DEBUG("[Telemetry] subscriber {} detached ({} total)", id, subscribers_.size());
    }
}

std::size_t TelemetryHub::subscriberCount() const noexcept {
    return subscribers_.size();
}

void TelemetryHub::publish(const nlohmann::json& event) {
    deliver(formatEvent(event));
}

void TelemetryHub::publishUpdate(std::string_view prop, nlohmann::json value) {
    publish(nlohmann::json{
        {"type", "update"},
        {"prop", std::string{prop}},
        {"value", std::move(value)},
    });
}

std::string TelemetryHub::formatEvent(const nlohmann::json& event) {
    return "data: " + common::dumpJson(event) + "\n\n";
}

void TelemetryHub::deliver(const std::string& frame) {
    // A sink may detach itself (or others) while being served.
    std::vector<EventSink> sinks;
    sinks.reserve(subscribers_.size());
    for (const auto& [id, sink] : subscribers_) {
        sinks.push_back(sink);
    }
    for (const auto& sink : sinks) {
        sink(frame);
    }
}

void TelemetryHub::scheduleHeartbeat() {
    if (!heartbeat_->running_ || heartbeat_->interval_.count() <= 0) {
        return;
    }
    heartbeat_->timer_.expires_after(heartbeat_->interval_);
    heartbeat_->timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || !heartbeat_->running_) {
            return;
        }
        deliver(kHeartbeatFrame);
        scheduleHeartbeat();
    });
}

}  // namespace rigd::telemetry
