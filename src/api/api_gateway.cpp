#include "rigd/api/api_gateway.hpp"

#include "rigd/command/orchestrator.hpp"
#include "rigd/common/http_message.hpp"
#include "rigd/logging/logger.hpp"
#include "rigd/radio/state_store.hpp"
#include "rigd/telemetry/telemetry_hub.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <array>
#include <cmath>
#include <deque>
#include <map>
#include <optional>
#include <utility>

namespace rigd::api {

namespace {

constexpr auto kAllowOrigin = "*";
constexpr auto kAllowMethods = "GET, POST, OPTIONS";
constexpr auto kAllowHeaders = "Content-Type";

void addCorsHeaders(common::HttpResponse& response) {
    response.headers["access-control-allow-origin"] = kAllowOrigin;
}

common::HttpResponse preflight() {
    common::HttpResponse response;
    response.status = 204;
    addCorsHeaders(response);
    response.headers["access-control-allow-methods"] = kAllowMethods;
    response.headers["access-control-allow-headers"] = kAllowHeaders;
    return response;
}

common::HttpResponse success() {
    return common::HttpResponse::json(200, nlohmann::json{{"success", true}});
}

common::HttpResponse fromResult(const core::CommandResult& result) {
    if (result.ok()) {
        return success();
    }
    return common::HttpResponse::error(core::httpStatus(result.code), result.message);
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
        return text == "true" || text == "1";
    }
    return false;
}

std::optional<std::uint64_t> frequencyField(const nlohmann::json& body) {
    const auto it = body.find("freq");
    if (it == body.end()) {
        return std::nullopt;
    }

    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value == 0) {
            return std::nullopt;
        }
        return value;
    }

    double hz = 0.0;
    if (it->is_number()) {
        hz = it->get<double>();
    } else if (it->is_string()) {
        try {
            hz = std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(hz) || hz < 1.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::llround(hz));
}

std::uint32_t passbandField(const nlohmann::json& body) {
    const auto it = body.find("passband");
    if (it == body.end() || !it->is_number()) {
        return 0;
    }
    const auto value = it->get<double>();
    return value > 0.0 && std::isfinite(value) ? static_cast<std::uint32_t>(std::llround(value)) : 0;
}

}  // namespace

class ApiGateway::Session : public std::enable_shared_from_this<ApiGateway::Session> {
public:
    Session(ApiGateway::Impl& owner, std::uint64_t id, asio::ip::tcp::socket socket);

    void start();
    void close();

    std::uint64_t id() const noexcept { return id_; }

private:
    void readHead();
    void readBody(common::HttpRequest request, std::size_t needed);
    void dispatch(common::HttpRequest request);

    void handleFrequency(const nlohmann::json& body);
    void handleMode(const nlohmann::json& body);
    void handlePtt(const nlohmann::json& body);

    void openStream();
    void watchStream();
    void enqueueFrame(std::string frame);
    void flush();

    void respond(common::HttpResponse response);

    ApiGateway::Impl& owner_;
    std::uint64_t id_;
    asio::ip::tcp::socket socket_;
    std::string actor_;
    std::string buffer_;
    std::array<char, 512> discard_{};

    std::optional<telemetry::SubscriberId> subscription_;
    std::deque<std::string> outbox_;
    bool writing_{false};
    bool closed_{false};
};

class ApiGateway::Impl {
public:
    Impl(asio::io_context& io,
         const config::ServerConfig& config,
         command::Orchestrator& orchestrator,
         radio::StateStore& state,
         telemetry::TelemetryHub& telemetry)
        : config_{config},
          orchestrator_{orchestrator},
          state_{state},
          telemetry_{telemetry},
          acceptor_{io} {}

    void start() {
        if (running_) {
            return;
        }
        asio::ip::tcp::endpoint endpoint{asio::ip::make_address(config_.host), config_.port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        running_ = true;

        RIGD_LOG_INFO("[ApiGateway] Listening on http://{}:{}", config_.host, boundPort());
        accept();
    }

    void stop() {
        if (!running_) {
            return;
        }
        running_ = false;
        asio::error_code ignored;
        acceptor_.close(ignored);

        auto sessions = std::move(sessions_);
        sessions_.clear();
        for (auto& [id, session] : sessions) {
            session->close();
        }
        RIGD_LOG_INFO("[ApiGateway] Stopped");
    }

    std::uint16_t boundPort() const {
        asio::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    std::size_t sessionCount() const { return sessions_.size(); }

    void release(std::uint64_t id) { sessions_.erase(id); }

    command::Orchestrator& orchestrator() { return orchestrator_; }
    radio::StateStore& state() { return state_; }
    telemetry::TelemetryHub& telemetry() { return telemetry_; }

private:
    void accept() {
        acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (!running_) {
                return;
            }
            if (ec) {
                RIGD_LOG_WARN("[ApiGateway] Accept failed: {}", ec.message());
            } else {
                const auto id = nextSessionId_++;
                auto session = std::make_shared<Session>(*this, id, std::move(socket));
                sessions_.emplace(id, session);
                session->start();
            }
            accept();
        });
    }

    config::ServerConfig config_;
    command::Orchestrator& orchestrator_;
    radio::StateStore& state_;
    telemetry::TelemetryHub& telemetry_;
    asio::ip::tcp::acceptor acceptor_;
    std::map<std::uint64_t, std::shared_ptr<Session>> sessions_;
    std::uint64_t nextSessionId_{1};
    bool running_{false};
};

ApiGateway::Session::Session(ApiGateway::Impl& owner, std::uint64_t id, asio::ip::tcp::socket socket)
    : owner_{owner},
      id_{id},
      socket_{std::move(socket)} {
    asio::error_code ec;
    const auto remote = socket_.remote_endpoint(ec);
    actor_ = ec ? std::string{"unknown"} : remote.address().to_string() + ":" + std::to_string(remote.port());
}

void ApiGateway::Session::start() {
    readHead();
}

void ApiGateway::Session::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (subscription_) {
        owner_.telemetry().unsubscribe(*subscription_);
        subscription_.reset();
        RIGD_LOG_INFO("[ApiGateway] Stream client {} disconnected", actor_);
    }
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    owner_.release(id_);
}

void ApiGateway::Session::readHead() {
    asio::async_read_until(
        socket_, asio::dynamic_buffer(buffer_, common::kMaxHeaderBytes), "\r\n\r\n",
        [self = shared_from_this()](const asio::error_code& ec, std::size_t headLength) {
            if (self->closed_) {
                return;
            }
            if (ec == asio::error::not_found) {
                self->respond(common::HttpResponse::error(413, "Request header too large"));
                return;
            }
            if (ec) {
                self->close();
                return;
            }

            auto request = common::parseRequestHead(std::string_view{self->buffer_}.substr(0, headLength - 4));
            self->buffer_.erase(0, headLength);
            if (!request) {
                self->respond(common::HttpResponse::error(400, "Malformed request"));
                return;
            }

            const auto length = request->contentLength();
            if (length > common::kMaxBodyBytes) {
                self->respond(common::HttpResponse::error(413, "Request body too large"));
                return;
            }
            if (self->buffer_.size() >= length) {
                request->body = self->buffer_.substr(0, length);
                self->dispatch(std::move(*request));
                return;
            }
            self->readBody(std::move(*request), length);
        });
}

void ApiGateway::Session::readBody(common::HttpRequest request, std::size_t needed) {
    asio::async_read(socket_, asio::dynamic_buffer(buffer_), asio::transfer_exactly(needed - buffer_.size()),
                     [self = shared_from_this(), request = std::move(request), needed](
                         const asio::error_code& ec, std::size_t) mutable {
                         if (self->closed_) {
                             return;
                         }
                         if (ec) {
                             self->close();
                             return;
                         }
                         request.body = self->buffer_.substr(0, needed);
                         self->dispatch(std::move(request));
                     });
}

void ApiGateway::Session::dispatch(common::HttpRequest request) {
    RIGD_LOG_DEBUG("[ApiGateway] {} {} from {}", request.method, request.target, actor_);

    if (request.method == "OPTIONS") {
        respond(preflight());
        return;
    }

    const auto& path = request.path;
    const bool isRead = path == "/status" || path == "/stream";
    const bool isWrite = path == "/freq" || path == "/mode" || path == "/ptt";
    if (!isRead && !isWrite) {
        respond(common::HttpResponse::error(404, "Not found"));
        return;
    }
    if ((isRead && request.method != "GET") || (isWrite && request.method != "POST")) {
        respond(common::HttpResponse::error(405, "Method not allowed"));
        return;
    }

    if (path == "/status") {
        respond(common::HttpResponse::json(200, radio::toStatusJson(owner_.state().snapshot())));
        return;
    }
    if (path == "/stream") {
        openStream();
        return;
    }

    nlohmann::json body = nlohmann::json::object();
    if (!request.body.empty()) {
        body = nlohmann::json::parse(request.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            respond(common::HttpResponse::error(400, "Invalid JSON body"));
            return;
        }
    }

    if (path == "/freq") {
        handleFrequency(body);
    } else if (path == "/mode") {
        handleMode(body);
    } else {
        handlePtt(body);
    }
}

void ApiGateway::Session::handleFrequency(const nlohmann::json& body) {
    const auto hz = frequencyField(body);
    if (!hz) {
        respond(common::HttpResponse::error(400, "Missing freq"));
        return;
    }
    const auto it = body.find("tune");
    const bool tune = it != body.end() && truthy(*it);
    owner_.orchestrator().setFrequency(actor_, *hz, tune, [self = shared_from_this()](const core::CommandResult& result) {
        self->respond(fromResult(result));
    });
}

void ApiGateway::Session::handleMode(const nlohmann::json& body) {
    const auto it = body.find("mode");
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        respond(common::HttpResponse::error(400, "Missing mode"));
        return;
    }
    owner_.orchestrator().setMode(actor_, it->get<std::string>(), passbandField(body),
                                  [self = shared_from_this()](const core::CommandResult& result) {
                                      self->respond(fromResult(result));
                                  });
}

void ApiGateway::Session::handlePtt(const nlohmann::json& body) {
    const auto it = body.find("ptt");
    const bool enabled = it != body.end() && truthy(*it);
    owner_.orchestrator().setPtt(actor_, enabled, [self = shared_from_this()](const core::CommandResult& result) {
        self->respond(fromResult(result));
    });
}

void ApiGateway::Session::openStream() {
    RIGD_LOG_INFO("[ApiGateway] Stream client {} connected", actor_);

    std::string head = "HTTP/1.1 200 OK\r\n"
                       "content-type: text/event-stream\r\n"
                       "cache-control: no-cache\r\n"
                       "connection: keep-alive\r\n";
    head += std::string{"access-control-allow-origin: "} + kAllowOrigin + "\r\n\r\n";
    enqueueFrame(std::move(head));
    enqueueFrame(telemetry::TelemetryHub::formatEvent(radio::toInitEvent(owner_.state().snapshot())));

    std::weak_ptr<Session> weak = shared_from_this();
    subscription_ = owner_.telemetry().subscribe([weak](const std::string& frame) {
        if (auto self = weak.lock()) {
            self->enqueueFrame(frame);
        }
    });
    watchStream();
}

void ApiGateway::Session::watchStream() {
    // Anything the client sends after the request is ignored; EOF ends the stream.
    socket_.async_read_some(asio::buffer(discard_), [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
        if (self->closed_) {
            return;
        }
        if (ec) {
            self->close();
            return;
        }
        self->watchStream();
    });
}

void ApiGateway::Session::enqueueFrame(std::string frame) {
    if (closed_) {
        return;
    }
    outbox_.push_back(std::move(frame));
    if (!writing_) {
        flush();
    }
}

void ApiGateway::Session::flush() {
    if (outbox_.empty() || closed_) {
        writing_ = false;
        return;
    }
    writing_ = true;
    asio::async_write(socket_, asio::buffer(outbox_.front()),
                      [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
                          if (self->closed_) {
                              return;
                          }
                          if (ec) {
                              self->close();
                              return;
                          }
                          self->outbox_.pop_front();
                          self->flush();
                      });
}

void ApiGateway::Session::respond(common::HttpResponse response) {
    if (closed_) {
        return;
    }
    addCorsHeaders(response);
    response.headers["connection"] = "close";

    auto payload = std::make_shared<std::string>(response.serialize());
    asio::async_write(socket_, asio::buffer(*payload),
                      [self = shared_from_this(), payload](const asio::error_code&, std::size_t) {
                          self->close();
                      });
}

ApiGateway::ApiGateway(asio::io_context& io,
                       const config::ServerConfig& config,
                       command::Orchestrator& orchestrator,
                       radio::StateStore& state,
                       telemetry::TelemetryHub& telemetry)
    : impl_{std::make_unique<Impl>(io, config, orchestrator, state, telemetry)} {}

ApiGateway::~ApiGateway() {
    impl_->stop();
}

void ApiGateway::start() {
    impl_->start();
}

void ApiGateway::stop() {
    impl_->stop();
}

std::uint16_t ApiGateway::boundPort() const {
    return impl_->boundPort();
}

std::size_t ApiGateway::sessionCount() const {
    return impl_->sessionCount();
}

}  // namespace rigd::api
