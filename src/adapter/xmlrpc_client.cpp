#include "rigd/adapter/xmlrpc_client.hpp"

#include "rigd/adapter/xmlrpc_codec.hpp"
#include "rigd/common/http_message.hpp"

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

#include <array>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace rigd::adapter {

class HttpXmlRpcClient::Call : public std::enable_shared_from_this<HttpXmlRpcClient::Call> {
public:
    Call(asio::io_context& io, std::string request, std::chrono::milliseconds timeout, XmlRpcHandler handler)
        : resolver_{io},
          socket_{io},
          deadline_{io},
          request_{std::move(request)},
          timeout_{timeout},
          handler_{std::move(handler)} {}

    void start(const std::string& host, std::uint16_t port) {
        deadline_.expires_after(timeout_);
        deadline_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
            if (!ec) {
                self->complete({core::ErrorCode::Timeout, "XML-RPC call timed out"}, nullptr);
            }
        });

        resolver_.async_resolve(host, std::to_string(port),
                                [self = shared_from_this()](const asio::error_code& ec,
                                                            asio::ip::tcp::resolver::results_type results) {
                                    if (ec) {
                                        self->fail(ec);
                                        return;
                                    }
                                    self->connect(results);
                                });
    }

private:
    void connect(const asio::ip::tcp::resolver::results_type& results) {
        asio::async_connect(socket_, results,
                            [self = shared_from_this()](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                                if (ec) {
                                    self->fail(ec);
                                    return;
                                }
                                self->write();
                            });
    }

    void write() {
        asio::async_write(socket_, asio::buffer(request_),
                          [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
                              if (ec) {
                                  self->fail(ec);
                                  return;
                              }
                              self->read();
                          });
    }

    void read() {
        socket_.async_read_some(asio::buffer(chunk_),
                                [self = shared_from_this()](const asio::error_code& ec, std::size_t n) {
                                    self->response_.append(self->chunk_.data(), n);
                                    if (self->response_.size() > kMaxResponseBytes) {
                                        self->complete({core::ErrorCode::Transport, "XML-RPC response too large"},
                                                       nullptr);
                                    } else if (ec == asio::error::eof || (!ec && self->bodyComplete())) {
                                        self->finish();
                                    } else if (ec) {
                                        self->fail(ec);
                                    } else {
                                        self->read();
                                    }
                                });
    }

    // Servers that ignore "Connection: close" still announce a length.
    bool bodyComplete() const {
        const auto http = common::parseResponse(response_);
        if (!http) {
            return false;
        }
        const auto it = http->headers.find("content-length");
        if (it == http->headers.end()) {
            return false;
        }
        try {
            return http->body.size() >= std::stoull(it->second);
        } catch (const std::exception&) {
            return false;
        }
    }

    void finish() {
        const auto http = common::parseResponse(response_);
        if (!http) {
            complete({core::ErrorCode::Transport, "malformed HTTP response"}, nullptr);
            return;
        }
        if (http->status != 200) {
            complete({core::ErrorCode::Transport, "HTTP status " + std::to_string(http->status)}, nullptr);
            return;
        }

        xmlrpc::MethodResponse decoded;
        try {
            decoded = xmlrpc::decodeMethodResponse(http->body);
        } catch (const std::runtime_error& ex) {
            complete({core::ErrorCode::Transport, ex.what()}, nullptr);
            return;
        }
        if (decoded.fault) {
            complete({core::ErrorCode::Fault, decoded.faultString}, nullptr);
            return;
        }
        complete({}, decoded.value);
    }

    void fail(const asio::error_code& ec) {
        complete({core::ErrorCode::Transport, ec.message()}, nullptr);
    }

    void complete(const core::CommandResult& result, const nlohmann::json& value) {
        if (done_) {
            return;
        }
        done_ = true;
        deadline_.cancel();
        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        resolver_.cancel();
        if (handler_) {
            handler_(result, value);
        }
    }

    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer deadline_;
    std::string request_;
    std::string response_;
    std::array<char, 4096> chunk_{};
    std::chrono::milliseconds timeout_;
    XmlRpcHandler handler_;
    bool done_{false};
};

HttpXmlRpcClient::HttpXmlRpcClient(asio::io_context& io,
                                   std::string host,
                                   std::uint16_t port,
                                   std::string path,
                                   std::chrono::milliseconds timeout)
    : io_{io},
      host_{std::move(host)},
      port_{port},
      path_{std::move(path)},
      timeout_{timeout} {}

void HttpXmlRpcClient::call(const std::string& method, const nlohmann::json& params, XmlRpcHandler handler) {
    const auto body = xmlrpc::encodeMethodCall(method, params);

    std::ostringstream request;
    request << "POST " << path_ << " HTTP/1.1\r\n"
            << "Host: " << host_ << ':' << port_ << "\r\n"
            << "User-Agent: rigd\r\n"
            << "Content-Type: text/xml\r\n"
            << "Content-Length: " << body.size() << "\r\n"
            << "Connection: close\r\n"
            << "\r\n"
            << body;

    auto call = std::make_shared<Call>(io_, request.str(), timeout_, std::move(handler));
    call->start(host_, port_);
}

}  // namespace rigd::adapter
