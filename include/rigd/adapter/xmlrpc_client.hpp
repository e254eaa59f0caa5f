#pragma once

#include "rigd/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace asio {
class io_context;
}  // namespace asio

namespace rigd::adapter {

using XmlRpcHandler = std::function<void(const core::CommandResult&, const nlohmann::json&)>;

class IXmlRpcClient {
public:
    virtual ~IXmlRpcClient() = default;

    virtual void call(const std::string& method, const nlohmann::json& params, XmlRpcHandler handler) = 0;
};

// One HTTP/1.1 POST per call; no connection is kept between calls.
class HttpXmlRpcClient : public IXmlRpcClient {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{5000};
    static constexpr std::size_t kMaxResponseBytes{256 * 1024};

    HttpXmlRpcClient(asio::io_context& io,
                     std::string host,
                     std::uint16_t port,
                     std::string path = "/",
                     std::chrono::milliseconds timeout = kDefaultTimeout);

    void call(const std::string& method, const nlohmann::json& params, XmlRpcHandler handler) override;

private:
    class Call;

    asio::io_context& io_;
    std::string host_;
    std::uint16_t port_;
    std::string path_;
    std::chrono::milliseconds timeout_;
};

}  // namespace rigd::adapter
