#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rigd::common {

inline constexpr std::size_t kMaxHeaderBytes{8 * 1024};
inline constexpr std::size_t kMaxBodyBytes{64 * 1024};

// Header names are stored lower-case.
using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string target;
    std::string path;
    std::string version{"HTTP/1.1"};
    HeaderMap headers;
    std::string body;

    std::string header(std::string_view name) const;
    std::size_t contentLength() const;
};

struct HttpResponse {
    int status{200};
    HeaderMap headers;
    std::string body;

    static HttpResponse json(int status, const nlohmann::json& payload);
    static HttpResponse error(int status, std::string_view message);

    std::string serialize() const;
};

std::string_view reasonPhrase(int status) noexcept;

// Parses the request line and headers (everything before the blank line).
std::optional<HttpRequest> parseRequestHead(std::string_view head);

// Parses a complete response as read up to connection close.
std::optional<HttpResponse> parseResponse(std::string_view raw);

}  // namespace rigd::common
