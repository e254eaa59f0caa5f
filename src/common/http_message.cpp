#include "rigd/common/http_message.hpp"

#include "rigd/common/json_text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rigd::common {

namespace {

std::string lowercase(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

// Splits "Name: value" lines following the start line.
bool parseHeaders(std::string_view block, HeaderMap& headers) {
    std::size_t pos = 0;
    while (pos < block.size()) {
        auto end = block.find("\r\n", pos);
        if (end == std::string_view::npos) {
            end = block.size();
        }
        const auto line = block.substr(pos, end - pos);
        pos = end + 2;
        if (line.empty()) {
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return false;
        }
        headers[lowercase(trim(line.substr(0, colon)))] = std::string{trim(line.substr(colon + 1))};
    }
    return true;
}

}  // namespace

std::string HttpRequest::header(std::string_view name) const {
    const auto it = headers.find(lowercase(name));
    return it == headers.end() ? std::string{} : it->second;
}

std::size_t HttpRequest::contentLength() const {
    const auto value = header("content-length");
    if (value.empty()) {
        return 0;
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return 0;
    }
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& payload) {
    HttpResponse response;
    response.status = status;
    response.headers["content-type"] = "application/json";
    response.body = dumpJson(payload);
    return response;
}

HttpResponse HttpResponse::error(int status, std::string_view message) {
    return json(status, nlohmann::json{{"error", std::string{message}}});
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << ' ' << reasonPhrase(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    if (headers.find("content-length") == headers.end()) {
        out << "content-length: " << body.size() << "\r\n";
    }
    out << "\r\n" << body;
    return out.str();
}

std::string_view reasonPhrase(int status) noexcept {
    switch (status) {
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

std::optional<HttpRequest> parseRequestHead(std::string_view head) {
    const auto lineEnd = head.find("\r\n");
    const auto requestLine = head.substr(0, lineEnd);

    const auto firstSpace = requestLine.find(' ');
    const auto secondSpace = requestLine.find(' ', firstSpace + 1);
    if (firstSpace == std::string_view::npos || secondSpace == std::string_view::npos) {
        return std::nullopt;
    }

    HttpRequest request;
    request.method = std::string{requestLine.substr(0, firstSpace)};
    request.target = std::string{requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1)};
    request.version = std::string{trim(requestLine.substr(secondSpace + 1))};
    if (request.method.empty() || request.target.empty() || request.version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    request.path = request.target.substr(0, request.target.find('?'));

    if (lineEnd != std::string_view::npos && !parseHeaders(head.substr(lineEnd + 2), request.headers)) {
        return std::nullopt;
    }
    return request;
}

std::optional<HttpResponse> parseResponse(std::string_view raw) {
    const auto headEnd = raw.find("\r\n\r\n");
    if (headEnd == std::string_view::npos) {
        return std::nullopt;
    }
    const auto head = raw.substr(0, headEnd);
    const auto lineEnd = head.find("\r\n");
    const auto statusLine = head.substr(0, lineEnd);

    const auto firstSpace = statusLine.find(' ');
    if (statusLine.rfind("HTTP/", 0) != 0 || firstSpace == std::string_view::npos) {
        return std::nullopt;
    }

    HttpResponse response;
    try {
        response.status = std::stoi(std::string{statusLine.substr(firstSpace + 1, 3)});
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (lineEnd != std::string_view::npos && !parseHeaders(head.substr(lineEnd + 2), response.headers)) {
        return std::nullopt;
    }

    response.body = std::string{raw.substr(headEnd + 4)};
    if (const auto it = response.headers.find("content-length"); it != response.headers.end()) {
        try {
            const auto length = static_cast<std::size_t>(std::stoull(it->second));
            if (response.body.size() > length) {
                response.body.resize(length);
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return response;
}

}  // namespace rigd::common
