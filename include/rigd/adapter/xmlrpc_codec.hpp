#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rigd::adapter::xmlrpc {

// JSON integers become <i4>, floats <double>, booleans <boolean>, strings
// <string>, arrays <array> and objects <struct>.
std::string encodeMethodCall(std::string_view method, const nlohmann::json& params);

struct MethodResponse {
    bool fault{false};
    int faultCode{0};
    std::string faultString{};
    nlohmann::json value{};
};

// Throws std::runtime_error if the document is not a methodResponse.
MethodResponse decodeMethodResponse(std::string_view document);

// Text of a scalar reply as flrig would print it.
std::string valueToText(const nlohmann::json& value);

}  // namespace rigd::adapter::xmlrpc
