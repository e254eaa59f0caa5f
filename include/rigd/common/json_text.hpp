#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace rigd::common {

// Compact serialization. Bytes that are not valid UTF-8 become U+FFFD instead
// of throwing; radio backends report free-form text.
inline std::string dumpJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace rigd::common
