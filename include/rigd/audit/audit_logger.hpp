#pragma once

#include "rigd/core/types.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace rigd::audit {

struct AuditRecord {
    std::string actor;
    std::string action;
    nlohmann::json parameters;
    core::ErrorCode result{core::ErrorCode::Ok};
    std::string message;
};

class AuditLogger {
public:
    void record(const AuditRecord& record) const;

    static nlohmann::json toJson(const AuditRecord& record);
};

}  // namespace rigd::audit
