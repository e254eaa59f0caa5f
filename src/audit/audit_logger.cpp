#include "rigd/audit/audit_logger.hpp"

#include "rigd/common/json_text.hpp"
#include "rigd/logging/logger.hpp"

namespace rigd::audit {

nlohmann::json AuditLogger::toJson(const AuditRecord& record) {
    return nlohmann::json{
        {"actor", record.actor},
        {"action", record.action},
        {"result", std::string{core::to_string(record.result)}},
        {"message", record.message},
        {"parameters", record.parameters},
    };
}

void AuditLogger::record(const AuditRecord& record) const {
    RIGD_LOG_INFO("[AUDIT] {}", common::dumpJson(toJson(record)));
}

}  // namespace rigd::audit
