#pragma once
#include "alcove/audit/audit_entry.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
namespace alcove::interfaces {
class IAuditSink {
public:
    virtual ~IAuditSink() = default;
    [[nodiscard]] virtual Result<Unit, AuditFailure> LogEntry(audit::AuditEntry entry) = 0;
};
}
