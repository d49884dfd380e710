#include "alcove/vault/access_audit.hpp"
#include "alcove/audit/audit_log.hpp"
#include "alcove/core/constants.hpp"

namespace alcove::vault {

    AccessAudit::AccessAudit(std::string tag, std::shared_ptr<interfaces::IAuditSink> sink)
        : tag_(std::move(tag))
        , sink_(sink ? std::move(sink) : audit::AuditLog::Global()) {
    }

    AccessAudit::AccessAudit(AccessAudit&& other) noexcept
        : tag_(std::move(other.tag_))
        , sink_(other.sink_)
        , count_(other.count_.load())
        , poisoned_(other.poisoned_.load()) {
    }

    AccessAudit& AccessAudit::operator=(AccessAudit&& other) noexcept {
        if (this != &other) {
            tag_ = std::move(other.tag_);
            sink_ = other.sink_;
            count_.store(other.count_.load());
            poisoned_.store(other.poisoned_.load());
        }
        return *this;
    }

    Result<Unit, SecretFailure> AccessAudit::Record(std::string_view operation) {
        std::lock_guard guard(record_lock_);
        const uint64_t count = count_.load(std::memory_order_seq_cst) + 1;
        if (poisoned_.exchange(false, std::memory_order_seq_cst)) {
            auto recovered = sink_->LogEntry(
                audit::AuditEntry::Now(AuditConstants::OPERATION_POISON_RECOVERED, tag_, count));
            if (recovered.IsErr()) {
                poisoned_.store(true, std::memory_order_seq_cst);
                return Result<Unit, SecretFailure>::Err(SecretFailure::FromAudit(recovered.UnwrapErr()));
            }
        }
        auto logged = sink_->LogEntry(audit::AuditEntry::Now(operation, tag_, count));
        if (logged.IsErr()) {
            return Result<Unit, SecretFailure>::Err(SecretFailure::FromAudit(logged.UnwrapErr()));
        }
        count_.store(count, std::memory_order_seq_cst);
        return Result<Unit, SecretFailure>::Ok(unit);
    }

}
