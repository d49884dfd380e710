#include "alcove/audit/audit_entry.hpp"
#include <chrono>
#include <ctime>
#include <format>

namespace alcove::audit {

    AuditEntry AuditEntry::Now(
        std::string_view operation,
        std::string_view secret_tag,
        const uint64_t access_count) {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return AuditEntry{
            .timestamp_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()),
            .operation = std::string(operation),
            .secret_tag = std::string(secret_tag),
            .access_count = access_count
        };
    }

    std::string AuditEntry::ToString() const {
        const auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);
        char datetime[32];
        const size_t written = std::strftime(datetime, sizeof(datetime), "%Y-%m-%d %H:%M:%S", &local);
        return std::format("{}.{:03}, {}, {}",
            std::string_view(datetime, written), timestamp_ms % 1000, secret_tag, operation);
    }

}
