#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace alcove::audit {

/**
 * @brief One recorded access to a secret container
 */
struct AuditEntry {
    uint64_t timestamp_ms = 0;
    std::string operation;
    std::string secret_tag;
    uint64_t access_count = 0;

    /**
     * @brief Entry stamped with the current wall-clock time
     */
    static AuditEntry Now(std::string_view operation, std::string_view secret_tag, uint64_t access_count = 0);

    /**
     * @brief "<local date time>, <tag>, <operation>", the audit file line format
     */
    [[nodiscard]] std::string ToString() const;
};

}  // namespace alcove::audit
