#pragma once

#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <string>

namespace alcove::configuration {

/**
 * @brief Sizing and destination of the audit log
 *
 * **Watermarks**:
 * - capacity: the most entries either deque will hold
 * - threshold (2/3 capacity): live size at which an append triggers a flush
 * - target (3/4 capacity): the most entries one flush moves to the flushing deque,
 *   so a quarter of the history stays in memory
 *
 * **Usage Example**:
 * ```cpp
 * auto config = AuditConfig::Default();            // 1000 entries, ./log/output.txt
 * auto small = AuditConfig(30, "audit", "t.txt");  // threshold 20, target 22
 * ```
 *
 * The smallest valid capacity is 2; below that both watermarks round to zero.
 */
class AuditConfig {
public:
    AuditConfig(
        size_t capacity,
        std::string directory,
        std::string file_name,
        std::chrono::milliseconds flush_interval = AuditConstants::DEFAULT_FLUSH_INTERVAL)
        : capacity_(capacity)
        , directory_(std::move(directory))
        , file_name_(std::move(file_name))
        , flush_interval_(flush_interval) {}

    [[nodiscard]] static AuditConfig Default() {
        return AuditConfig(
            AuditConstants::DEFAULT_CAPACITY,
            std::string(AuditConstants::DEFAULT_DIRECTORY),
            std::string(AuditConstants::DEFAULT_FILE_NAME));
    }

    [[nodiscard]] Result<Unit, AuditFailure> Validate() const {
        if (capacity_ == 0) {
            return Result<Unit, AuditFailure>::Err(
                AuditFailure::IOError("Audit capacity must be greater than zero"));
        }
        if (Threshold() == 0 || Target() == 0) {
            return Result<Unit, AuditFailure>::Err(
                AuditFailure::IOError(std::format(
                    "Audit capacity {} leaves no room for a flush batch", capacity_)));
        }
        if (directory_.empty() || file_name_.empty()) {
            return Result<Unit, AuditFailure>::Err(
                AuditFailure::IOError("Audit directory and file name must be set"));
        }
        return Result<Unit, AuditFailure>::Ok(unit);
    }

    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

    [[nodiscard]] size_t Threshold() const noexcept { return capacity_ * 2 / 3; }

    [[nodiscard]] size_t Target() const noexcept { return capacity_ * 3 / 4; }

    [[nodiscard]] std::chrono::milliseconds FlushInterval() const noexcept { return flush_interval_; }

    [[nodiscard]] std::filesystem::path Directory() const { return directory_; }

    [[nodiscard]] std::filesystem::path OutputPath() const {
        return std::filesystem::path(directory_) / file_name_;
    }

private:
    size_t capacity_;
    std::string directory_;
    std::string file_name_;
    std::chrono::milliseconds flush_interval_;
};

}  // namespace alcove::configuration
