#pragma once
#include "alcove/audit/audit_entry.hpp"
#include "alcove/configuration/audit_config.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include "alcove/interfaces/i_task_executor.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
namespace alcove::audit {

/**
 * @brief Bounded two-stage log of secret accesses
 *
 * Entries land in a live deque. Once it reaches the threshold watermark a
 * batch moves to the flushing deque and the background flusher is woken to
 * append it to the output file. When both deques are full the append is
 * refused with AuditBuffersFull so the caller can refuse the audited operation.
 *
 * Lock order: flushing before entries. The control lock is never held while
 * either deque lock is taken.
 */
class AuditLog final : public interfaces::IAuditSink {
public:
    /**
     * A log built from a config that fails Validate() refuses every append
     * and flush with the validation failure.
     */
    explicit AuditLog(configuration::AuditConfig config = configuration::AuditConfig::Default());

    /**
     * @brief Validates the config before building the log
     */
    [[nodiscard]] static Result<std::shared_ptr<AuditLog>, AuditFailure> Create(configuration::AuditConfig config);
    ~AuditLog() override;

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;
    AuditLog(AuditLog&&) = delete;
    AuditLog& operator=(AuditLog&&) = delete;

    /**
     * @brief Process-wide log used by containers constructed without a sink
     */
    [[nodiscard]] static std::shared_ptr<AuditLog> Global();

    [[nodiscard]] Result<Unit, AuditFailure> LogEntry(AuditEntry entry) override;

    /**
     * @brief Moves up to Target() entries to the flushing deque and wakes the flusher
     *
     * @return FlushingLogFull when the flushing deque has no room left
     */
    [[nodiscard]] Result<Unit, AuditFailure> Flush();

    /**
     * @brief Spawns the file flusher on the executor
     *
     * Clears a pending stop request. Does nothing if a flusher is already running.
     */
    void StartFileFlush(interfaces::ITaskExecutor& executor);

    /**
     * @brief Asks the flusher to write what it holds and exit, without waiting
     */
    void CancelFileFlush();

    /**
     * @brief Cancels, then waits for the flusher and returns its outcome
     */
    [[nodiscard]] Result<Unit, AuditFailure> StopFileFlush();

    /**
     * @brief Terminates the flusher at its next wake-up without a final write
     *
     * Entries still in the flushing deque stay there. Callers must treat them
     * as lost if the process exits.
     */
    void AbortFileFlush();

    [[nodiscard]] bool IsFlushing() const;
    [[nodiscard]] size_t Len() const;
    [[nodiscard]] size_t FlushingLen() const;
    [[nodiscard]] const configuration::AuditConfig& Config() const noexcept { return config_; }

private:
    void RunFlusher(const std::stop_token& stop);
    void Notify();
    void WaitForNotify(const std::stop_token& stop);
    [[nodiscard]] bool StopRequested() const;
    void RecordFlusherFailure(AuditFailure failure);

    configuration::AuditConfig config_;
    std::optional<AuditFailure> config_failure_;

    mutable std::mutex entries_lock_;
    std::deque<AuditEntry> entries_;

    mutable std::mutex flushing_lock_;
    std::deque<AuditEntry> flushing_;

    std::mutex notify_lock_;
    std::condition_variable_any notify_cv_;
    bool notified_ = false;

    mutable std::mutex control_lock_;
    bool stop_flush_ = false;
    std::unique_ptr<interfaces::ITaskHandle> handle_;
    std::optional<AuditFailure> flusher_failure_;
};

}
