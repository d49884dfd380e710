#include "alcove/audit/audit_log.hpp"
#include "alcove/core/constants.hpp"
#include "alcove/debug/key_logger.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>

namespace alcove::audit {

    AuditLog::AuditLog(configuration::AuditConfig config)
        : config_(std::move(config)) {
        if (auto valid = config_.Validate(); valid.IsErr()) {
            config_failure_ = valid.UnwrapErr();
        }
    }

    Result<std::shared_ptr<AuditLog>, AuditFailure> AuditLog::Create(configuration::AuditConfig config) {
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::shared_ptr<AuditLog>, AuditFailure>::Err(std::move(valid).UnwrapErr());
        }
        return Result<std::shared_ptr<AuditLog>, AuditFailure>::Ok(std::make_shared<AuditLog>(std::move(config)));
    }

    AuditLog::~AuditLog() {
        AbortFileFlush();
    }

    std::shared_ptr<AuditLog> AuditLog::Global() {
        static const std::shared_ptr<AuditLog> instance = std::make_shared<AuditLog>();
        return instance;
    }

    Result<Unit, AuditFailure> AuditLog::LogEntry(AuditEntry entry) {
        if (config_failure_.has_value()) {
            return Result<Unit, AuditFailure>::Err(*config_failure_);
        }
        size_t live_size;
        {
            std::lock_guard guard(entries_lock_);
            entries_.push_back(std::move(entry));
            live_size = entries_.size();
        }
        if (live_size < config_.Threshold()) {
            return Result<Unit, AuditFailure>::Ok(unit);
        }
        if (auto flushed = Flush(); flushed.IsErr()) {
            std::lock_guard guard(entries_lock_);
            if (entries_.size() > config_.Capacity()) {
                entries_.pop_back();
            }
            return Result<Unit, AuditFailure>::Err(
                AuditFailure::AuditBuffersFull(std::string(ErrorMessages::AUDIT_BUFFERS_FULL)));
        }
        return Result<Unit, AuditFailure>::Ok(unit);
    }

    Result<Unit, AuditFailure> AuditLog::Flush() {
        if (config_failure_.has_value()) {
            return Result<Unit, AuditFailure>::Err(*config_failure_);
        }
        {
            std::lock_guard flushing_guard(flushing_lock_);
            const size_t available = config_.Capacity() - std::min(config_.Capacity(), flushing_.size());
            if (available == 0) {
                return Result<Unit, AuditFailure>::Err(
                    AuditFailure::FlushingLogFull(std::string(ErrorMessages::FLUSHING_LOG_FULL)));
            }
            std::lock_guard entries_guard(entries_lock_);
            const size_t count = std::min({config_.Target(), entries_.size(), available});
            const auto end = entries_.begin() + static_cast<std::ptrdiff_t>(count);
            std::move(entries_.begin(), end, std::back_inserter(flushing_));
            entries_.erase(entries_.begin(), end);
        }
        Notify();
        return Result<Unit, AuditFailure>::Ok(unit);
    }

    void AuditLog::StartFileFlush(interfaces::ITaskExecutor& executor) {
        std::lock_guard guard(control_lock_);
        stop_flush_ = false;
        if (handle_) {
            return;
        }
        flusher_failure_.reset();
        handle_ = executor.Spawn([this](std::stop_token stop) { RunFlusher(stop); });
    }

    void AuditLog::CancelFileFlush() {
        {
            std::lock_guard guard(control_lock_);
            stop_flush_ = true;
        }
        Notify();
    }

    Result<Unit, AuditFailure> AuditLog::StopFileFlush() {
        CancelFileFlush();
        std::unique_ptr<interfaces::ITaskHandle> handle;
        {
            std::lock_guard guard(control_lock_);
            handle = std::move(handle_);
        }
        if (!handle) {
            return Result<Unit, AuditFailure>::Ok(unit);
        }
        if (auto joined = handle->Join(); joined.IsErr()) {
            return Result<Unit, AuditFailure>::Err(
                AuditFailure::JoinError(std::move(joined).UnwrapErr()));
        }
        std::lock_guard guard(control_lock_);
        if (flusher_failure_.has_value()) {
            AuditFailure failure = std::move(*flusher_failure_);
            flusher_failure_.reset();
            return Result<Unit, AuditFailure>::Err(std::move(failure));
        }
        return Result<Unit, AuditFailure>::Ok(unit);
    }

    void AuditLog::AbortFileFlush() {
        std::unique_ptr<interfaces::ITaskHandle> handle;
        {
            std::lock_guard guard(control_lock_);
            handle = std::move(handle_);
        }
        if (handle) {
            handle->Abort();
        }
    }

    bool AuditLog::IsFlushing() const {
        std::lock_guard guard(control_lock_);
        return handle_ != nullptr && !handle_->IsFinished();
    }

    size_t AuditLog::Len() const {
        std::lock_guard guard(entries_lock_);
        return entries_.size();
    }

    size_t AuditLog::FlushingLen() const {
        std::lock_guard guard(flushing_lock_);
        return flushing_.size();
    }

    void AuditLog::RunFlusher(const std::stop_token& stop) {
        std::error_code ec;
        std::filesystem::create_directories(config_.Directory(), ec);
        if (ec) {
            RecordFlusherFailure(AuditFailure::IOError(
                std::format("Failed to create audit directory {}: {}", config_.Directory().string(), ec.message())));
            return;
        }
        std::ofstream out(config_.OutputPath(), std::ios::out | std::ios::app);
        if (!out) {
            RecordFlusherFailure(AuditFailure::IOError(
                std::format("Failed to open audit file {}", config_.OutputPath().string())));
            return;
        }
        while (true) {
            if (stop.stop_requested()) {
                return;
            }
            // Read before draining so the last pass sees everything queued before the cancel.
            const bool stopping = StopRequested();
            std::deque<AuditEntry> batch;
            {
                std::lock_guard guard(flushing_lock_);
                batch.swap(flushing_);
            }
            if (!batch.empty()) {
                for (const auto& entry : batch) {
                    out << entry.ToString() << '\n';
                }
                out.flush();
                if (!out) {
                    RecordFlusherFailure(AuditFailure::IOError(
                        std::format("Failed to write audit file {}", config_.OutputPath().string())));
                    return;
                }
                debug::LogAuditFlush(batch.size());
            }
            if (stopping) {
                return;
            }
            WaitForNotify(stop);
        }
    }

    void AuditLog::Notify() {
        {
            std::lock_guard guard(notify_lock_);
            notified_ = true;
        }
        notify_cv_.notify_one();
    }

    void AuditLog::WaitForNotify(const std::stop_token& stop) {
        std::unique_lock lock(notify_lock_);
        notify_cv_.wait_for(lock, stop, config_.FlushInterval(), [this] { return notified_; });
        notified_ = false;
    }

    bool AuditLog::StopRequested() const {
        std::lock_guard guard(control_lock_);
        return stop_flush_;
    }

    void AuditLog::RecordFlusherFailure(AuditFailure failure) {
        std::lock_guard guard(control_lock_);
        flusher_failure_ = std::move(failure);
    }

}
