#pragma once
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

namespace alcove::vault {

/**
 * @brief Tag, access counter, poison flag and audit sink of one container
 *
 * Record() logs one entry numbered with the next count and bumps the counter
 * (sequentially consistent) only once the sink accepts it. A refusal from the
 * sink comes back as SecretFailure::AuditError, the count is left as it was,
 * and the caller must not touch the secret.
 */
class AccessAudit {
public:
    AccessAudit(std::string tag, std::shared_ptr<interfaces::IAuditSink> sink);

    AccessAudit(AccessAudit&& other) noexcept;
    AccessAudit& operator=(AccessAudit&& other) noexcept;
    AccessAudit(const AccessAudit&) = delete;
    AccessAudit& operator=(const AccessAudit&) = delete;

    [[nodiscard]] Result<Unit, SecretFailure> Record(std::string_view operation);

    [[nodiscard]] std::string_view Tag() const noexcept { return tag_; }
    [[nodiscard]] uint64_t Count() const noexcept { return count_.load(std::memory_order_seq_cst); }
    [[nodiscard]] const std::shared_ptr<interfaces::IAuditSink>& Sink() const noexcept { return sink_; }

    void MarkPoisoned() noexcept { poisoned_.store(true, std::memory_order_seq_cst); }
    [[nodiscard]] bool IsPoisoned() const noexcept { return poisoned_.load(std::memory_order_seq_cst); }

private:
    std::string tag_;
    std::shared_ptr<interfaces::IAuditSink> sink_;
    std::atomic<uint64_t> count_{0};
    std::atomic<bool> poisoned_{false};
    std::mutex record_lock_;
};

/**
 * Marks the owning container poisoned when the guarded scope is left by an
 * exception thrown from caller code.
 */
class PoisonGuard {
public:
    explicit PoisonGuard(AccessAudit& audit) noexcept
        : audit_(audit), exceptions_(std::uncaught_exceptions()) {}

    ~PoisonGuard() {
        if (std::uncaught_exceptions() > exceptions_) {
            audit_.MarkPoisoned();
        }
    }

    PoisonGuard(const PoisonGuard&) = delete;
    PoisonGuard& operator=(const PoisonGuard&) = delete;

private:
    AccessAudit& audit_;
    int exceptions_;
};

}  // namespace alcove::vault

namespace alcove::vault::detail {

/** Value type of a With/WithMut call; void callbacks report Unit. */
template<typename F, typename... Args>
using AccessResult = std::conditional_t<
    std::is_void_v<std::invoke_result_t<F, Args...>>, Unit, std::invoke_result_t<F, Args...>>;

template<typename F, typename... Args>
AccessResult<F, Args...> InvokeAccess(F&& func, Args&&... args) {
    if constexpr (std::is_void_v<std::invoke_result_t<F, Args...>>) {
        std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
        return unit;
    } else {
        return std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
    }
}

}  // namespace alcove::vault::detail
