#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/secure_memory_handle.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/interfaces/i_secure_container.hpp"
#include "alcove/vault/access_audit.hpp"
#include "alcove/vault/secure_ref.hpp"
#include "alcove/vault/security_level.hpp"
#include <sodium.h>
#include <array>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>

namespace alcove::vault {

/**
 * @brief N bytes of locked, guard-paged memory with a tag and an audited access path
 *
 * The secret is never handed out by reference. With/WithMut copy it into a
 * SecureRef scratch array, run the callback under the container lock and
 * scrub the scratch afterwards, whether the callback returns or throws.
 *
 * An exception escaping a callback poisons the container. The protected
 * memory is still sound, so the next access goes ahead and is audited as
 * "poisoned lock recovered" before its own entry. A WithMut whose callback
 * threw leaves the stored bytes unchanged.
 *
 * **Usage Example**:
 * ```cpp
 * auto secret = FixedSecret<32>::Random("session key").Unwrap();
 * auto first = secret.With([](const auto& bytes) { return bytes[0]; });
 * ```
 */
template<size_t N, typename L = Ephemeral>
class FixedSecret final : public interfaces::ISecureContainer {
    static_assert(N > 0, "FixedSecret needs at least one byte");

public:
    using Array = std::array<uint8_t, N>;
    using Level = L;
    static constexpr size_t kSize = N;

    static Result<FixedSecret, SecretFailure> Random(
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        SecureRef<Array> scratch(Array{});
        if (auto filled = crypto::SodiumInterop::FillRandom(scratch.GetMut()); filled.IsErr()) {
            return Result<FixedSecret, SecretFailure>::Err(SecretFailure::FromCrypto(filled.UnwrapErr()));
        }
        return Take(scratch.GetMut(), std::move(tag), std::move(sink));
    }

    /**
     * @brief Consumes value; the caller's array is zeroed before this returns
     */
    static Result<FixedSecret, SecretFailure> New(
        Array& value,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        return Take(value, std::move(tag), std::move(sink));
    }

    static Result<FixedSecret, SecretFailure> New(
        Array&& value,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        return Take(value, std::move(tag), std::move(sink));
    }

    /**
     * @brief Copies the external buffer in, then zeroes it
     */
    static Result<FixedSecret, SecretFailure> Take(
        std::span<uint8_t, N> value,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        auto handle = crypto::SecureMemoryHandle::Allocate(N);
        if (handle.IsErr()) {
            sodium_memzero(value.data(), value.size());
            return Result<FixedSecret, SecretFailure>::Err(SecretFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        auto memory = std::move(handle).Unwrap();
        auto written = memory.Write(value);
        sodium_memzero(value.data(), value.size());
        if (written.IsErr()) {
            return Result<FixedSecret, SecretFailure>::Err(SecretFailure::FromSodiumFailure(written.UnwrapErr()));
        }
        return Result<FixedSecret, SecretFailure>::Ok(
            FixedSecret(std::move(memory), AccessAudit(std::move(tag), std::move(sink))));
    }

    FixedSecret(FixedSecret&& other) noexcept
        : handle_(std::move(other.handle_))
        , audit_(std::move(other.audit_)) {}

    FixedSecret& operator=(FixedSecret&& other) noexcept {
        if (this != &other) {
            handle_ = std::move(other.handle_);
            audit_ = std::move(other.audit_);
        }
        return *this;
    }

    FixedSecret(const FixedSecret&) = delete;
    FixedSecret& operator=(const FixedSecret&) = delete;
    ~FixedSecret() override = default;

    template<typename F>
    auto With(F&& func) const -> Result<detail::AccessResult<F, const Array&>, SecretFailure> {
        using R = detail::AccessResult<F, const Array&>;
        std::shared_lock lock(lock_);
        TRY(audit_.Record(AuditConstants::OPERATION_ACCESS));
        SecureRef<Array> scratch(Array{});
        if (auto read = handle_.Read(scratch.GetMut()); read.IsErr()) {
            return Result<R, SecretFailure>::Err(SecretFailure::FromSodiumFailure(read.UnwrapErr()));
        }
        PoisonGuard guard(audit_);
        return Result<R, SecretFailure>::Ok(
            detail::InvokeAccess(std::forward<F>(func), scratch.Get()));
    }

    template<typename F>
    auto WithMut(F&& func) -> Result<detail::AccessResult<F, Array&>, SecretFailure> {
        using R = detail::AccessResult<F, Array&>;
        std::unique_lock lock(lock_);
        TRY(audit_.Record(AuditConstants::OPERATION_MUTABLE_ACCESS));
        SecureRef<Array> scratch(Array{});
        if (auto read = handle_.Read(scratch.GetMut()); read.IsErr()) {
            return Result<R, SecretFailure>::Err(SecretFailure::FromSodiumFailure(read.UnwrapErr()));
        }
        PoisonGuard guard(audit_);
        R result = detail::InvokeAccess(std::forward<F>(func), scratch.GetMut());
        if (auto written = handle_.Write(scratch.Get()); written.IsErr()) {
            return Result<R, SecretFailure>::Err(SecretFailure::FromSodiumFailure(written.UnwrapErr()));
        }
        return Result<R, SecretFailure>::Ok(std::move(result));
    }

    /**
     * @brief With on a worker thread; the container must outlive the future
     */
    template<typename F>
    auto WithAsync(F func) const -> std::future<Result<detail::AccessResult<F&, const Array&>, SecretFailure>> {
        return std::async(std::launch::async, [this, func = std::move(func)]() mutable {
            return With(func);
        });
    }

    template<typename F>
    auto WithMutAsync(F func) -> std::future<Result<detail::AccessResult<F&, Array&>, SecretFailure>> {
        return std::async(std::launch::async, [this, func = std::move(func)]() mutable {
            return WithMut(func);
        });
    }

    /**
     * @brief Deep copy under the same tag and sink, with a fresh access counter
     */
    Result<FixedSecret, SecretFailure> Copy() const {
        std::shared_lock lock(lock_);
        TRY(audit_.Record(AuditConstants::OPERATION_COPY));
        SecureRef<Array> scratch(Array{});
        if (auto read = handle_.Read(scratch.GetMut()); read.IsErr()) {
            return Result<FixedSecret, SecretFailure>::Err(SecretFailure::FromSodiumFailure(read.UnwrapErr()));
        }
        return Take(scratch.GetMut(), std::string(audit_.Tag()), audit_.Sink());
    }

    /**
     * @brief Constant-time comparison of the stored bytes; audited as one access on each side
     */
    Result<bool, SecretFailure> SecretEquals(const FixedSecret& other) const {
        if (this == &other) {
            return Result<bool, SecretFailure>::Ok(true);
        }
        auto compared = With([&other](const Array& mine) {
            return other.With([&mine](const Array& theirs) {
                return sodium_memcmp(mine.data(), theirs.data(), N) == 0;
            });
        });
        if (compared.IsErr()) {
            return Result<bool, SecretFailure>::Err(std::move(compared).UnwrapErr());
        }
        return std::move(compared).Unwrap();
    }

    [[nodiscard]] std::string_view Tag() const override { return audit_.Tag(); }
    [[nodiscard]] uint64_t AccessCount() const override { return audit_.Count(); }
    [[nodiscard]] size_t Len() const override { return N; }
    [[nodiscard]] SecurityLevel GetSecurityLevel() const override { return L::kLevel; }
    [[nodiscard]] bool IsPoisoned() const noexcept { return audit_.IsPoisoned(); }
    [[nodiscard]] const std::shared_ptr<interfaces::IAuditSink>& AuditSink() const noexcept { return audit_.Sink(); }

private:
    FixedSecret(crypto::SecureMemoryHandle handle, AccessAudit audit)
        : handle_(std::move(handle))
        , audit_(std::move(audit)) {}

    mutable std::shared_mutex lock_;
    crypto::SecureMemoryHandle handle_;
    mutable AccessAudit audit_;
};

}  // namespace alcove::vault
