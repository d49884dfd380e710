#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/secure_memory_handle.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/interfaces/i_secure_container.hpp"
#include "alcove/vault/access_audit.hpp"
#include "alcove/vault/secret_traits.hpp"
#include "alcove/vault/secure_ref.hpp"
#include "alcove/vault/security_level.hpp"
#include <algorithm>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace alcove::vault {

/**
 * @brief Variable-size secret stored as the serialized form of T in locked memory
 *
 * T is rebuilt into a SecureRef on every access and serialized again after
 * every WithMut. When the new serialization has a different length the
 * protected region is replaced; the old region is zeroed when it is freed.
 *
 * T needs a SecretTraits specialization: byte vectors, strings and protobuf
 * messages are covered.
 */
template<typename T, typename L = Ephemeral>
class DynamicSecret final : public interfaces::ISecureContainer {
public:
    using Inner = T;
    using Level = L;

    /**
     * @brief Consumes value; the caller's object is zeroized before this returns
     */
    static Result<DynamicSecret, SecretFailure> New(
        T& value,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        return Take(value, std::move(tag), std::move(sink));
    }

    static Result<DynamicSecret, SecretFailure> New(
        T&& value,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        return Take(value, std::move(tag), std::move(sink));
    }

    /**
     * @brief Serializes value into protected memory and zeroizes the caller's value
     */
    static Result<DynamicSecret, SecretFailure> Take(
        T& value,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        auto serialized = SecretTraits<T>::Serialize(value);
        SecretTraits<T>::Zeroize(value);
        if (serialized.IsErr()) {
            return Result<DynamicSecret, SecretFailure>::Err(std::move(serialized).UnwrapErr());
        }
        SecureRef<std::vector<uint8_t>> bytes(std::move(serialized).Unwrap());
        return FromSerialized(bytes.Get(), std::move(tag), std::move(sink));
    }

    /**
     * @brief len random bytes from the OS CSPRNG
     */
    static Result<DynamicSecret, SecretFailure> Random(
        std::string tag,
        const size_t len,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        static_assert(std::is_same_v<T, std::vector<uint8_t>>, "Random is only defined for byte vectors");
        SecureRef<std::vector<uint8_t>> scratch(std::vector<uint8_t>(len));
        if (auto filled = crypto::SodiumInterop::FillRandom(scratch.GetMut()); filled.IsErr()) {
            return Result<DynamicSecret, SecretFailure>::Err(SecretFailure::FromCrypto(filled.UnwrapErr()));
        }
        return FromSerialized(scratch.Get(), std::move(tag), std::move(sink));
    }

    DynamicSecret(DynamicSecret&& other) noexcept
        : handle_(std::move(other.handle_))
        , len_(other.len_)
        , audit_(std::move(other.audit_)) {
        other.len_ = 0;
    }

    DynamicSecret& operator=(DynamicSecret&& other) noexcept {
        if (this != &other) {
            handle_ = std::move(other.handle_);
            len_ = other.len_;
            audit_ = std::move(other.audit_);
            other.len_ = 0;
        }
        return *this;
    }

    DynamicSecret(const DynamicSecret&) = delete;
    DynamicSecret& operator=(const DynamicSecret&) = delete;
    ~DynamicSecret() override = default;

    template<typename F>
    auto With(F&& func) const -> Result<detail::AccessResult<F, const T&>, SecretFailure> {
        using R = detail::AccessResult<F, const T&>;
        std::shared_lock lock(lock_);
        TRY(audit_.Record(AuditConstants::OPERATION_ACCESS));
        auto value = Load();
        if (value.IsErr()) {
            return Result<R, SecretFailure>::Err(std::move(value).UnwrapErr());
        }
        const SecureRef<T> scratch = std::move(value).Unwrap();
        PoisonGuard guard(audit_);
        return Result<R, SecretFailure>::Ok(detail::InvokeAccess(std::forward<F>(func), scratch.Get()));
    }

    template<typename F>
    auto WithMut(F&& func) -> Result<detail::AccessResult<F, T&>, SecretFailure> {
        using R = detail::AccessResult<F, T&>;
        std::unique_lock lock(lock_);
        TRY(audit_.Record(AuditConstants::OPERATION_MUTABLE_ACCESS));
        auto value = Load();
        if (value.IsErr()) {
            return Result<R, SecretFailure>::Err(std::move(value).UnwrapErr());
        }
        SecureRef<T> scratch = std::move(value).Unwrap();
        PoisonGuard guard(audit_);
        R result = detail::InvokeAccess(std::forward<F>(func), scratch.GetMut());
        auto bytes = scratch.ToBytes();
        if (bytes.IsErr()) {
            return Result<R, SecretFailure>::Err(std::move(bytes).UnwrapErr());
        }
        TRY(Store(std::move(bytes).Unwrap().Get()));
        return Result<R, SecretFailure>::Ok(std::move(result));
    }

    /**
     * @brief With on a worker thread; the container must outlive the future
     */
    template<typename F>
    auto WithAsync(F func) const -> std::future<Result<detail::AccessResult<F&, const T&>, SecretFailure>> {
        return std::async(std::launch::async, [this, func = std::move(func)]() mutable {
            return With(func);
        });
    }

    template<typename F>
    auto WithMutAsync(F func) -> std::future<Result<detail::AccessResult<F&, T&>, SecretFailure>> {
        return std::async(std::launch::async, [this, func = std::move(func)]() mutable {
            return WithMut(func);
        });
    }

    /**
     * @brief Deep copy under the same tag and sink, with a fresh access counter
     */
    Result<DynamicSecret, SecretFailure> Copy() const {
        std::shared_lock lock(lock_);
        TRY(audit_.Record(AuditConstants::OPERATION_COPY));
        auto bytes = ReadStored();
        if (bytes.IsErr()) {
            return Result<DynamicSecret, SecretFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return FromSerialized(bytes.Unwrap().Get(), std::string(audit_.Tag()), audit_.Sink());
    }

    /**
     * @brief Number of bytes in the stored vector, without auditing
     */
    [[nodiscard]] size_t InnerLen() const {
        static_assert(std::is_same_v<T, std::vector<uint8_t>>, "InnerLen is only defined for byte vectors");
        std::shared_lock lock(lock_);
        return len_;
    }

    [[nodiscard]] std::string_view Tag() const override { return audit_.Tag(); }
    [[nodiscard]] uint64_t AccessCount() const override { return audit_.Count(); }
    [[nodiscard]] size_t Len() const override {
        std::shared_lock lock(lock_);
        return len_;
    }
    [[nodiscard]] SecurityLevel GetSecurityLevel() const override { return L::kLevel; }
    [[nodiscard]] bool IsPoisoned() const noexcept { return audit_.IsPoisoned(); }
    [[nodiscard]] const std::shared_ptr<interfaces::IAuditSink>& AuditSink() const noexcept { return audit_.Sink(); }

private:
    DynamicSecret(crypto::SecureMemoryHandle handle, const size_t len, AccessAudit audit)
        : handle_(std::move(handle))
        , len_(len)
        , audit_(std::move(audit)) {}

    static Result<crypto::SecureMemoryHandle, SecretFailure> AllocateFor(std::span<const uint8_t> bytes) {
        // sodium_malloc rejects zero; an empty secret keeps one unused byte
        auto handle = crypto::SecureMemoryHandle::Allocate(std::max<size_t>(bytes.size(), 1));
        if (handle.IsErr()) {
            return Result<crypto::SecureMemoryHandle, SecretFailure>::Err(
                SecretFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        auto memory = std::move(handle).Unwrap();
        if (auto written = memory.Write(bytes); written.IsErr()) {
            return Result<crypto::SecureMemoryHandle, SecretFailure>::Err(
                SecretFailure::FromSodiumFailure(written.UnwrapErr()));
        }
        return Result<crypto::SecureMemoryHandle, SecretFailure>::Ok(std::move(memory));
    }

    static Result<DynamicSecret, SecretFailure> FromSerialized(
        std::span<const uint8_t> bytes,
        std::string tag,
        std::shared_ptr<interfaces::IAuditSink> sink) {
        auto memory = AllocateFor(bytes);
        if (memory.IsErr()) {
            return Result<DynamicSecret, SecretFailure>::Err(std::move(memory).UnwrapErr());
        }
        return Result<DynamicSecret, SecretFailure>::Ok(DynamicSecret(
            std::move(memory).Unwrap(), bytes.size(), AccessAudit(std::move(tag), std::move(sink))));
    }

    Result<SecureRef<std::vector<uint8_t>>, SecretFailure> ReadStored() const {
        auto stored = handle_.WithReadAccess([this](std::span<const uint8_t> region) {
            return std::vector<uint8_t>(region.begin(), region.begin() + static_cast<std::ptrdiff_t>(len_));
        });
        if (stored.IsErr()) {
            return Result<SecureRef<std::vector<uint8_t>>, SecretFailure>::Err(
                SecretFailure::FromSodiumFailure(stored.UnwrapErr()));
        }
        return Result<SecureRef<std::vector<uint8_t>>, SecretFailure>::Ok(
            SecureRef<std::vector<uint8_t>>(std::move(stored).Unwrap()));
    }

    Result<SecureRef<T>, SecretFailure> Load() const {
        auto bytes = ReadStored();
        if (bytes.IsErr()) {
            return Result<SecureRef<T>, SecretFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return SecureRef<T>::FromBytes(bytes.Unwrap().Get());
    }

    Result<Unit, SecretFailure> Store(std::span<const uint8_t> bytes) {
        if (bytes.size() == len_) {
            if (auto written = handle_.Write(bytes); written.IsErr()) {
                return Result<Unit, SecretFailure>::Err(SecretFailure::FromSodiumFailure(written.UnwrapErr()));
            }
            return Result<Unit, SecretFailure>::Ok(unit);
        }
        auto memory = AllocateFor(bytes);
        if (memory.IsErr()) {
            return Result<Unit, SecretFailure>::Err(std::move(memory).UnwrapErr());
        }
        handle_ = std::move(memory).Unwrap();
        len_ = bytes.size();
        return Result<Unit, SecretFailure>::Ok(unit);
    }

    mutable std::shared_mutex lock_;
    crypto::SecureMemoryHandle handle_;
    size_t len_;
    mutable AccessAudit audit_;
};

}  // namespace alcove::vault
