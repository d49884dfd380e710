#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace alcove::crypto {

/**
 * @brief Move-only owner of a sodium_malloc region
 *
 * The region sits between guard pages, is locked in RAM and is zeroed by
 * sodium_free when the handle is destroyed or reassigned. A handle keeps its
 * allocated size; callers that need a different size allocate a new handle
 * and move it over the old one.
 *
 * Not synchronized. The containers in alcove::vault wrap it in their own lock.
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate size bytes of protected memory, initializing libsodium on first use
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data to the start of the region and zero the remainder
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole region into output (output must hold Size() bytes)
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Overwrite the region with zeros without releasing it
     */
    Result<Unit, SodiumFailure> Zero();

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<uint8_t>(static_cast<uint8_t*>(ptr_), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace alcove::crypto
