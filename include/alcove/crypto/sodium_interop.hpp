#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace alcove::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Owns library initialization and exposes the small set of sodium calls the
 * vault and the handshake engine share: wiping, constant-time comparison,
 * the OS CSPRNG, guarded allocations and Curve25519 scalar multiplication.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every allocation path calls it, so callers
     * only need it when they want to observe the failure early.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Overwrite a buffer with zeros in a way the optimizer cannot elide
     *
     * Small buffers go through a volatile loop, larger ones through
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Fill a caller-owned buffer from the OS CSPRNG
     *
     * @return Err(OsRngError) when libsodium could not be initialized
     */
    static Result<Unit, CryptoFailure> FillRandom(std::span<uint8_t> buffer);

    // ========================================================================
    // Curve25519
    // ========================================================================

    static Result<Unit, CryptoFailure> ComputeX25519PublicKey(
        std::span<const uint8_t> private_key,
        std::span<uint8_t> public_key);

    /**
     * @brief X25519 shared secret
     *
     * Rejects low-order peer points (all-zero output) as InvalidKeyLength so
     * a malformed public key aborts the caller's handshake.
     */
    static Result<Unit, CryptoFailure> ComputeX25519SharedSecret(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key,
        std::span<uint8_t> shared_secret);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded, mlock'ed memory with sodium_malloc
     *
     * @return nullptr when libsodium is not initialized or allocation fails
     */
    static void* AllocateSecure(size_t size) noexcept;

    /**
     * @brief Release memory from AllocateSecure; sodium_free zeroes it first
     */
    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace alcove::crypto
