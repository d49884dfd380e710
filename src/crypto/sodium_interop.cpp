#include "alcove/crypto/sodium_interop.hpp"

#include <format>
#include <string>

namespace alcove::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD || !IsInitialized()) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    if (auto init = Initialize(); init.IsErr()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::format("{}: {}", ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED,
                    init.UnwrapErr().message)));
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

Result<Unit, CryptoFailure> SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (auto init = Initialize(); init.IsErr()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::OsRngError(init.UnwrapErr().message));
    }
    randombytes_buf(buffer.data(), buffer.size());
    return Result<Unit, CryptoFailure>::Ok(unit);
}

// ============================================================================
// Curve25519
// ============================================================================

Result<Unit, CryptoFailure> SodiumInterop::ComputeX25519PublicKey(
    std::span<const uint8_t> private_key,
    std::span<uint8_t> public_key) {

    if (private_key.size() != crypto_scalarmult_SCALARBYTES) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength(
                std::format("X25519 private key must be {} bytes, got {}",
                    crypto_scalarmult_SCALARBYTES, private_key.size())));
    }
    if (public_key.size() != crypto_scalarmult_BYTES) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DestTooSmall(
                std::format("X25519 public key buffer must be {} bytes", crypto_scalarmult_BYTES)));
    }
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != SodiumConstants::SUCCESS) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength("Failed to derive X25519 public key"));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

Result<Unit, CryptoFailure> SodiumInterop::ComputeX25519SharedSecret(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> peer_public_key,
    std::span<uint8_t> shared_secret) {

    if (private_key.size() != crypto_scalarmult_SCALARBYTES ||
        peer_public_key.size() != crypto_scalarmult_BYTES) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength(
                std::format("X25519 keys must be {} bytes (private: {}, public: {})",
                    crypto_scalarmult_BYTES, private_key.size(), peer_public_key.size())));
    }
    if (shared_secret.size() < crypto_scalarmult_BYTES) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DestTooSmall("X25519 shared secret buffer too small"));
    }
    if (crypto_scalarmult(shared_secret.data(), private_key.data(), peer_public_key.data()) !=
        SodiumConstants::SUCCESS) {
        sodium_memzero(shared_secret.data(), shared_secret.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength("X25519 peer public key is a low-order point"));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace alcove::crypto
