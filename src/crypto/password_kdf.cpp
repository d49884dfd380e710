#include "alcove/crypto/password_kdf.hpp"
#include "alcove/crypto/sodium_interop.hpp"

#include <format>

namespace alcove::crypto {

Result<Unit, CryptoFailure> PasswordKdf::DerivePdk(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    std::span<uint8_t> output) {

    if (salt.size() != crypto_pwhash_SALTBYTES) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::Argon2Error(
                std::format("Argon2id salt must be {} bytes, got {}",
                    crypto_pwhash_SALTBYTES, salt.size())));
    }
    if (output.size() < crypto_pwhash_BYTES_MIN) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DestTooSmall(
                std::format("Argon2id output must be at least {} bytes", crypto_pwhash_BYTES_MIN)));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::Argon2Error(init.UnwrapErr().message));
    }

    const int rc = crypto_pwhash(
        output.data(), output.size(),
        reinterpret_cast<const char*>(password.data()), password.size(),
        salt.data(),
        PasswordKdfConstants::OPS_LIMIT,
        PasswordKdfConstants::MEM_LIMIT_BYTES,
        crypto_pwhash_ALG_ARGON2ID13);
    if (rc != SodiumConstants::SUCCESS) {
        sodium_memzero(output.data(), output.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::Argon2Error("Argon2id derivation failed (out of memory?)"));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

} // namespace alcove::crypto
