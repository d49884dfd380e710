#include "alcove/crypto/chacha20_poly1305.hpp"
#include "alcove/crypto/sodium_interop.hpp"

#include <format>
#include <string>

namespace alcove::crypto {
namespace {
    Result<Unit, CryptoFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::InvalidKeyLength(
                    std::format("ChaCha20-Poly1305 key must be {} bytes, got {}",
                        crypto_aead_chacha20poly1305_ietf_KEYBYTES, key.size())));
        }
        if (nonce.size() != crypto_aead_chacha20poly1305_ietf_NPUBBYTES) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::InvalidKeyLength(
                    std::format("ChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        crypto_aead_chacha20poly1305_ietf_NPUBBYTES, nonce.size())));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
}
Result<Unit, CryptoFailure> ChaCha20Poly1305::Encrypt(
    std::span<uint8_t> destination,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data) {
    if (destination.size() < plaintext.size() + TAG_SIZE) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DestTooSmall(
                std::format("Destination holds {} bytes, encryption needs {}",
                    destination.size(), plaintext.size() + TAG_SIZE)));
    }
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        sodium_memzero(destination.data(), destination.size());
        return valid;
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::EncryptionError(init.UnwrapErr().message));
    }
    unsigned long long tag_len = 0;
    const int rc = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        destination.data(),
        destination.data() + plaintext.size(),
        &tag_len,
        plaintext.data(), plaintext.size(),
        associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
        nullptr,
        nonce.data(),
        key.data());
    if (rc != SodiumConstants::SUCCESS || tag_len != TAG_SIZE) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::EncryptionError(std::string(ErrorMessages::AEAD_ENCRYPTION_FAILED)));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}
Result<Unit, CryptoFailure> ChaCha20Poly1305::Decrypt(
    std::span<uint8_t> destination,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data) {
    if (ciphertext.size() < TAG_SIZE) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DecryptionError(
                std::format("Ciphertext of {} bytes is shorter than the {}-byte tag",
                    ciphertext.size(), TAG_SIZE)));
    }
    const size_t message_len = ciphertext.size() - TAG_SIZE;
    if (destination.size() < message_len) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DestTooSmall(
                std::format("Destination holds {} bytes, decryption needs {}",
                    destination.size(), message_len)));
    }
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        sodium_memzero(destination.data(), destination.size());
        return valid;
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DecryptionError(init.UnwrapErr().message));
    }
    const int rc = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
        destination.data(),
        nullptr,
        ciphertext.data(), message_len,
        ciphertext.data() + message_len,
        associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
        nonce.data(),
        key.data());
    if (rc != SodiumConstants::SUCCESS) {
        sodium_memzero(destination.data(), destination.size());
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DecryptionError(std::string(ErrorMessages::AEAD_DECRYPTION_FAILED)));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}
}
