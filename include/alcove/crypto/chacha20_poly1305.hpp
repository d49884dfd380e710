#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/constants.hpp"

#include <cstdint>
#include <span>

namespace alcove::crypto {

/**
 * @brief ChaCha20-Poly1305 (IETF, 96-bit nonce) with a detached tag
 *
 * The wire layout is ciphertext || tag. Encryption may run in place
 * (plaintext and destination aliasing the same bytes). Whenever an operation
 * fails the destination is zeroed before the error is returned, so a caller
 * never holds half-written output.
 */
class ChaCha20Poly1305 {
public:
    /**
     * @param destination at least plaintext.size() + TAG_SIZE bytes
     * @param key KEY_SIZE bytes
     * @param nonce NONCE_SIZE bytes
     */
    static Result<Unit, CryptoFailure> Encrypt(
        std::span<uint8_t> destination,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data);

    /**
     * @param destination at least ciphertext.size() - TAG_SIZE bytes
     * @param ciphertext ciphertext || tag
     */
    static Result<Unit, CryptoFailure> Decrypt(
        std::span<uint8_t> destination,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data);

    static constexpr size_t KEY_SIZE = Constants::KEY_SIZE;
    static constexpr size_t TAG_SIZE = Constants::TAG_SIZE;
    static constexpr size_t NONCE_SIZE = Constants::NONCE_SIZE;

private:
    ChaCha20Poly1305() = delete;
};

} // namespace alcove::crypto
