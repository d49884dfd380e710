#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/constants.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace alcove::crypto {

using Blake2sDigest = std::array<uint8_t, Constants::BLAKE2S_HASH_SIZE>;

/**
 * @brief BLAKE2s-256 and HMAC-BLAKE2s through OpenSSL EVP
 *
 * Multi-part variants hash the concatenation of their parts without
 * materializing it, which is how the handshake hash absorbs h || data.
 */
class Blake2s {
public:
    static Result<Blake2sDigest, CryptoFailure> Hash(std::span<const uint8_t> data);

    static Result<Blake2sDigest, CryptoFailure> HashParts(
        std::initializer_list<std::span<const uint8_t>> parts);

    /**
     * @brief HMAC-BLAKE2s over the concatenation of parts
     *
     * @param key HMAC key, zero-padded to the 64-byte block; empty is allowed
     */
    static Result<Blake2sDigest, CryptoFailure> Hmac(
        std::span<const uint8_t> key,
        std::initializer_list<std::span<const uint8_t>> parts);

    static constexpr size_t HASH_LEN = Constants::BLAKE2S_HASH_SIZE;
    static constexpr size_t BLOCK_LEN = Constants::BLAKE2S_BLOCK_SIZE;

private:
    Blake2s() = delete;
};

} // namespace alcove::crypto
