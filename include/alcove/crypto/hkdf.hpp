#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/crypto/blake2s.hpp"
#include "alcove/crypto/sodium_interop.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace alcove::crypto {

/**
 * @brief HKDF (RFC 5869) over HMAC-BLAKE2s, backed by OpenSSL's EVP_KDF "HKDF"
 *
 * Extract with an empty salt uses HASH_LEN zero bytes, as RFC 5869 specifies.
 * The intermediate blocks stay inside OpenSSL; on failure the output is wiped.
 *
 * DeriveKeys is the Noise HKDF(ck, ikm, n): one extract keyed by the chaining
 * key followed by an expand with empty info, sliced into n outputs.
 */
class Hkdf {
public:
    static Result<Blake2sDigest, CryptoFailure> Extract(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> ikm);

    /**
     * @brief Fill okm from prk and info
     *
     * @return Err(HkdfExpandTooLong) when okm is longer than 255 * HASH_LEN
     */
    static Result<Unit, CryptoFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<const uint8_t> info,
        std::span<uint8_t> okm);

    static Result<Unit, CryptoFailure> DeriveKey(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> info,
        std::span<uint8_t> okm);

    template<size_t K>
    static Result<std::array<Blake2sDigest, K>, CryptoFailure> DeriveKeys(
        std::span<const uint8_t> chaining_key,
        std::span<const uint8_t> ikm) {
        static_assert(K > 0 && K <= MAX_EXPANSION, "HKDF output count out of range");
        std::array<uint8_t, K * HASH_LEN> okm{};
        auto derived = DeriveKey(chaining_key, ikm, {}, okm);
        if (derived.IsErr()) {
            return Result<std::array<Blake2sDigest, K>, CryptoFailure>::Err(
                std::move(derived).UnwrapErr());
        }
        std::array<Blake2sDigest, K> keys{};
        for (size_t i = 0; i < K; ++i) {
            std::copy_n(okm.begin() + i * HASH_LEN, HASH_LEN, keys[i].begin());
        }
        sodium_memzero(okm.data(), okm.size());
        return Result<std::array<Blake2sDigest, K>, CryptoFailure>::Ok(keys);
    }

    static constexpr size_t HASH_LEN = Blake2s::HASH_LEN;
    static constexpr size_t MAX_EXPANSION = Constants::HKDF_MAX_EXPANSION;
    static constexpr size_t MAX_OUTPUT_LEN = MAX_EXPANSION * HASH_LEN;

private:
    Hkdf() = delete;
};

/**
 * @brief Derive a context-bound subkey: HKDF(salt = "", ikm = key, info = context)
 */
Result<Unit, CryptoFailure> DeriveSubkey(
    std::span<const uint8_t> key,
    std::span<const uint8_t> context,
    std::span<uint8_t> subkey);

} // namespace alcove::crypto
