#include "alcove/crypto/hkdf.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <format>
#include <memory>
#include <string>

namespace alcove::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const {
            if (kdf) {
                EVP_KDF_free(kdf);
            }
        }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    // OpenSSL rejects a null octet-string pointer even at length zero.
    uint8_t* OctetPointer(std::span<const uint8_t> bytes) {
        static uint8_t empty_marker = 0;
        return bytes.empty() ? &empty_marker : const_cast<uint8_t*>(bytes.data());
    }

    /**
     * @brief One EVP_KDF "HKDF" call over BLAKE2s-256
     *
     * key is the IKM for EXTRACT modes and the PRK for EXPAND_ONLY. The salt
     * is only passed when non-empty; callers supply the RFC 5869 zero salt.
     */
    Result<Unit, CryptoFailure> RunHkdf(
        int mode,
        std::span<const uint8_t> key,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info,
        std::span<uint8_t> output) {

        EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_HKDF.data(), nullptr));
        if (!kdf) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DigestError(
                    std::format("Failed to fetch HKDF: {}", GetOpenSSLError())));
        }
        EVP_KDF_CTX_ptr ctx(EVP_KDF_CTX_new(kdf.get()));
        if (!ctx) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DigestError(
                    std::format("Failed to create HKDF context: {}", GetOpenSSLError())));
        }

        OSSL_PARAM params[6];
        size_t param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST, const_cast<char*>(OpenSSL::DIGEST_BLAKE2S.data()), 0);
        params[param_idx++] = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_MODE, &mode);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, OctetPointer(key), key.size());
        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, OctetPointer(salt), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, OctetPointer(info), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
            sodium_memzero(output.data(), output.size());
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DigestError(
                    std::format("HKDF-BLAKE2s derivation failed: {}", GetOpenSSLError())));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }

    Result<Unit, CryptoFailure> CheckOutputLength(const size_t length) {
        if (length > Hkdf::MAX_OUTPUT_LEN) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::HkdfExpandTooLong(
                    std::format("HKDF output of {} bytes exceeds maximum {}",
                        length, Hkdf::MAX_OUTPUT_LEN)));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }

    const std::array<uint8_t, Hkdf::HASH_LEN> kZeroSalt{};

    std::span<const uint8_t> SaltOrZero(std::span<const uint8_t> salt) {
        return salt.empty() ? std::span<const uint8_t>(kZeroSalt) : salt;
    }
}

Result<Blake2sDigest, CryptoFailure> Hkdf::Extract(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm) {

    Blake2sDigest prk{};
    auto extracted = RunHkdf(EVP_KDF_HKDF_MODE_EXTRACT_ONLY, ikm, SaltOrZero(salt), {}, prk);
    if (extracted.IsErr()) {
        return Result<Blake2sDigest, CryptoFailure>::Err(std::move(extracted).UnwrapErr());
    }
    return Result<Blake2sDigest, CryptoFailure>::Ok(prk);
}

Result<Unit, CryptoFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<const uint8_t> info,
    std::span<uint8_t> okm) {

    TRY(CheckOutputLength(okm.size()));
    return RunHkdf(EVP_KDF_HKDF_MODE_EXPAND_ONLY, prk, {}, info, okm);
}

Result<Unit, CryptoFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> info,
    std::span<uint8_t> okm) {

    TRY(CheckOutputLength(okm.size()));
    return RunHkdf(EVP_KDF_HKDF_MODE_EXTRACT_AND_EXPAND, ikm, SaltOrZero(salt), info, okm);
}

Result<Unit, CryptoFailure> DeriveSubkey(
    std::span<const uint8_t> key,
    std::span<const uint8_t> context,
    std::span<uint8_t> subkey) {

    return Hkdf::DeriveKey({}, key, context, subkey);
}

} // namespace alcove::crypto
