#include "alcove/crypto/blake2s.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <format>
#include <memory>
#include <string>

namespace alcove::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_MD_CTX_Deleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
        }
    };
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const {
            if (mac) {
                EVP_MAC_free(mac);
            }
        }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const {
            if (ctx) {
                EVP_MAC_CTX_free(ctx);
            }
        }
    };
    using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
    using EVP_MAC_ptr = std::unique_ptr<EVP_MAC, EVP_MAC_Deleter>;
    using EVP_MAC_CTX_ptr = std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}
Result<Blake2sDigest, CryptoFailure> Blake2s::Hash(std::span<const uint8_t> data) {
    return HashParts({data});
}
Result<Blake2sDigest, CryptoFailure> Blake2s::HashParts(
    std::initializer_list<std::span<const uint8_t>> parts) {
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("Failed to create digest context: {}", GetOpenSSLError())));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_blake2s256(), nullptr) != OpenSSL::SUCCESS) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("Failed to initialize BLAKE2s-256: {}", GetOpenSSLError())));
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != OpenSSL::SUCCESS) {
            return Result<Blake2sDigest, CryptoFailure>::Err(
                CryptoFailure::DigestError(
                    std::format("BLAKE2s update failed: {}", GetOpenSSLError())));
        }
    }
    Blake2sDigest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != OpenSSL::SUCCESS ||
        digest_len != HASH_LEN) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("BLAKE2s finalization failed: {}", GetOpenSSLError())));
    }
    return Result<Blake2sDigest, CryptoFailure>::Ok(digest);
}
Result<Blake2sDigest, CryptoFailure> Blake2s::Hmac(
    std::span<const uint8_t> key,
    std::initializer_list<std::span<const uint8_t>> parts) {
    EVP_MAC_ptr mac(EVP_MAC_fetch(nullptr, OpenSSL::ALGORITHM_HMAC.data(), nullptr));
    if (!mac) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("Failed to fetch HMAC: {}", GetOpenSSLError())));
    }
    EVP_MAC_CTX_ptr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("Failed to create HMAC context: {}", GetOpenSSLError())));
    }
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(OpenSSL::DIGEST_BLAKE2S.data()), 0);
    params[1] = OSSL_PARAM_construct_end();
    // HMAC pads short keys with zeros to the block size, so an empty key and a
    // block of zeros are the same key. OpenSSL refuses a null key pointer.
    const uint8_t zero_key[BLOCK_LEN] = {};
    const uint8_t* key_ptr = key.empty() ? zero_key : key.data();
    const size_t key_len = key.empty() ? sizeof(zero_key) : key.size();
    if (EVP_MAC_init(ctx.get(), key_ptr, key_len, params) != OpenSSL::SUCCESS) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("Failed to initialize HMAC-BLAKE2s: {}", GetOpenSSLError())));
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (EVP_MAC_update(ctx.get(), part.data(), part.size()) != OpenSSL::SUCCESS) {
            return Result<Blake2sDigest, CryptoFailure>::Err(
                CryptoFailure::DigestError(
                    std::format("HMAC-BLAKE2s update failed: {}", GetOpenSSLError())));
        }
    }
    Blake2sDigest tag{};
    size_t tag_len = 0;
    if (EVP_MAC_final(ctx.get(), tag.data(), &tag_len, tag.size()) != OpenSSL::SUCCESS ||
        tag_len != HASH_LEN) {
        return Result<Blake2sDigest, CryptoFailure>::Err(
            CryptoFailure::DigestError(
                std::format("HMAC-BLAKE2s finalization failed: {}", GetOpenSSLError())));
    }
    return Result<Blake2sDigest, CryptoFailure>::Ok(tag);
}
}
