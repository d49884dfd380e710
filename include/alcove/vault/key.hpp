#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/chacha20_poly1305.hpp"
#include "alcove/debug/key_logger.hpp"
#include "alcove/nonce/nonce.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include <format>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>

namespace alcove::vault {

/**
 * @brief An Ephemeral N-byte AEAD key bound to the nonce sequence it encrypts under
 *
 * Encrypt stamps the current nonce and advances it under the nonce write
 * lock, then runs ChaCha20-Poly1305 outside that lock with the stamped value.
 * Concurrent callers therefore never share a nonce, and once the nonce asks
 * for rotation every further Encrypt is refused.
 *
 * Clone() is a deep copy: the clone gets its own key material and its own
 * copy of the nonce state. Threads that must draw from one nonce sequence
 * share the Key itself (it is safe to use through a reference or shared_ptr).
 */
template<typename Kind, size_t N = Constants::KEY_SIZE>
class Key {
public:
    using Secret = FixedSecret<N, Ephemeral>;
    using Nonce = nonce::Nonce<Kind>;
    using Array = typename Secret::Array;

    /**
     * @brief Moves the array into protected memory; the caller's array is zeroed
     */
    static Result<Key, SecretFailure> FromArray(
        Array& value,
        std::string tag,
        Nonce nonce,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        auto secret = Secret::New(value, std::move(tag), std::move(sink));
        if (secret.IsErr()) {
            return Result<Key, SecretFailure>::Err(std::move(secret).UnwrapErr());
        }
        return Result<Key, SecretFailure>::Ok(Key(std::move(secret).Unwrap(), nonce));
    }

    static Result<Key, SecretFailure> FromArray(
        Array&& value,
        std::string tag,
        Nonce nonce,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        return FromArray(value, std::move(tag), nonce, std::move(sink));
    }

    /**
     * @brief Copies the slice in and zeroes it; the slice must hold exactly N bytes
     */
    static Result<Key, SecretFailure> FromSlice(
        std::span<uint8_t> slice,
        std::string tag,
        Nonce nonce,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        if (slice.size() != N) {
            return Result<Key, SecretFailure>::Err(SecretFailure::FromCrypto(
                CryptoFailure::InvalidKeyLength(std::format("Key must be {} bytes, got {}", N, slice.size()))));
        }
        auto secret = Secret::Take(slice.template first<N>(), std::move(tag), std::move(sink));
        if (secret.IsErr()) {
            return Result<Key, SecretFailure>::Err(std::move(secret).UnwrapErr());
        }
        return Result<Key, SecretFailure>::Ok(Key(std::move(secret).Unwrap(), nonce));
    }

    static Result<Key, SecretFailure> Random(
        std::string tag,
        Nonce nonce,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        auto secret = Secret::Random(std::move(tag), std::move(sink));
        if (secret.IsErr()) {
            return Result<Key, SecretFailure>::Err(std::move(secret).UnwrapErr());
        }
        return Result<Key, SecretFailure>::Ok(Key(std::move(secret).Unwrap(), nonce));
    }

    static Key New(Secret secret, Nonce nonce) {
        return Key(std::move(secret), nonce);
    }

    Key(Key&& other) noexcept
        : secret_(std::move(other.secret_))
        , nonce_(other.nonce_) {}

    Key& operator=(Key&& other) noexcept {
        if (this != &other) {
            secret_ = std::move(other.secret_);
            nonce_ = other.nonce_;
        }
        return *this;
    }

    Key(const Key&) = delete;
    Key& operator=(const Key&) = delete;
    ~Key() = default;

    /**
     * @brief Returns the current nonce and advances the stored one
     */
    Result<nonce::NonceBytes, SecretFailure> NextNonce() const {
        std::unique_lock lock(nonce_lock_);
        const nonce::NonceBytes stamped = nonce_.ToBytes();
        if (auto advanced = nonce_.ToNext(); advanced.IsErr()) {
            return Result<nonce::NonceBytes, SecretFailure>::Err(SecretFailure::FromNonce(advanced.UnwrapErr()));
        }
        debug::LogNonceAdvance(debug::Side::Local, stamped);
        return Result<nonce::NonceBytes, SecretFailure>::Ok(stamped);
    }

    /**
     * @param destination plaintext.size() + TAG_SIZE bytes, receives ciphertext || tag
     * @param out_nonce receives the nonce the ciphertext was sealed under
     */
    Result<Unit, SecretFailure> Encrypt(
        std::span<uint8_t> destination,
        std::span<const uint8_t> plaintext,
        nonce::NonceBytes& out_nonce,
        std::span<const uint8_t> associated_data) const {
        auto stamped = NextNonce();
        if (stamped.IsErr()) {
            return Result<Unit, SecretFailure>::Err(std::move(stamped).UnwrapErr());
        }
        out_nonce = stamped.Unwrap();
        return EncryptWith(destination, plaintext, out_nonce, associated_data);
    }

    /**
     * @brief Seal under a caller-chosen nonce; the stored nonce does not move
     */
    Result<Unit, SecretFailure> EncryptWith(
        std::span<uint8_t> destination,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) const {
        return Flatten(secret_.With([&](const Array& key) {
            return crypto::ChaCha20Poly1305::Encrypt(destination, plaintext, key, nonce, associated_data);
        }));
    }

    Result<Unit, SecretFailure> Decrypt(
        std::span<uint8_t> destination,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) const {
        return Flatten(secret_.With([&](const Array& key) {
            return crypto::ChaCha20Poly1305::Decrypt(destination, ciphertext, key, nonce, associated_data);
        }));
    }

    [[nodiscard]] Nonce GetNonce() const {
        std::shared_lock lock(nonce_lock_);
        return nonce_;
    }

    Result<Unit, SecretFailure> SetCounter(const uint64_t counter) {
        std::unique_lock lock(nonce_lock_);
        if (auto set = nonce_.SetCounter(counter); set.IsErr()) {
            return Result<Unit, SecretFailure>::Err(SecretFailure::FromNonce(set.UnwrapErr()));
        }
        return Result<Unit, SecretFailure>::Ok(unit);
    }

    void SetNonce(const Nonce& nonce) {
        std::unique_lock lock(nonce_lock_);
        nonce_ = nonce;
    }

    Result<Key, SecretFailure> Clone() const {
        auto secret = secret_.Copy();
        if (secret.IsErr()) {
            return Result<Key, SecretFailure>::Err(std::move(secret).UnwrapErr());
        }
        return Result<Key, SecretFailure>::Ok(Key(std::move(secret).Unwrap(), GetNonce()));
    }

    /**
     * @brief Equal key material (constant time) and equal current nonce
     */
    bool operator==(const Key& other) const {
        if (this == &other) {
            return true;
        }
        if (GetNonce() != other.GetNonce()) {
            return false;
        }
        auto same = secret_.SecretEquals(other.secret_);
        return same.IsOk() && same.Unwrap();
    }

    bool operator!=(const Key& other) const { return !(*this == other); }

    /**
     * @brief Audited access to the raw key bytes
     */
    template<typename F>
    auto With(F&& func) const {
        return secret_.With(std::forward<F>(func));
    }

    [[nodiscard]] std::string_view Tag() const { return secret_.Tag(); }
    [[nodiscard]] uint64_t AccessCount() const { return secret_.AccessCount(); }
    [[nodiscard]] const Secret& GetSecret() const noexcept { return secret_; }

private:
    Key(Secret secret, const Nonce& nonce)
        : secret_(std::move(secret))
        , nonce_(nonce) {}

    static Result<Unit, SecretFailure> Flatten(Result<Result<Unit, CryptoFailure>, SecretFailure> outcome) {
        if (outcome.IsErr()) {
            return Result<Unit, SecretFailure>::Err(std::move(outcome).UnwrapErr());
        }
        auto& crypto_outcome = outcome.Unwrap();
        if (crypto_outcome.IsErr()) {
            return Result<Unit, SecretFailure>::Err(SecretFailure::FromCrypto(crypto_outcome.UnwrapErr()));
        }
        return Result<Unit, SecretFailure>::Ok(unit);
    }

    Secret secret_;
    mutable std::shared_mutex nonce_lock_;
    mutable Nonce nonce_;
};

}  // namespace alcove::vault
