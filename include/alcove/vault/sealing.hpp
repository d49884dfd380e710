#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/vault/dynamic_secret.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include "alcove/vault/key.hpp"
#include "alcove/vault/secure_ref.hpp"
#include "vault/sealed_secret.pb.h"
#include <format>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace alcove::vault {

/**
 * Persistence gate. Only Encrypted-level containers can be turned into a
 * SealedSecret record; asking for an Ephemeral one fails to compile. The
 * record binds the tag as AEAD additional data, so a record cannot be
 * relabelled without failing Unseal.
 */

namespace detail {

    template<typename Container>
    struct IsFixedSecret : std::false_type {};

    template<size_t N, typename L>
    struct IsFixedSecret<FixedSecret<N, L>> : std::true_type {};

    inline std::span<const uint8_t> TagBytes(std::string_view tag) {
        return {reinterpret_cast<const uint8_t*>(tag.data()), tag.size()};
    }

    template<typename Kind, size_t K>
    Result<proto::vault::SealedSecret, SecretFailure> SealBytes(
        std::span<const uint8_t> plaintext,
        std::string_view tag,
        const Key<Kind, K>& key) {
        std::vector<uint8_t> ciphertext(plaintext.size() + Constants::TAG_SIZE);
        nonce::NonceBytes used_nonce{};
        TRY(key.Encrypt(ciphertext, plaintext, used_nonce, TagBytes(tag)));
        proto::vault::SealedSecret record;
        record.set_tag(std::string(tag));
        record.set_level(proto::vault::SECURITY_LEVEL_ENCRYPTED);
        record.set_nonce(used_nonce.data(), used_nonce.size());
        record.set_ciphertext(ciphertext.data(), ciphertext.size());
        record.set_created_at_us(nonce::NowMicros());
        return Result<proto::vault::SealedSecret, SecretFailure>::Ok(std::move(record));
    }

    template<typename Kind, size_t K>
    Result<SecureRef<std::vector<uint8_t>>, SecretFailure> UnsealBytes(
        const proto::vault::SealedSecret& record,
        const Key<Kind, K>& key) {
        using Opened = Result<SecureRef<std::vector<uint8_t>>, SecretFailure>;
        if (record.level() != proto::vault::SECURITY_LEVEL_ENCRYPTED) {
            return Opened::Err(SecretFailure::NotPersistable(
                std::format("Record '{}' is not at the encrypted level", record.tag())));
        }
        if (record.nonce().size() != nonce::kNonceBytes || record.ciphertext().size() < Constants::TAG_SIZE) {
            return Opened::Err(SecretFailure::InvalidLength(
                std::format("Record '{}' has a malformed nonce or ciphertext", record.tag())));
        }
        const auto* ciphertext = reinterpret_cast<const uint8_t*>(record.ciphertext().data());
        const auto* nonce_bytes = reinterpret_cast<const uint8_t*>(record.nonce().data());
        SecureRef<std::vector<uint8_t>> plaintext(
            std::vector<uint8_t>(record.ciphertext().size() - Constants::TAG_SIZE));
        TRY(key.Decrypt(
            plaintext.GetMut(),
            std::span<const uint8_t>(ciphertext, record.ciphertext().size()),
            std::span<const uint8_t>(nonce_bytes, nonce::kNonceBytes),
            TagBytes(record.tag())));
        return Opened::Ok(std::move(plaintext));
    }

}  // namespace detail

template<size_t N, typename L, typename Kind, size_t K>
Result<proto::vault::SealedSecret, SecretFailure> Seal(
    const FixedSecret<N, L>& secret,
    const Key<Kind, K>& key) {
    static_assert(L::kPersistable, "Ephemeral secrets cannot be persisted");
    auto sealed = secret.With([&](const std::array<uint8_t, N>& bytes) {
        return detail::SealBytes(bytes, secret.Tag(), key);
    });
    if (sealed.IsErr()) {
        return Result<proto::vault::SealedSecret, SecretFailure>::Err(std::move(sealed).UnwrapErr());
    }
    return std::move(sealed).Unwrap();
}

template<typename T, typename L, typename Kind, size_t K>
Result<proto::vault::SealedSecret, SecretFailure> Seal(
    const DynamicSecret<T, L>& secret,
    const Key<Kind, K>& key) {
    static_assert(L::kPersistable, "Ephemeral secrets cannot be persisted");
    auto sealed = secret.With([&](const T& value) -> Result<proto::vault::SealedSecret, SecretFailure> {
        auto serialized = SecretTraits<T>::Serialize(value);
        if (serialized.IsErr()) {
            return Result<proto::vault::SealedSecret, SecretFailure>::Err(std::move(serialized).UnwrapErr());
        }
        const SecureRef<std::vector<uint8_t>> bytes(std::move(serialized).Unwrap());
        return detail::SealBytes(bytes.Get(), secret.Tag(), key);
    });
    if (sealed.IsErr()) {
        return Result<proto::vault::SealedSecret, SecretFailure>::Err(std::move(sealed).UnwrapErr());
    }
    return std::move(sealed).Unwrap();
}

/**
 * @brief Restores an Encrypted-level container, e.g. Unseal<FixedSecret<32, Encrypted>>(record, key)
 */
template<typename Container, typename Kind, size_t K>
Result<Container, SecretFailure> Unseal(
    const proto::vault::SealedSecret& record,
    const Key<Kind, K>& key,
    std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
    static_assert(Container::Level::kPersistable, "Ephemeral secrets cannot be restored from storage");
    auto opened = detail::UnsealBytes(record, key);
    if (opened.IsErr()) {
        return Result<Container, SecretFailure>::Err(std::move(opened).UnwrapErr());
    }
    auto& plaintext = opened.Unwrap().GetMut();
    if constexpr (detail::IsFixedSecret<Container>::value) {
        if (plaintext.size() != Container::kSize) {
            return Result<Container, SecretFailure>::Err(SecretFailure::InvalidLength(
                std::format("Record '{}' holds {} bytes, expected {}", record.tag(), plaintext.size(), Container::kSize)));
        }
        return Container::Take(std::span<uint8_t, Container::kSize>(plaintext.data(), Container::kSize),
                               record.tag(), std::move(sink));
    } else {
        auto value = SecretTraits<typename Container::Inner>::Deserialize(plaintext);
        if (value.IsErr()) {
            return Result<Container, SecretFailure>::Err(std::move(value).UnwrapErr());
        }
        return Container::New(std::move(value).Unwrap(), record.tag(), std::move(sink));
    }
}

}  // namespace alcove::vault
