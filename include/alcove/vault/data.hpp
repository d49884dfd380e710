#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/nonce/nonce.hpp"
#include "alcove/vault/dynamic_secret.hpp"
#include "alcove/vault/key.hpp"
#include <sodium.h>
#include <algorithm>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace alcove::vault {

namespace state {

struct Plain {
    static constexpr std::string_view kPrefix = "<Plain>";
};

struct Encrypted {
    static constexpr std::string_view kPrefix = "<Encrypted>";
    nonce::NonceBytes nonce{};
};

struct Authenticated {
    static constexpr std::string_view kPrefix = "<Authenticated>";
    nonce::NonceBytes nonce{};
    std::vector<uint8_t> associated_data;
};

template<typename S>
inline constexpr bool kIsProtected = std::is_same_v<S, Encrypted> || std::is_same_v<S, Authenticated>;

}  // namespace state

/**
 * @brief Byte payload in protected memory whose type records its crypto state
 *
 * Data<Plain> can only be encrypted, Data<Encrypted> and Data<Authenticated>
 * can only be decrypted. Transitions consume the source (call them on an
 * rvalue) and rewrite the tag prefix, so "<Plain>invoice" becomes
 * "<Encrypted>invoice" and back, and the audit trail shows every state a
 * payload went through.
 *
 * Packet form of a protected state is ciphertext || tag || nonce.
 */
template<typename S>
class Data {
public:
    using Bytes = DynamicSecret<std::vector<uint8_t>>;

    static Result<Data, SecretFailure> New(
        std::vector<uint8_t> bytes,
        std::string_view tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        static_assert(std::is_same_v<S, state::Plain>, "Only plain data is created from raw bytes");
        auto inner = Bytes::New(std::move(bytes), Prefixed(tag), std::move(sink));
        if (inner.IsErr()) {
            return Result<Data, SecretFailure>::Err(std::move(inner).UnwrapErr());
        }
        return Result<Data, SecretFailure>::Ok(Data(std::move(inner).Unwrap(), state::Plain{}));
    }

    static Result<Data, SecretFailure> FromEncrypted(
        std::vector<uint8_t> ciphertext,
        const nonce::NonceBytes& nonce,
        std::string_view tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        static_assert(std::is_same_v<S, state::Encrypted>, "FromEncrypted builds Data<Encrypted>");
        auto inner = Bytes::New(std::move(ciphertext), Prefixed(tag), std::move(sink));
        if (inner.IsErr()) {
            return Result<Data, SecretFailure>::Err(std::move(inner).UnwrapErr());
        }
        return Result<Data, SecretFailure>::Ok(Data(std::move(inner).Unwrap(), state::Encrypted{nonce}));
    }

    static Result<Data, SecretFailure> FromAuthenticated(
        std::vector<uint8_t> ciphertext,
        const nonce::NonceBytes& nonce,
        std::vector<uint8_t> associated_data,
        std::string_view tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        static_assert(std::is_same_v<S, state::Authenticated>, "FromAuthenticated builds Data<Authenticated>");
        auto inner = Bytes::New(std::move(ciphertext), Prefixed(tag), std::move(sink));
        if (inner.IsErr()) {
            return Result<Data, SecretFailure>::Err(std::move(inner).UnwrapErr());
        }
        return Result<Data, SecretFailure>::Ok(Data(
            std::move(inner).Unwrap(), state::Authenticated{nonce, std::move(associated_data)}));
    }

    /**
     * @brief Splits ciphertext || nonce, then zeroes the caller's packet buffer
     *
     * Authenticated data rebuilt this way carries no associated data; the
     * receiver supplies it to DecryptVerified.
     */
    static Result<Data, SecretFailure> FromPacket(
        std::vector<uint8_t>& packet,
        std::string_view tag,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr) {
        static_assert(state::kIsProtected<S>, "Only encrypted states have a packet form");
        if (packet.size() < nonce::kNonceBytes + Constants::TAG_SIZE) {
            const size_t size = packet.size();
            WipeBuffer(packet);
            return Result<Data, SecretFailure>::Err(SecretFailure::InvalidLength(
                std::format("Packet of {} bytes cannot hold a tag and a nonce", size)));
        }
        const size_t body = packet.size() - nonce::kNonceBytes;
        S witness{};
        std::copy(packet.begin() + static_cast<std::ptrdiff_t>(body), packet.end(), witness.nonce.begin());
        std::vector<uint8_t> ciphertext(packet.begin(), packet.begin() + static_cast<std::ptrdiff_t>(body));
        WipeBuffer(packet);
        auto inner = Bytes::New(std::move(ciphertext), Prefixed(tag), std::move(sink));
        if (inner.IsErr()) {
            return Result<Data, SecretFailure>::Err(std::move(inner).UnwrapErr());
        }
        return Result<Data, SecretFailure>::Ok(Data(std::move(inner).Unwrap(), std::move(witness)));
    }

    Data(Data&&) noexcept = default;
    Data& operator=(Data&&) noexcept = default;
    Data(const Data&) = delete;
    Data& operator=(const Data&) = delete;

    template<typename Kind, size_t N>
    Result<Data<state::Encrypted>, SecretFailure> Encrypt(const Key<Kind, N>& key) && {
        static_assert(std::is_same_v<S, state::Plain>, "Only plain data can be encrypted");
        state::Encrypted witness{};
        auto sealed = Seal(key, witness.nonce, {}, state::Encrypted::kPrefix);
        if (sealed.IsErr()) {
            return Result<Data<state::Encrypted>, SecretFailure>::Err(std::move(sealed).UnwrapErr());
        }
        return Result<Data<state::Encrypted>, SecretFailure>::Ok(
            Data<state::Encrypted>(std::move(sealed).Unwrap(), std::move(witness)));
    }

    template<typename Kind, size_t N>
    Result<Data<state::Authenticated>, SecretFailure> EncryptAuthenticated(
        const Key<Kind, N>& key,
        std::span<const uint8_t> associated_data) && {
        static_assert(std::is_same_v<S, state::Plain>, "Only plain data can be encrypted");
        state::Authenticated witness{};
        witness.associated_data.assign(associated_data.begin(), associated_data.end());
        auto sealed = Seal(key, witness.nonce, associated_data, state::Authenticated::kPrefix);
        if (sealed.IsErr()) {
            return Result<Data<state::Authenticated>, SecretFailure>::Err(std::move(sealed).UnwrapErr());
        }
        return Result<Data<state::Authenticated>, SecretFailure>::Ok(
            Data<state::Authenticated>(std::move(sealed).Unwrap(), std::move(witness)));
    }

    template<typename Kind, size_t N>
    Result<Data<state::Plain>, SecretFailure> Decrypt(const Key<Kind, N>& key) && {
        static_assert(std::is_same_v<S, state::Encrypted>, "Decrypt takes Data<Encrypted>");
        return Open(key, {});
    }

    template<typename Kind, size_t N>
    Result<Data<state::Plain>, SecretFailure> DecryptVerified(
        const Key<Kind, N>& key,
        std::span<const uint8_t> associated_data) && {
        static_assert(std::is_same_v<S, state::Authenticated>, "DecryptVerified takes Data<Authenticated>");
        return Open(key, associated_data);
    }

    /**
     * @brief ciphertext || tag || nonce
     */
    Result<std::vector<uint8_t>, SecretFailure> AsPacket() const {
        static_assert(state::kIsProtected<S>, "Only encrypted states have a packet form");
        return inner_.With([this](const std::vector<uint8_t>& ciphertext) {
            std::vector<uint8_t> packet;
            packet.reserve(ciphertext.size() + nonce::kNonceBytes);
            packet.insert(packet.end(), ciphertext.begin(), ciphertext.end());
            packet.insert(packet.end(), state_.nonce.begin(), state_.nonce.end());
            return packet;
        });
    }

    /**
     * @brief Copy of the stored bytes; the caller owns and must scrub it
     */
    Result<std::vector<uint8_t>, SecretFailure> AsBytes() const {
        return inner_.With([](const std::vector<uint8_t>& bytes) { return bytes; });
    }

    [[nodiscard]] size_t Len() const { return inner_.InnerLen(); }
    [[nodiscard]] std::string_view Tag() const { return inner_.Tag(); }
    [[nodiscard]] uint64_t AccessCount() const { return inner_.AccessCount(); }

    [[nodiscard]] const nonce::NonceBytes& GetNonce() const {
        static_assert(state::kIsProtected<S>, "Plain data has no nonce");
        return state_.nonce;
    }

    [[nodiscard]] const std::vector<uint8_t>& AuthenticatedData() const {
        static_assert(std::is_same_v<S, state::Authenticated>, "Only authenticated data carries associated data");
        return state_.associated_data;
    }

private:
    template<typename>
    friend class Data;

    Data(Bytes inner, S witness)
        : inner_(std::move(inner))
        , state_(std::move(witness)) {}

    static std::string Prefixed(std::string_view tag) {
        return std::string(S::kPrefix) + std::string(tag);
    }

    [[nodiscard]] std::string BareTag() const {
        std::string_view tag = inner_.Tag();
        if (tag.starts_with(S::kPrefix)) {
            tag.remove_prefix(S::kPrefix.size());
        }
        return std::string(tag);
    }

    static void WipeBuffer(std::vector<uint8_t>& buffer) noexcept {
        if (!buffer.empty()) {
            sodium_memzero(buffer.data(), buffer.size());
        }
        buffer.clear();
    }

    template<typename Kind, size_t N>
    Result<Bytes, SecretFailure> Seal(
        const Key<Kind, N>& key,
        nonce::NonceBytes& out_nonce,
        std::span<const uint8_t> associated_data,
        std::string_view next_prefix) const {
        std::vector<uint8_t> sealed(inner_.Len() + Constants::TAG_SIZE);
        auto encrypted = inner_.With([&](const std::vector<uint8_t>& plaintext) {
            return key.Encrypt(sealed, plaintext, out_nonce, associated_data);
        });
        if (encrypted.IsErr()) {
            return Result<Bytes, SecretFailure>::Err(std::move(encrypted).UnwrapErr());
        }
        if (encrypted.Unwrap().IsErr()) {
            return Result<Bytes, SecretFailure>::Err(std::move(encrypted).Unwrap().UnwrapErr());
        }
        return Bytes::New(std::move(sealed), std::string(next_prefix) + BareTag(), inner_.AuditSink());
    }

    template<typename Kind, size_t N>
    Result<Data<state::Plain>, SecretFailure> Open(
        const Key<Kind, N>& key,
        std::span<const uint8_t> associated_data) const {
        const size_t len = inner_.Len();
        if (len < Constants::TAG_SIZE) {
            return Result<Data<state::Plain>, SecretFailure>::Err(SecretFailure::InvalidLength(
                std::format("Ciphertext of {} bytes is shorter than the tag", len)));
        }
        std::vector<uint8_t> opened(len - Constants::TAG_SIZE);
        auto decrypted = inner_.With([&](const std::vector<uint8_t>& ciphertext) {
            return key.Decrypt(opened, ciphertext, state_.nonce, associated_data);
        });
        if (decrypted.IsErr()) {
            return Result<Data<state::Plain>, SecretFailure>::Err(std::move(decrypted).UnwrapErr());
        }
        if (decrypted.Unwrap().IsErr()) {
            return Result<Data<state::Plain>, SecretFailure>::Err(std::move(decrypted).Unwrap().UnwrapErr());
        }
        auto plain = Bytes::New(
            std::move(opened), std::string(state::Plain::kPrefix) + BareTag(), inner_.AuditSink());
        if (plain.IsErr()) {
            return Result<Data<state::Plain>, SecretFailure>::Err(std::move(plain).UnwrapErr());
        }
        return Result<Data<state::Plain>, SecretFailure>::Ok(
            Data<state::Plain>(std::move(plain).Unwrap(), state::Plain{}));
    }

    Bytes inner_;
    S state_;
};

}  // namespace alcove::vault
