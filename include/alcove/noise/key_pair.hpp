#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace alcove::noise {

class PublicKey {
public:
    using Bytes = std::array<uint8_t, NoiseConstants::DH_LEN>;

    /**
     * @return InvalidKeyLength unless bytes holds exactly DH_LEN bytes
     */
    static Result<PublicKey, NoiseFailure> FromBytes(std::span<const uint8_t> bytes);

    explicit PublicKey(const Bytes& bytes) : bytes_(bytes) {}

    [[nodiscard]] Bytes ToBytes() const { return bytes_; }
    [[nodiscard]] const Bytes& AsBytes() const noexcept { return bytes_; }

    bool operator==(const PublicKey& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    Bytes bytes_;
};

/**
 * @brief Curve25519 key pair with the private half in protected memory
 *
 * The private scalar never leaves its FixedSecret: Dh runs inside an audited
 * access and only the shared secret is written out.
 */
class KeyPair {
public:
    using PrivateKey = vault::FixedSecret<NoiseConstants::DH_LEN>;

    static Result<KeyPair, NoiseFailure> Generate(
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr);

    /**
     * @brief Imports a private scalar; the caller's buffer is zeroed
     */
    static Result<KeyPair, NoiseFailure> FromPrivate(
        std::span<uint8_t, NoiseConstants::DH_LEN> private_key,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr);

    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const PrivateKey& GetPrivateKey() const noexcept { return private_key_; }

    /**
     * @brief X25519(private, remote) into shared
     *
     * @return CryptoError(InvalidKeyLength) when remote is a low-order point
     */
    Result<Unit, NoiseFailure> Dh(
        const PublicKey& remote,
        std::span<uint8_t, NoiseConstants::DH_LEN> shared) const;

    Result<KeyPair, NoiseFailure> Clone() const;

private:
    KeyPair(PrivateKey private_key, const PublicKey& public_key)
        : private_key_(std::move(private_key))
        , public_key_(public_key) {}

    static Result<KeyPair, NoiseFailure> FromSecret(PrivateKey private_key);

    PrivateKey private_key_;
    PublicKey public_key_;
};

}  // namespace alcove::noise
