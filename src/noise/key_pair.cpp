#include "alcove/noise/key_pair.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/noise/noise_access.hpp"
#include <algorithm>
#include <format>
#include <string>

namespace alcove::noise {
    using crypto::SodiumInterop;

    Result<PublicKey, NoiseFailure> PublicKey::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != NoiseConstants::DH_LEN) {
            return Result<PublicKey, NoiseFailure>::Err(NoiseFailure::InvalidKeyLength(
                std::format("Public key must be {} bytes, got {}", NoiseConstants::DH_LEN, bytes.size())));
        }
        Bytes copied{};
        std::copy(bytes.begin(), bytes.end(), copied.begin());
        return Result<PublicKey, NoiseFailure>::Ok(PublicKey(copied));
    }

    Result<KeyPair, NoiseFailure> KeyPair::Generate(std::shared_ptr<interfaces::IAuditSink> sink) {
        auto private_key = PrivateKey::Random(std::string(NoiseConstants::LOCAL_PRIVATE_KEY_TAG), std::move(sink));
        if (private_key.IsErr()) {
            return Result<KeyPair, NoiseFailure>::Err(NoiseFailure::FromSecret(private_key.UnwrapErr()));
        }
        return FromSecret(std::move(private_key).Unwrap());
    }

    Result<KeyPair, NoiseFailure> KeyPair::FromPrivate(
        std::span<uint8_t, NoiseConstants::DH_LEN> private_key,
        std::shared_ptr<interfaces::IAuditSink> sink) {
        auto secret = PrivateKey::Take(private_key, std::string(NoiseConstants::LOCAL_PRIVATE_KEY_TAG), std::move(sink));
        if (secret.IsErr()) {
            return Result<KeyPair, NoiseFailure>::Err(NoiseFailure::FromSecret(secret.UnwrapErr()));
        }
        return FromSecret(std::move(secret).Unwrap());
    }

    Result<KeyPair, NoiseFailure> KeyPair::FromSecret(PrivateKey private_key) {
        PublicKey::Bytes public_bytes{};
        auto derived = FlattenAccess(private_key.With([&public_bytes](const PrivateKey::Array& scalar) {
            return SodiumInterop::ComputeX25519PublicKey(scalar, public_bytes);
        }));
        if (derived.IsErr()) {
            return Result<KeyPair, NoiseFailure>::Err(std::move(derived).UnwrapErr());
        }
        return Result<KeyPair, NoiseFailure>::Ok(KeyPair(std::move(private_key), PublicKey(public_bytes)));
    }

    Result<Unit, NoiseFailure> KeyPair::Dh(
        const PublicKey& remote,
        std::span<uint8_t, NoiseConstants::DH_LEN> shared) const {
        return FlattenAccess(private_key_.With([&](const PrivateKey::Array& scalar) {
            return SodiumInterop::ComputeX25519SharedSecret(scalar, remote.AsBytes(), shared);
        }));
    }

    Result<KeyPair, NoiseFailure> KeyPair::Clone() const {
        auto copied = private_key_.Copy();
        if (copied.IsErr()) {
            return Result<KeyPair, NoiseFailure>::Err(NoiseFailure::FromSecret(copied.UnwrapErr()));
        }
        return Result<KeyPair, NoiseFailure>::Ok(KeyPair(std::move(copied).Unwrap(), public_key_));
    }

}  // namespace alcove::noise
