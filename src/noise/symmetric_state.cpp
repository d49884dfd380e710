#include "alcove/noise/symmetric_state.hpp"
#include "alcove/crypto/hkdf.hpp"
#include "alcove/noise/noise_access.hpp"
#include "alcove/vault/secure_ref.hpp"
#include <sodium.h>
#include <string>

namespace alcove::noise {
    using crypto::Blake2s;
    using crypto::Blake2sDigest;
    using crypto::Hkdf;
    using vault::SecureRef;

    SymmetricState::SymmetricState(
        HashSecret chaining_key,
        HashSecret hash,
        std::shared_ptr<interfaces::IAuditSink> sink,
        const debug::Side side)
        : cipher_state_(sink)
        , chaining_key_(std::move(chaining_key))
        , hash_(std::move(hash))
        , sink_(std::move(sink))
        , side_(side) {
    }

    Result<SymmetricState, NoiseFailure> SymmetricState::InitializeSymmetric(
        const HandshakePattern pattern,
        const std::optional<uint8_t> psk_modifier,
        std::shared_ptr<interfaces::IAuditSink> sink,
        const debug::Side side) {
        auto initial = ToBytes(pattern, psk_modifier);
        if (initial.IsErr()) {
            return Result<SymmetricState, NoiseFailure>::Err(std::move(initial).UnwrapErr());
        }
        const Blake2sDigest seed = initial.Unwrap();
        auto chaining_key = HashSecret::New(Blake2sDigest(seed), std::string(NoiseConstants::CHAINING_KEY_TAG), sink);
        if (chaining_key.IsErr()) {
            return Result<SymmetricState, NoiseFailure>::Err(NoiseFailure::FromSecret(chaining_key.UnwrapErr()));
        }
        auto hash = HashSecret::New(Blake2sDigest(seed), std::string(NoiseConstants::HANDSHAKE_HASH_TAG), sink);
        if (hash.IsErr()) {
            return Result<SymmetricState, NoiseFailure>::Err(NoiseFailure::FromSecret(hash.UnwrapErr()));
        }
        debug::LogHandshakeStart(side, ProtocolName(pattern, psk_modifier), seed);
        return Result<SymmetricState, NoiseFailure>::Ok(SymmetricState(
            std::move(chaining_key).Unwrap(), std::move(hash).Unwrap(), std::move(sink), side));
    }

    template<size_t K>
    Result<Unit, NoiseFailure> SymmetricState::DeriveFromChainingKey(
        std::span<const uint8_t> input_key_material,
        const std::array<Blake2sDigest*, K - 1>& outputs) {
        return FlattenAccess(chaining_key_.WithMut([&](HashSecret::Array& ck) -> Result<Unit, CryptoFailure> {
            auto keys = Hkdf::DeriveKeys<K>(ck, input_key_material);
            if (keys.IsErr()) {
                return Result<Unit, CryptoFailure>::Err(std::move(keys).UnwrapErr());
            }
            auto& derived = keys.Unwrap();
            ck = derived[0];
            for (size_t i = 1; i < K; ++i) {
                *outputs[i - 1] = derived[i];
            }
            sodium_memzero(derived.data(), sizeof(Blake2sDigest) * K);
            return Result<Unit, CryptoFailure>::Ok(unit);
        }));
    }

    Result<Unit, NoiseFailure> SymmetricState::MixKey(std::span<const uint8_t> input_key_material) {
        SecureRef<Blake2sDigest> temp_k(Blake2sDigest{});
        TRY(DeriveFromChainingKey<2>(input_key_material, {&temp_k.GetMut()}));
        TRY(cipher_state_.InitializeKey(
            temp_k.GetMut(), std::string(NoiseConstants::CIPHER_KEY_TAG), kCipherContext));
        TraceMix();
        return Result<Unit, NoiseFailure>::Ok(unit);
    }

    Result<Unit, NoiseFailure> SymmetricState::MixHash(std::span<const uint8_t> data) {
        return FlattenAccess(hash_.WithMut([data](HashSecret::Array& h) -> Result<Unit, CryptoFailure> {
            auto next = Blake2s::HashParts({h, data});
            if (next.IsErr()) {
                return Result<Unit, CryptoFailure>::Err(std::move(next).UnwrapErr());
            }
            h = next.Unwrap();
            return Result<Unit, CryptoFailure>::Ok(unit);
        }));
    }

    Result<Unit, NoiseFailure> SymmetricState::MixKeyAndHash(std::span<const uint8_t> input_key_material) {
        SecureRef<Blake2sDigest> temp_h(Blake2sDigest{});
        SecureRef<Blake2sDigest> temp_k(Blake2sDigest{});
        TRY(DeriveFromChainingKey<3>(input_key_material, {&temp_h.GetMut(), &temp_k.GetMut()}));
        TRY(MixHash(temp_h.Get()));
        TRY(cipher_state_.InitializeKey(
            temp_k.GetMut(), std::string(NoiseConstants::CIPHER_KEY_TAG), kCipherContext));
        TraceMix();
        return Result<Unit, NoiseFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, NoiseFailure> SymmetricState::EncryptAndHash(std::span<const uint8_t> plaintext) {
        auto h = GetHandshakeHash();
        if (h.IsErr()) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Err(std::move(h).UnwrapErr());
        }
        auto ciphertext = cipher_state_.Seal(h.Unwrap(), plaintext);
        if (ciphertext.IsErr()) {
            return ciphertext;
        }
        TRY(MixHash(ciphertext.Unwrap()));
        return ciphertext;
    }

    Result<std::vector<uint8_t>, NoiseFailure> SymmetricState::DecryptAndHash(std::span<const uint8_t> ciphertext) {
        auto h = GetHandshakeHash();
        if (h.IsErr()) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Err(std::move(h).UnwrapErr());
        }
        auto plaintext = cipher_state_.Open(h.Unwrap(), ciphertext);
        if (plaintext.IsErr()) {
            return plaintext;
        }
        TRY(MixHash(ciphertext));
        return plaintext;
    }

    Result<SplitResult, NoiseFailure> SymmetricState::Split() {
        SecureRef<Blake2sDigest> first(Blake2sDigest{});
        SecureRef<Blake2sDigest> second(Blake2sDigest{});
        TRY(FlattenAccess(chaining_key_.With([&](const HashSecret::Array& ck) -> Result<Unit, CryptoFailure> {
            auto keys = Hkdf::DeriveKeys<2>(ck, {});
            if (keys.IsErr()) {
                return Result<Unit, CryptoFailure>::Err(std::move(keys).UnwrapErr());
            }
            auto& derived = keys.Unwrap();
            first.GetMut() = derived[0];
            second.GetMut() = derived[1];
            sodium_memzero(derived.data(), sizeof(Blake2sDigest) * 2);
            return Result<Unit, CryptoFailure>::Ok(unit);
        })));

        CipherState initiator_to_responder(sink_);
        CipherState responder_to_initiator(sink_);
        TRY(initiator_to_responder.InitializeKey(
            first.GetMut(), std::string(NoiseConstants::SEND_KEY_TAG), kSendContext));
        TRY(responder_to_initiator.InitializeKey(
            second.GetMut(), std::string(NoiseConstants::RECV_KEY_TAG), kRecvContext));

        auto h = GetHandshakeHash();
        if (h.IsErr()) {
            return Result<SplitResult, NoiseFailure>::Err(std::move(h).UnwrapErr());
        }
        debug::LogSplit(side_, h.Unwrap());
        return Result<SplitResult, NoiseFailure>::Ok(SplitResult{
            std::move(initiator_to_responder), std::move(responder_to_initiator), h.Unwrap()});
    }

    Result<Blake2sDigest, NoiseFailure> SymmetricState::GetHandshakeHash() const {
        auto copied = hash_.With([](const HashSecret::Array& h) { return h; });
        if (copied.IsErr()) {
            return Result<Blake2sDigest, NoiseFailure>::Err(NoiseFailure::FromSecret(copied.UnwrapErr()));
        }
        return Result<Blake2sDigest, NoiseFailure>::Ok(copied.Unwrap());
    }

    void SymmetricState::TraceMix() const {
#ifdef ALCOVE_DEBUG_KEYS
        auto traced = chaining_key_.With([this](const HashSecret::Array& ck) {
            return hash_.With([&](const HashSecret::Array& h) { debug::LogMixKey(side_, ck, h); });
        });
        if (traced.IsErr()) {
            ALCOVE_LOG_MSG(side_, "MIX", traced.UnwrapErr().message.c_str());
        }
#endif
    }

}  // namespace alcove::noise
