#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/blake2s.hpp"
#include "alcove/debug/key_logger.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include "alcove/noise/cipher_state.hpp"
#include "alcove/noise/handshake_pattern.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace alcove::noise {

/**
 * @brief The two transport CipherStates and the channel-binding hash
 *
 * initiator_to_responder carries the "SKEY" context, responder_to_initiator
 * the "RKEY" context. A responder sends with the second and receives with
 * the first.
 */
struct SplitResult {
    CipherState initiator_to_responder;
    CipherState responder_to_initiator;
    crypto::Blake2sDigest handshake_hash;
};

/**
 * @brief Chaining key, handshake hash and the handshake CipherState
 *
 * ck and h live in protected memory; every mix reads and rewrites them
 * through an audited access.
 */
class SymmetricState {
public:
    using HashSecret = vault::FixedSecret<NoiseConstants::HASH_LEN>;

    /**
     * @brief h = ck = ToBytes(pattern), no cipher key
     */
    static Result<SymmetricState, NoiseFailure> InitializeSymmetric(
        HandshakePattern pattern,
        std::optional<uint8_t> psk_modifier = std::nullopt,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr,
        debug::Side side = debug::Side::Local);

    SymmetricState(SymmetricState&&) noexcept = default;
    SymmetricState& operator=(SymmetricState&&) noexcept = default;
    SymmetricState(const SymmetricState&) = delete;
    SymmetricState& operator=(const SymmetricState&) = delete;
    ~SymmetricState() = default;

    /**
     * @brief [ck, temp_k] = HKDF(ck, ikm, 2), then installs temp_k
     */
    Result<Unit, NoiseFailure> MixKey(std::span<const uint8_t> input_key_material);

    /**
     * @brief h = BLAKE2s(h || data)
     */
    Result<Unit, NoiseFailure> MixHash(std::span<const uint8_t> data);

    /**
     * @brief [ck, temp_h, temp_k] = HKDF(ck, ikm, 3); MixHash(temp_h); installs temp_k
     */
    Result<Unit, NoiseFailure> MixKeyAndHash(std::span<const uint8_t> input_key_material);

    Result<std::vector<uint8_t>, NoiseFailure> EncryptAndHash(std::span<const uint8_t> plaintext);

    /**
     * @brief Opens with AD = h and mixes the ciphertext, not the plaintext
     */
    Result<std::vector<uint8_t>, NoiseFailure> DecryptAndHash(std::span<const uint8_t> ciphertext);

    /**
     * @brief [k1, k2] = HKDF(ck, "", 2) as the two transport CipherStates
     */
    Result<SplitResult, NoiseFailure> Split();

    [[nodiscard]] bool HasKey() const noexcept { return cipher_state_.HasKey(); }

    Result<crypto::Blake2sDigest, NoiseFailure> GetHandshakeHash() const;

private:
    SymmetricState(HashSecret chaining_key, HashSecret hash,
                   std::shared_ptr<interfaces::IAuditSink> sink, debug::Side side);

    /**
     * @brief Runs HKDF(ck, ikm, K), keeps the first output as ck and writes the rest to outputs
     */
    template<size_t K>
    Result<Unit, NoiseFailure> DeriveFromChainingKey(
        std::span<const uint8_t> input_key_material,
        const std::array<crypto::Blake2sDigest*, K - 1>& outputs);

    void TraceMix() const;

    CipherState cipher_state_;
    HashSecret chaining_key_;
    HashSecret hash_;
    std::shared_ptr<interfaces::IAuditSink> sink_;
    debug::Side side_;
};

}  // namespace alcove::noise
