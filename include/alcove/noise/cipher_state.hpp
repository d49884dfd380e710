#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include "alcove/nonce/nonce.hpp"
#include "alcove/vault/key.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace alcove::noise {

inline constexpr nonce::NonceContext kCipherContext = nonce::MakeContext("CKEY");
inline constexpr nonce::NonceContext kSendContext = nonce::MakeContext("SKEY");
inline constexpr nonce::NonceContext kRecvContext = nonce::MakeContext("RKEY");

class SymmetricState;

/**
 * @brief A ChaCha20-Poly1305 key with its Monotonic nonce, or no key yet
 *
 * Transport form (after Split): EncryptWithAd returns the packet
 * ciphertext || tag || nonce and DecryptWithAd opens such a packet under the
 * nonce it carries, then advances the local nonce. Without a key both return
 * their input unchanged.
 *
 * During the handshake SymmetricState uses the implicit-nonce form instead:
 * the nonce is not written to the wire and both sides advance it in lockstep.
 */
class CipherState {
public:
    using CipherKey = vault::Key<nonce::Monotonic>;

    explicit CipherState(std::shared_ptr<interfaces::IAuditSink> sink = nullptr);

    CipherState(CipherState&&) noexcept = default;
    CipherState& operator=(CipherState&&) noexcept = default;
    CipherState(const CipherState&) = delete;
    CipherState& operator=(const CipherState&) = delete;
    ~CipherState() = default;

    /**
     * @brief Installs key under a fresh counter-0 nonce for context; key is zeroed
     */
    Result<Unit, NoiseFailure> InitializeKey(
        std::span<uint8_t> key,
        std::string tag,
        const nonce::NonceContext& context);

    [[nodiscard]] bool HasKey() const noexcept { return key_.has_value(); }

    Result<std::vector<uint8_t>, NoiseFailure> EncryptWithAd(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext);

    Result<std::vector<uint8_t>, NoiseFailure> DecryptWithAd(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> packet);

    /**
     * @brief Replaces the counter, e.g. for a receiver that already knows the incoming nonce
     */
    Result<Unit, NoiseFailure> SetNonce(uint64_t counter);

    /**
     * @brief k = first 32 bytes of ENCRYPT(k, MAX_NONCE, "", zeros[32])
     *
     * The nonce and its creation time are kept. Refused with CounterExpired
     * once the nonce needs rotation; the session must run a new handshake.
     */
    Result<Unit, NoiseFailure> Rekey();

    [[nodiscard]] std::optional<nonce::MonotonicNonce> GetNonce() const;

    [[nodiscard]] const std::optional<CipherKey>& GetKey() const noexcept { return key_; }

private:
    friend class SymmetricState;

    Result<std::vector<uint8_t>, NoiseFailure> Seal(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext);

    Result<std::vector<uint8_t>, NoiseFailure> Open(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> ciphertext);

    std::optional<CipherKey> key_;
    std::shared_ptr<interfaces::IAuditSink> sink_;
};

}  // namespace alcove::noise
