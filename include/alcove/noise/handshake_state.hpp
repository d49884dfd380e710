#pragma once
#include "alcove/configuration/handshake_config.hpp"
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/blake2s.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include "alcove/noise/cipher_state.hpp"
#include "alcove/noise/handshake_pattern.hpp"
#include "alcove/noise/key_pair.hpp"
#include "alcove/noise/symmetric_state.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <span>

namespace alcove::noise {

/**
 * @brief Transport keys oriented for the local side
 */
struct TransportKeys {
    CipherState send;
    CipherState recv;
    crypto::Blake2sDigest handshake_hash;
};

/**
 * @brief Outcome of one WriteMessage / ReadMessage
 *
 * length is the number of message bytes written, or payload bytes read.
 * transport is set once the last message has been processed.
 */
struct MessageOutcome {
    size_t length = 0;
    std::optional<TransportKeys> transport;
};

/**
 * @brief One side of a Noise handshake
 *
 * Messages alternate, starting with the initiator. Any failure (a bad tag,
 * a malformed public key, a missing key, an undersized buffer) leaves the
 * state unusable; drop it and start over. Secrets held by a dropped state are
 * zeroed by their containers.
 *
 * **Usage Example**:
 * ```cpp
 * auto initiator = HandshakeState::Initialize(HandshakeConfig::Initiator(HandshakePattern::NN)).Unwrap();
 * std::array<uint8_t, NoiseConstants::MAX_MESSAGE_LEN> buffer{};
 * auto first = initiator.WriteMessage(payload, buffer).Unwrap();
 * send(std::span(buffer).first(first.length));
 * ```
 */
class HandshakeState {
public:
    /**
     * @param s local static key pair, required when the pattern sends or pre-shares it
     * @param e local ephemeral, normally empty; the E token generates one
     * @param rs remote static public key, required for K premessages
     * @param re remote ephemeral public key, normally empty
     */
    static Result<HandshakeState, NoiseFailure> Initialize(
        configuration::HandshakeConfig config,
        std::optional<KeyPair> s = std::nullopt,
        std::optional<KeyPair> e = std::nullopt,
        std::optional<PublicKey> rs = std::nullopt,
        std::optional<PublicKey> re = std::nullopt,
        std::shared_ptr<interfaces::IAuditSink> sink = nullptr);

    HandshakeState(HandshakeState&&) noexcept = default;
    HandshakeState& operator=(HandshakeState&&) noexcept = default;
    HandshakeState(const HandshakeState&) = delete;
    HandshakeState& operator=(const HandshakeState&) = delete;
    ~HandshakeState() = default;

    /**
     * @brief Writes the next message into message_buffer
     *
     * @return HandshakeComplete, InvalidMessage when it is the peer's turn,
     *         MessageTooLong past 65535 bytes, BufferTooSmall when
     *         message_buffer cannot hold the message
     */
    Result<MessageOutcome, NoiseFailure> WriteMessage(
        std::span<const uint8_t> payload,
        std::span<uint8_t> message_buffer);

    /**
     * @brief Processes the peer's next message and writes its payload into payload_buffer
     */
    Result<MessageOutcome, NoiseFailure> ReadMessage(
        std::span<const uint8_t> message,
        std::span<uint8_t> payload_buffer);

    [[nodiscard]] bool IsComplete() const noexcept { return message_patterns_.empty(); }
    [[nodiscard]] bool IsInitiator() const noexcept { return initiator_; }
    [[nodiscard]] bool IsMyTurn() const noexcept { return (messages_processed_ % 2 == 0) == initiator_; }
    [[nodiscard]] size_t MessagesRemaining() const noexcept { return message_patterns_.size(); }
    [[nodiscard]] const std::optional<PublicKey>& GetRemoteStatic() const noexcept { return rs_; }
    [[nodiscard]] const std::optional<PublicKey>& GetRemoteEphemeral() const noexcept { return re_; }
    [[nodiscard]] HandshakePattern Pattern() const noexcept { return pattern_; }

    Result<crypto::Blake2sDigest, NoiseFailure> GetHandshakeHash() const;

private:
    HandshakeState(
        SymmetricState symmetric_state,
        HandshakePattern pattern,
        bool initiator,
        std::optional<KeyPair> s,
        std::optional<KeyPair> e,
        std::optional<PublicKey> rs,
        std::optional<PublicKey> re,
        std::optional<configuration::HandshakeConfig::PresharedKey> psk,
        bool psk_mode,
        std::shared_ptr<interfaces::IAuditSink> sink);

    Result<Unit, NoiseFailure> MixPremessages();
    Result<Unit, NoiseFailure> MixLocalStatic();
    Result<Unit, NoiseFailure> MixRemoteStatic();

    Result<size_t, NoiseFailure> ProcessWrite(Token token, std::span<uint8_t> message_buffer, size_t head);
    Result<size_t, NoiseFailure> ProcessRead(Token token, std::span<const uint8_t> message, size_t head);

    /**
     * @brief MixKey(DH(local, remote)) for the ee/es/se/ss tokens
     */
    Result<Unit, NoiseFailure> MixDh(
        const std::optional<KeyPair>& local,
        const std::optional<PublicKey>& remote,
        NoiseFailureType local_missing,
        NoiseFailureType remote_missing);

    Result<Unit, NoiseFailure> MixToken(Token token);
    Result<Unit, NoiseFailure> MixPsk();

    Result<std::optional<TransportKeys>, NoiseFailure> FinishIfComplete();

    SymmetricState symmetric_state_;
    HandshakePattern pattern_;
    bool initiator_;
    std::optional<KeyPair> s_;
    std::optional<KeyPair> e_;
    std::optional<PublicKey> rs_;
    std::optional<PublicKey> re_;
    std::optional<configuration::HandshakeConfig::PresharedKey> psk_;
    bool psk_mode_;
    std::deque<MessagePattern> message_patterns_;
    size_t messages_processed_ = 0;
    std::shared_ptr<interfaces::IAuditSink> sink_;
};

}  // namespace alcove::noise
