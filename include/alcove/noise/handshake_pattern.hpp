#pragma once
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/blake2s.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace alcove::noise {

/**
 * Interactive patterns over 25519 / ChaChaPoly / BLAKE2s.
 *
 * The first letter describes the initiator's static key, the second the
 * responder's: N = none, K = known to the peer before the handshake,
 * X = transmitted during the handshake.
 */
enum class HandshakePattern {
    NN,
    KK,
    XX,
    NK,
    KN,
    XK,
    KX,
    NX,
    XN
};

enum class Token {
    E,
    S,
    EE,
    ES,
    SE,
    SS,
    PSK
};

using MessagePattern = std::vector<Token>;

[[nodiscard]] std::string_view ToString(HandshakePattern pattern);

[[nodiscard]] std::string_view ToString(Token token);

/**
 * @brief "Noise_<P>[pskN]_25519_ChaChaPoly_BLAKE2s"
 */
[[nodiscard]] std::string ProtocolName(
    HandshakePattern pattern,
    std::optional<uint8_t> psk_modifier = std::nullopt);

/**
 * @brief Initial h and ck: the protocol name zero-padded to 32 bytes, or its BLAKE2s hash when longer
 */
Result<crypto::Blake2sDigest, NoiseFailure> ToBytes(
    HandshakePattern pattern,
    std::optional<uint8_t> psk_modifier = std::nullopt);

/**
 * @brief Message scripts in send order, the initiator writes the even ones
 *
 * A psk modifier of 0 puts the PSK token first in message 0; a modifier of
 * n >= 1 appends it to message n - 1.
 */
[[nodiscard]] std::vector<MessagePattern> MessagePatterns(
    HandshakePattern pattern,
    std::optional<uint8_t> psk_modifier = std::nullopt);

/**
 * @brief (initiator static, responder static) known before the first message
 */
[[nodiscard]] std::pair<bool, bool> RequiresPremessage(HandshakePattern pattern);

/**
 * @brief Whether the given side needs its own static key pair
 */
[[nodiscard]] bool RequiresLocalStatic(HandshakePattern pattern, bool initiator);

/**
 * @brief Whether the given side must know the peer's static key up front
 */
[[nodiscard]] bool RequiresRemoteStatic(HandshakePattern pattern, bool initiator);

}  // namespace alcove::noise
