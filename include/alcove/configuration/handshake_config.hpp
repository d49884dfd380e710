#pragma once

#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/noise/handshake_pattern.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <vector>

namespace alcove::configuration {

/**
 * @brief Inputs of HandshakeState::Initialize besides the key pairs
 *
 * The pre-shared key is move-only protected memory, so the config is too.
 * A psk modifier without a key is accepted here and fails with PskMissing
 * when the handshake reaches the PSK token.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = HandshakeConfig::Initiator(noise::HandshakePattern::XX, prologue);
 * auto psk_config = HandshakeConfig::Responder(noise::HandshakePattern::NN)
 *     .WithPsk(std::move(psk), 0);
 * ```
 */
class HandshakeConfig {
public:
    using PresharedKey = vault::FixedSecret<NoiseConstants::PSK_LEN>;

    HandshakeConfig(noise::HandshakePattern pattern, bool initiator, std::vector<uint8_t> prologue = {})
        : pattern_(pattern)
        , initiator_(initiator)
        , prologue_(std::move(prologue)) {}

    [[nodiscard]] static HandshakeConfig Initiator(
        noise::HandshakePattern pattern,
        std::vector<uint8_t> prologue = {}) {
        return HandshakeConfig(pattern, true, std::move(prologue));
    }

    [[nodiscard]] static HandshakeConfig Responder(
        noise::HandshakePattern pattern,
        std::vector<uint8_t> prologue = {}) {
        return HandshakeConfig(pattern, false, std::move(prologue));
    }

    HandshakeConfig(HandshakeConfig&&) noexcept = default;
    HandshakeConfig& operator=(HandshakeConfig&&) noexcept = default;
    HandshakeConfig(const HandshakeConfig&) = delete;
    HandshakeConfig& operator=(const HandshakeConfig&) = delete;

    HandshakeConfig WithPsk(PresharedKey psk, uint8_t modifier) && {
        psk_.emplace(std::move(psk));
        psk_modifier_ = modifier;
        return std::move(*this);
    }

    HandshakeConfig WithPskModifier(uint8_t modifier) && {
        psk_modifier_ = modifier;
        return std::move(*this);
    }

    /**
     * @return InvalidMessage when the psk modifier points past the last message
     */
    [[nodiscard]] Result<Unit, NoiseFailure> Validate() const {
        if (psk_modifier_.has_value()) {
            const size_t messages = noise::MessagePatterns(pattern_).size();
            if (*psk_modifier_ > messages) {
                return Result<Unit, NoiseFailure>::Err(NoiseFailure::InvalidMessage(
                    std::format("psk{} does not fit the {} messages of {}",
                        *psk_modifier_, messages, noise::ToString(pattern_))));
            }
        }
        return Result<Unit, NoiseFailure>::Ok(unit);
    }

    [[nodiscard]] noise::HandshakePattern Pattern() const noexcept { return pattern_; }
    [[nodiscard]] bool IsInitiator() const noexcept { return initiator_; }
    [[nodiscard]] std::span<const uint8_t> Prologue() const noexcept { return prologue_; }
    [[nodiscard]] std::optional<uint8_t> PskModifier() const noexcept { return psk_modifier_; }

    [[nodiscard]] std::optional<PresharedKey> TakePsk() {
        std::optional<PresharedKey> taken = std::move(psk_);
        psk_.reset();
        return taken;
    }

private:
    noise::HandshakePattern pattern_;
    bool initiator_;
    std::vector<uint8_t> prologue_;
    std::optional<PresharedKey> psk_;
    std::optional<uint8_t> psk_modifier_;
};

}  // namespace alcove::configuration
