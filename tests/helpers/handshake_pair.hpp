#pragma once

#include <catch2/catch_test_macros.hpp>
#include "alcove/configuration/handshake_config.hpp"
#include "alcove/interfaces/i_audit_sink.hpp"
#include "alcove/noise/handshake_state.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace alcove::test_helpers {
    using configuration::HandshakeConfig;
    using noise::HandshakePattern;
    using noise::HandshakeState;
    using noise::KeyPair;
    using noise::TransportKeys;

    using PskBytes = std::array<uint8_t, NoiseConstants::PSK_LEN>;

    struct PskSetup {
        std::optional<uint8_t> modifier;
        std::optional<PskBytes> initiator_key;
        std::optional<PskBytes> responder_key;
    };

    struct HandshakePeers {
        HandshakeState initiator;
        HandshakeState responder;
    };

    struct TransportPair {
        TransportKeys initiator;
        TransportKeys responder;
    };

    inline HandshakeConfig MakeConfig(
        HandshakePattern pattern,
        bool initiator,
        const std::optional<uint8_t>& modifier,
        const std::optional<PskBytes>& psk,
        const std::shared_ptr<interfaces::IAuditSink>& sink) {
        std::vector<uint8_t> prologue = {'a', 'l', 'c', 'o', 'v', 'e'};
        HandshakeConfig config(pattern, initiator, std::move(prologue));
        if (modifier.has_value() && psk.has_value()) {
            PskBytes key = *psk;
            auto secret = HandshakeConfig::PresharedKey::New(key, std::string(NoiseConstants::PRESHARED_KEY_TAG), sink);
            REQUIRE(secret.IsOk());
            return std::move(config).WithPsk(std::move(secret).Unwrap(), *modifier);
        }
        if (modifier.has_value()) {
            return std::move(config).WithPskModifier(*modifier);
        }
        return config;
    }

    // Generates the static keys the pattern needs and hands each side the
    // peer's public key when the pattern pre-shares it.
    inline HandshakePeers CreatePeers(
        HandshakePattern pattern,
        const std::shared_ptr<interfaces::IAuditSink>& sink,
        const PskSetup& psk = {}) {
        std::optional<KeyPair> initiator_static;
        std::optional<KeyPair> responder_static;
        if (noise::RequiresLocalStatic(pattern, true)) {
            auto generated = KeyPair::Generate(sink);
            REQUIRE(generated.IsOk());
            initiator_static.emplace(std::move(generated).Unwrap());
        }
        if (noise::RequiresLocalStatic(pattern, false)) {
            auto generated = KeyPair::Generate(sink);
            REQUIRE(generated.IsOk());
            responder_static.emplace(std::move(generated).Unwrap());
        }

        std::optional<noise::PublicKey> initiator_rs;
        std::optional<noise::PublicKey> responder_rs;
        if (noise::RequiresRemoteStatic(pattern, true)) {
            initiator_rs = responder_static->GetPublicKey();
        }
        if (noise::RequiresRemoteStatic(pattern, false)) {
            responder_rs = initiator_static->GetPublicKey();
        }

        auto initiator = HandshakeState::Initialize(
            MakeConfig(pattern, true, psk.modifier, psk.initiator_key, sink),
            std::move(initiator_static), std::nullopt, initiator_rs, std::nullopt, sink);
        REQUIRE(initiator.IsOk());
        auto responder = HandshakeState::Initialize(
            MakeConfig(pattern, false, psk.modifier, psk.responder_key, sink),
            std::move(responder_static), std::nullopt, responder_rs, std::nullopt, sink);
        REQUIRE(responder.IsOk());
        return HandshakePeers{std::move(initiator).Unwrap(), std::move(responder).Unwrap()};
    }

    /**
     * @brief Alternates WriteMessage / ReadMessage until both sides finish
     *
     * Every message carries the payload "message <n>", checked on arrival.
     */
    inline Result<TransportPair, NoiseFailure> RunHandshake(HandshakePeers& peers) {
        std::optional<TransportKeys> initiator_keys;
        std::optional<TransportKeys> responder_keys;
        std::vector<uint8_t> message(NoiseConstants::MAX_MESSAGE_LEN);
        std::vector<uint8_t> received(NoiseConstants::MAX_MESSAGE_LEN);
        size_t index = 0;

        while (!peers.initiator.IsComplete() || !peers.responder.IsComplete()) {
            const bool initiator_writes = peers.initiator.IsMyTurn();
            HandshakeState& writer = initiator_writes ? peers.initiator : peers.responder;
            HandshakeState& reader = initiator_writes ? peers.responder : peers.initiator;
            const std::string payload = "message " + std::to_string(index++);

            auto written = writer.WriteMessage(
                std::span(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()), message);
            if (written.IsErr()) {
                return Result<TransportPair, NoiseFailure>::Err(std::move(written).UnwrapErr());
            }
            auto read = reader.ReadMessage(std::span(message).first(written.Unwrap().length), received);
            if (read.IsErr()) {
                return Result<TransportPair, NoiseFailure>::Err(std::move(read).UnwrapErr());
            }
            REQUIRE(std::string(received.begin(), received.begin() + static_cast<std::ptrdiff_t>(read.Unwrap().length)) == payload);

            auto& writer_keys = initiator_writes ? initiator_keys : responder_keys;
            auto& reader_keys = initiator_writes ? responder_keys : initiator_keys;
            if (written.Unwrap().transport.has_value()) {
                writer_keys.emplace(std::move(*written.Unwrap().transport));
            }
            if (read.Unwrap().transport.has_value()) {
                reader_keys.emplace(std::move(*read.Unwrap().transport));
            }
        }

        REQUIRE(initiator_keys.has_value());
        REQUIRE(responder_keys.has_value());
        return Result<TransportPair, NoiseFailure>::Ok(
            TransportPair{std::move(*initiator_keys), std::move(*responder_keys)});
    }
}
