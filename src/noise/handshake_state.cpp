#include "alcove/noise/handshake_state.hpp"
#include "alcove/debug/key_logger.hpp"
#include "alcove/vault/secure_ref.hpp"
#include <sodium.h>
#include <algorithm>
#include <format>
#include <vector>

namespace alcove::noise {
    using configuration::HandshakeConfig;
    using vault::SecureRef;

    namespace {
        constexpr size_t kDhLen = NoiseConstants::DH_LEN;
        constexpr size_t kTagLen = Constants::TAG_SIZE;

        NoiseFailure MissingKey(const NoiseFailureType type) {
            switch (type) {
                case NoiseFailureType::LocalStaticMissing:
                    return NoiseFailure::LocalStaticMissing("Local static key pair is missing");
                case NoiseFailureType::RemoteStaticMissing:
                    return NoiseFailure::RemoteStaticMissing("Remote static public key is missing");
                case NoiseFailureType::LocalEphemeralMissing:
                    return NoiseFailure::LocalEphemeralMissing("Local ephemeral key pair is missing");
                case NoiseFailureType::RemoteEphemeralMissing:
                    return NoiseFailure::RemoteEphemeralMissing("Remote ephemeral public key is missing");
                default:
                    return NoiseFailure::BothKeysMissing("Both keys of the DH are missing");
            }
        }

        Result<Unit, NoiseFailure> EnsureRoom(const size_t required, const size_t available) {
            if (required > available) {
                return Result<Unit, NoiseFailure>::Err(NoiseFailure::BufferTooSmall(
                    std::format("Message needs {} bytes, buffer holds {}", required, available)));
            }
            return Result<Unit, NoiseFailure>::Ok(unit);
        }

        Result<Unit, NoiseFailure> EnsureReadable(const size_t required, const size_t available) {
            if (required > available) {
                return Result<Unit, NoiseFailure>::Err(NoiseFailure::InvalidMessage(
                    std::format("Message ends at {} bytes, token needs {}", available, required)));
            }
            return Result<Unit, NoiseFailure>::Ok(unit);
        }
    }

    HandshakeState::HandshakeState(
        SymmetricState symmetric_state,
        const HandshakePattern pattern,
        const bool initiator,
        std::optional<KeyPair> s,
        std::optional<KeyPair> e,
        std::optional<PublicKey> rs,
        std::optional<PublicKey> re,
        std::optional<HandshakeConfig::PresharedKey> psk,
        const bool psk_mode,
        std::shared_ptr<interfaces::IAuditSink> sink)
        : symmetric_state_(std::move(symmetric_state))
        , pattern_(pattern)
        , initiator_(initiator)
        , s_(std::move(s))
        , e_(std::move(e))
        , rs_(std::move(rs))
        , re_(std::move(re))
        , psk_(std::move(psk))
        , psk_mode_(psk_mode)
        , sink_(std::move(sink)) {
    }

    Result<HandshakeState, NoiseFailure> HandshakeState::Initialize(
        HandshakeConfig config,
        std::optional<KeyPair> s,
        std::optional<KeyPair> e,
        std::optional<PublicKey> rs,
        std::optional<PublicKey> re,
        std::shared_ptr<interfaces::IAuditSink> sink) {
        TRY(config.Validate());
        const HandshakePattern pattern = config.Pattern();
        const bool initiator = config.IsInitiator();
        const auto psk_modifier = config.PskModifier();

        auto symmetric = SymmetricState::InitializeSymmetric(
            pattern, psk_modifier, sink, debug::SideOf(initiator));
        if (symmetric.IsErr()) {
            return Result<HandshakeState, NoiseFailure>::Err(std::move(symmetric).UnwrapErr());
        }
        TRY(symmetric.Unwrap().MixHash(config.Prologue()));

        HandshakeState state(
            std::move(symmetric).Unwrap(), pattern, initiator,
            std::move(s), std::move(e), std::move(rs), std::move(re),
            config.TakePsk(), psk_modifier.has_value(), std::move(sink));
        const auto scripts = MessagePatterns(pattern, psk_modifier);
        state.message_patterns_.assign(scripts.begin(), scripts.end());
        TRY(state.MixPremessages());
        return Result<HandshakeState, NoiseFailure>::Ok(std::move(state));
    }

    Result<Unit, NoiseFailure> HandshakeState::MixPremessages() {
        // Initiator's key first when both sides pre-share (KK)
        const auto [initiator_known, responder_known] = RequiresPremessage(pattern_);
        if (initiator_known) {
            TRY(initiator_ ? MixLocalStatic() : MixRemoteStatic());
        }
        if (responder_known) {
            TRY(initiator_ ? MixRemoteStatic() : MixLocalStatic());
        }
        return Result<Unit, NoiseFailure>::Ok(unit);
    }

    Result<Unit, NoiseFailure> HandshakeState::MixLocalStatic() {
        if (!s_) {
            return Result<Unit, NoiseFailure>::Err(MissingKey(NoiseFailureType::LocalStaticMissing));
        }
        return symmetric_state_.MixHash(s_->GetPublicKey().AsBytes());
    }

    Result<Unit, NoiseFailure> HandshakeState::MixRemoteStatic() {
        if (!rs_) {
            return Result<Unit, NoiseFailure>::Err(MissingKey(NoiseFailureType::RemoteStaticMissing));
        }
        return symmetric_state_.MixHash(rs_->AsBytes());
    }

    Result<MessageOutcome, NoiseFailure> HandshakeState::WriteMessage(
        std::span<const uint8_t> payload,
        std::span<uint8_t> message_buffer) {
        if (IsComplete()) {
            return Result<MessageOutcome, NoiseFailure>::Err(
                NoiseFailure::HandshakeComplete("No handshake messages remain"));
        }
        if (!IsMyTurn()) {
            return Result<MessageOutcome, NoiseFailure>::Err(
                NoiseFailure::InvalidMessage("Expected to read the peer's message next"));
        }
        if (payload.size() > NoiseConstants::MAX_MESSAGE_LEN) {
            return Result<MessageOutcome, NoiseFailure>::Err(NoiseFailure::MessageTooLong(
                std::format("Payload of {} bytes exceeds {}", payload.size(), NoiseConstants::MAX_MESSAGE_LEN)));
        }

        const MessagePattern tokens = std::move(message_patterns_.front());
        message_patterns_.pop_front();

        size_t head = 0;
        for (const Token token : tokens) {
            debug::LogToken(debug::SideOf(initiator_), "write", ToString(token).data(), head);
            auto written = ProcessWrite(token, message_buffer, head);
            if (written.IsErr()) {
                return Result<MessageOutcome, NoiseFailure>::Err(std::move(written).UnwrapErr());
            }
            head += written.Unwrap();
        }

        auto ciphertext = symmetric_state_.EncryptAndHash(payload);
        if (ciphertext.IsErr()) {
            return Result<MessageOutcome, NoiseFailure>::Err(std::move(ciphertext).UnwrapErr());
        }
        const auto& sealed = ciphertext.Unwrap();
        if (head + sealed.size() > NoiseConstants::MAX_MESSAGE_LEN) {
            return Result<MessageOutcome, NoiseFailure>::Err(NoiseFailure::MessageTooLong(
                std::format("Message of {} bytes exceeds {}", head + sealed.size(), NoiseConstants::MAX_MESSAGE_LEN)));
        }
        TRY(EnsureRoom(head + sealed.size(), message_buffer.size()));
        std::copy(sealed.begin(), sealed.end(), message_buffer.begin() + static_cast<std::ptrdiff_t>(head));
        head += sealed.size();
        ++messages_processed_;

        auto transport = FinishIfComplete();
        if (transport.IsErr()) {
            return Result<MessageOutcome, NoiseFailure>::Err(std::move(transport).UnwrapErr());
        }
        return Result<MessageOutcome, NoiseFailure>::Ok(MessageOutcome{head, std::move(transport).Unwrap()});
    }

    Result<MessageOutcome, NoiseFailure> HandshakeState::ReadMessage(
        std::span<const uint8_t> message,
        std::span<uint8_t> payload_buffer) {
        if (IsComplete()) {
            return Result<MessageOutcome, NoiseFailure>::Err(
                NoiseFailure::HandshakeComplete("No handshake messages remain"));
        }
        if (IsMyTurn()) {
            return Result<MessageOutcome, NoiseFailure>::Err(
                NoiseFailure::InvalidMessage("Expected to write the next message"));
        }
        if (message.size() > NoiseConstants::MAX_MESSAGE_LEN) {
            return Result<MessageOutcome, NoiseFailure>::Err(NoiseFailure::MessageTooLong(
                std::format("Message of {} bytes exceeds {}", message.size(), NoiseConstants::MAX_MESSAGE_LEN)));
        }

        const MessagePattern tokens = std::move(message_patterns_.front());
        message_patterns_.pop_front();

        size_t head = 0;
        for (const Token token : tokens) {
            debug::LogToken(debug::SideOf(initiator_), "read", ToString(token).data(), head);
            auto read = ProcessRead(token, message, head);
            if (read.IsErr()) {
                return Result<MessageOutcome, NoiseFailure>::Err(std::move(read).UnwrapErr());
            }
            head += read.Unwrap();
        }

        auto payload = symmetric_state_.DecryptAndHash(message.subspan(head));
        if (payload.IsErr()) {
            return Result<MessageOutcome, NoiseFailure>::Err(std::move(payload).UnwrapErr());
        }
        SecureRef<std::vector<uint8_t>> plaintext(std::move(payload).Unwrap());
        const size_t payload_len = plaintext.Get().size();
        TRY(EnsureRoom(payload_len, payload_buffer.size()));
        std::copy(plaintext.Get().begin(), plaintext.Get().end(), payload_buffer.begin());
        ++messages_processed_;

        auto transport = FinishIfComplete();
        if (transport.IsErr()) {
            return Result<MessageOutcome, NoiseFailure>::Err(std::move(transport).UnwrapErr());
        }
        return Result<MessageOutcome, NoiseFailure>::Ok(MessageOutcome{payload_len, std::move(transport).Unwrap()});
    }

    Result<size_t, NoiseFailure> HandshakeState::ProcessWrite(
        const Token token,
        std::span<uint8_t> message_buffer,
        const size_t head) {
        switch (token) {
            case Token::E: {
                if (e_) {
                    return Result<size_t, NoiseFailure>::Err(
                        NoiseFailure::LocalEphemeralExists("Local ephemeral key pair already exists"));
                }
                TRY(EnsureRoom(head + kDhLen, message_buffer.size()));
                auto generated = KeyPair::Generate(sink_);
                if (generated.IsErr()) {
                    return Result<size_t, NoiseFailure>::Err(std::move(generated).UnwrapErr());
                }
                e_.emplace(std::move(generated).Unwrap());
                const auto& public_bytes = e_->GetPublicKey().AsBytes();
                std::copy(public_bytes.begin(), public_bytes.end(),
                          message_buffer.begin() + static_cast<std::ptrdiff_t>(head));
                TRY(symmetric_state_.MixHash(public_bytes));
                if (psk_mode_) {
                    TRY(symmetric_state_.MixKey(public_bytes));
                }
                return Result<size_t, NoiseFailure>::Ok(kDhLen);
            }
            case Token::S: {
                if (!s_) {
                    return Result<size_t, NoiseFailure>::Err(MissingKey(NoiseFailureType::LocalStaticMissing));
                }
                const size_t len = kDhLen + (symmetric_state_.HasKey() ? kTagLen : 0);
                TRY(EnsureRoom(head + len, message_buffer.size()));
                auto ciphertext = symmetric_state_.EncryptAndHash(s_->GetPublicKey().AsBytes());
                if (ciphertext.IsErr()) {
                    return Result<size_t, NoiseFailure>::Err(std::move(ciphertext).UnwrapErr());
                }
                const auto& sealed = ciphertext.Unwrap();
                std::copy(sealed.begin(), sealed.end(), message_buffer.begin() + static_cast<std::ptrdiff_t>(head));
                return Result<size_t, NoiseFailure>::Ok(sealed.size());
            }
            case Token::PSK:
                TRY(MixPsk());
                return Result<size_t, NoiseFailure>::Ok(0);
            default:
                TRY(MixToken(token));
                return Result<size_t, NoiseFailure>::Ok(0);
        }
    }

    Result<size_t, NoiseFailure> HandshakeState::ProcessRead(
        const Token token,
        std::span<const uint8_t> message,
        const size_t head) {
        switch (token) {
            case Token::E: {
                if (re_) {
                    return Result<size_t, NoiseFailure>::Err(
                        NoiseFailure::RemoteEphemeralExists("Remote ephemeral public key already exists"));
                }
                TRY(EnsureReadable(head + kDhLen, message.size()));
                const auto public_bytes = message.subspan(head, kDhLen);
                auto remote = PublicKey::FromBytes(public_bytes);
                if (remote.IsErr()) {
                    return Result<size_t, NoiseFailure>::Err(std::move(remote).UnwrapErr());
                }
                re_.emplace(remote.Unwrap());
                TRY(symmetric_state_.MixHash(public_bytes));
                if (psk_mode_) {
                    TRY(symmetric_state_.MixKey(public_bytes));
                }
                return Result<size_t, NoiseFailure>::Ok(kDhLen);
            }
            case Token::S: {
                if (rs_) {
                    return Result<size_t, NoiseFailure>::Err(
                        NoiseFailure::RemoteStaticExists("Remote static public key already exists"));
                }
                const size_t len = kDhLen + (symmetric_state_.HasKey() ? kTagLen : 0);
                TRY(EnsureReadable(head + len, message.size()));
                auto opened = symmetric_state_.DecryptAndHash(message.subspan(head, len));
                if (opened.IsErr()) {
                    return Result<size_t, NoiseFailure>::Err(std::move(opened).UnwrapErr());
                }
                auto remote = PublicKey::FromBytes(opened.Unwrap());
                if (remote.IsErr()) {
                    return Result<size_t, NoiseFailure>::Err(std::move(remote).UnwrapErr());
                }
                rs_.emplace(remote.Unwrap());
                return Result<size_t, NoiseFailure>::Ok(len);
            }
            case Token::PSK:
                TRY(MixPsk());
                return Result<size_t, NoiseFailure>::Ok(0);
            default:
                TRY(MixToken(token));
                return Result<size_t, NoiseFailure>::Ok(0);
        }
    }

    Result<Unit, NoiseFailure> HandshakeState::MixToken(const Token token) {
        using Type = NoiseFailureType;
        switch (token) {
            case Token::EE:
                return MixDh(e_, re_, Type::LocalEphemeralMissing, Type::RemoteEphemeralMissing);
            case Token::ES:
                return initiator_
                    ? MixDh(e_, rs_, Type::LocalEphemeralMissing, Type::RemoteStaticMissing)
                    : MixDh(s_, re_, Type::LocalStaticMissing, Type::RemoteEphemeralMissing);
            case Token::SE:
                return initiator_
                    ? MixDh(s_, re_, Type::LocalStaticMissing, Type::RemoteEphemeralMissing)
                    : MixDh(e_, rs_, Type::LocalEphemeralMissing, Type::RemoteStaticMissing);
            case Token::SS:
                return MixDh(s_, rs_, Type::LocalStaticMissing, Type::RemoteStaticMissing);
            default:
                return Result<Unit, NoiseFailure>::Err(NoiseFailure::InvalidMessage(
                    std::format("Token '{}' is not a DH token", ToString(token))));
        }
    }

    Result<Unit, NoiseFailure> HandshakeState::MixDh(
        const std::optional<KeyPair>& local,
        const std::optional<PublicKey>& remote,
        const NoiseFailureType local_missing,
        const NoiseFailureType remote_missing) {
        if (!local && !remote) {
            return Result<Unit, NoiseFailure>::Err(MissingKey(NoiseFailureType::BothKeysMissing));
        }
        if (!local) {
            return Result<Unit, NoiseFailure>::Err(MissingKey(local_missing));
        }
        if (!remote) {
            return Result<Unit, NoiseFailure>::Err(MissingKey(remote_missing));
        }
        SecureRef<PublicKey::Bytes> shared(PublicKey::Bytes{});
        TRY(local->Dh(*remote, shared.GetMut()));
        return symmetric_state_.MixKey(shared.Get());
    }

    Result<Unit, NoiseFailure> HandshakeState::MixPsk() {
        if (!psk_) {
            return Result<Unit, NoiseFailure>::Err(
                NoiseFailure::PskMissing("PSK token reached without a pre-shared key"));
        }
        auto mixed = psk_->With([this](const HandshakeConfig::PresharedKey::Array& psk) {
            return symmetric_state_.MixKeyAndHash(psk);
        });
        if (mixed.IsErr()) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromSecret(mixed.UnwrapErr()));
        }
        return std::move(mixed).Unwrap();
    }

    Result<std::optional<TransportKeys>, NoiseFailure> HandshakeState::FinishIfComplete() {
        if (!IsComplete()) {
            return Result<std::optional<TransportKeys>, NoiseFailure>::Ok(std::nullopt);
        }
        auto split = symmetric_state_.Split();
        if (split.IsErr()) {
            return Result<std::optional<TransportKeys>, NoiseFailure>::Err(std::move(split).UnwrapErr());
        }
        auto& keys = split.Unwrap();
        if (initiator_) {
            return Result<std::optional<TransportKeys>, NoiseFailure>::Ok(TransportKeys{
                std::move(keys.initiator_to_responder), std::move(keys.responder_to_initiator), keys.handshake_hash});
        }
        return Result<std::optional<TransportKeys>, NoiseFailure>::Ok(TransportKeys{
            std::move(keys.responder_to_initiator), std::move(keys.initiator_to_responder), keys.handshake_hash});
    }

    Result<crypto::Blake2sDigest, NoiseFailure> HandshakeState::GetHandshakeHash() const {
        return symmetric_state_.GetHandshakeHash();
    }

}  // namespace alcove::noise
