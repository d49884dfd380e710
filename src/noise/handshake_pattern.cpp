#include "alcove/noise/handshake_pattern.hpp"
#include "alcove/core/constants.hpp"
#include <algorithm>
#include <format>
#include <span>

namespace alcove::noise {
    using crypto::Blake2s;
    using crypto::Blake2sDigest;

    namespace {
        std::vector<MessagePattern> BaseScripts(const HandshakePattern pattern) {
            switch (pattern) {
                case HandshakePattern::NN:
                    return {{Token::E}, {Token::E, Token::EE}};
                case HandshakePattern::KK:
                    return {{Token::E, Token::ES, Token::SS}, {Token::E, Token::EE, Token::SE}};
                case HandshakePattern::XX:
                    return {{Token::E}, {Token::E, Token::EE, Token::S, Token::ES}, {Token::S, Token::SE}};
                case HandshakePattern::NK:
                    return {{Token::E, Token::ES}, {Token::E, Token::EE}};
                case HandshakePattern::KN:
                    return {{Token::E}, {Token::E, Token::EE, Token::SE}};
                case HandshakePattern::XK:
                    return {{Token::E, Token::ES}, {Token::E, Token::EE}, {Token::S, Token::SE}};
                case HandshakePattern::KX:
                    return {{Token::E}, {Token::E, Token::EE, Token::SE, Token::S, Token::ES}};
                case HandshakePattern::NX:
                    return {{Token::E}, {Token::E, Token::EE, Token::S, Token::ES}};
                case HandshakePattern::XN:
                    return {{Token::E}, {Token::E, Token::EE}, {Token::S, Token::SE}};
            }
            return {};
        }
    }

    std::string_view ToString(const HandshakePattern pattern) {
        switch (pattern) {
            case HandshakePattern::NN: return "NN";
            case HandshakePattern::KK: return "KK";
            case HandshakePattern::XX: return "XX";
            case HandshakePattern::NK: return "NK";
            case HandshakePattern::KN: return "KN";
            case HandshakePattern::XK: return "XK";
            case HandshakePattern::KX: return "KX";
            case HandshakePattern::NX: return "NX";
            case HandshakePattern::XN: return "XN";
        }
        return "??";
    }

    std::string_view ToString(const Token token) {
        switch (token) {
            case Token::E: return "e";
            case Token::S: return "s";
            case Token::EE: return "ee";
            case Token::ES: return "es";
            case Token::SE: return "se";
            case Token::SS: return "ss";
            case Token::PSK: return "psk";
        }
        return "?";
    }

    std::string ProtocolName(const HandshakePattern pattern, const std::optional<uint8_t> psk_modifier) {
        std::string name(NoiseConstants::PROTOCOL_PREFIX);
        name += ToString(pattern);
        if (psk_modifier.has_value()) {
            name += std::format("psk{}", *psk_modifier);
        }
        name += NoiseConstants::PROTOCOL_SUITE;
        return name;
    }

    Result<Blake2sDigest, NoiseFailure> ToBytes(
        const HandshakePattern pattern,
        const std::optional<uint8_t> psk_modifier) {
        const std::string name = ProtocolName(pattern, psk_modifier);
        const std::span<const uint8_t> name_bytes(
            reinterpret_cast<const uint8_t*>(name.data()), name.size());
        if (name_bytes.size() > NoiseConstants::HASH_LEN) {
            auto digest = Blake2s::Hash(name_bytes);
            if (digest.IsErr()) {
                return Result<Blake2sDigest, NoiseFailure>::Err(NoiseFailure::FromCrypto(digest.UnwrapErr()));
            }
            return Result<Blake2sDigest, NoiseFailure>::Ok(digest.Unwrap());
        }
        Blake2sDigest padded{};
        std::copy(name_bytes.begin(), name_bytes.end(), padded.begin());
        return Result<Blake2sDigest, NoiseFailure>::Ok(padded);
    }

    std::vector<MessagePattern> MessagePatterns(
        const HandshakePattern pattern,
        const std::optional<uint8_t> psk_modifier) {
        auto scripts = BaseScripts(pattern);
        if (!psk_modifier.has_value()) {
            return scripts;
        }
        if (*psk_modifier == 0) {
            scripts.front().insert(scripts.front().begin(), Token::PSK);
        } else if (*psk_modifier <= scripts.size()) {
            scripts[*psk_modifier - 1].push_back(Token::PSK);
        }
        return scripts;
    }

    std::pair<bool, bool> RequiresPremessage(const HandshakePattern pattern) {
        switch (pattern) {
            case HandshakePattern::NK:
            case HandshakePattern::XK:
                return {false, true};
            case HandshakePattern::KN:
            case HandshakePattern::KX:
                return {true, false};
            case HandshakePattern::KK:
                return {true, true};
            default:
                return {false, false};
        }
    }

    bool RequiresLocalStatic(const HandshakePattern pattern, const bool initiator) {
        const std::string_view letters = ToString(pattern);
        return (initiator ? letters[0] : letters[1]) != 'N';
    }

    bool RequiresRemoteStatic(const HandshakePattern pattern, const bool initiator) {
        const auto [initiator_known, responder_known] = RequiresPremessage(pattern);
        return initiator ? responder_known : initiator_known;
    }

}  // namespace alcove::noise
