#include <catch2/catch_test_macros.hpp>
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/noise/handshake_state.hpp"
#include "helpers/handshake_pair.hpp"
#include "helpers/recording_sink.hpp"
#include <array>
#include <memory>
#include <string_view>
#include <vector>
using namespace alcove;
using namespace alcove::noise;
using namespace alcove::test_helpers;

namespace {
    constexpr std::array kAllPatterns = {
        HandshakePattern::NN, HandshakePattern::KK, HandshakePattern::XX,
        HandshakePattern::NK, HandshakePattern::KN, HandshakePattern::XK,
        HandshakePattern::KX, HandshakePattern::NX, HandshakePattern::XN
    };

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    PskBytes FilledPsk(const uint8_t value) {
        PskBytes psk{};
        psk.fill(value);
        return psk;
    }

    void RequireMirrored(TransportPair& keys) {
        REQUIRE(keys.initiator.handshake_hash == keys.responder.handshake_hash);
        REQUIRE(*keys.initiator.send.GetKey() == *keys.responder.recv.GetKey());
        REQUIRE(*keys.initiator.recv.GetKey() == *keys.responder.send.GetKey());

        auto outbound = keys.initiator.send.EncryptWithAd({}, AsBytes("ping"));
        REQUIRE(outbound.IsOk());
        auto received = keys.responder.recv.DecryptWithAd({}, outbound.Unwrap());
        REQUIRE(received.IsOk());
        REQUIRE(received.Unwrap() == std::vector<uint8_t>{'p', 'i', 'n', 'g'});

        auto inbound = keys.responder.send.EncryptWithAd({}, AsBytes("pong"));
        REQUIRE(inbound.IsOk());
        auto answered = keys.initiator.recv.DecryptWithAd({}, inbound.Unwrap());
        REQUIRE(answered.IsOk());
        REQUIRE(answered.Unwrap() == std::vector<uint8_t>{'p', 'o', 'n', 'g'});
    }
}

TEST_CASE("Handshake - Every pattern completes", "[noise][handshake][integration]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();

    for (const auto pattern : kAllPatterns) {
        INFO("pattern " << ToString(pattern));
        auto peers = CreatePeers(pattern, sink);
        REQUIRE(peers.initiator.MessagesRemaining() == MessagePatterns(pattern).size());
        auto keys = RunHandshake(peers);
        REQUIRE(keys.IsOk());
        REQUIRE(peers.initiator.IsComplete());
        REQUIRE(peers.responder.IsComplete());
        REQUIRE(peers.initiator.GetHandshakeHash().Unwrap() == peers.responder.GetHandshakeHash().Unwrap());
        RequireMirrored(keys.Unwrap());
    }
}

TEST_CASE("Handshake - Learned static keys", "[noise][handshake][integration]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();

    SECTION("XX exchanges both static keys") {
        auto peers = CreatePeers(HandshakePattern::XX, sink);
        REQUIRE_FALSE(peers.initiator.GetRemoteStatic().has_value());
        REQUIRE(RunHandshake(peers).IsOk());
        REQUIRE(peers.initiator.GetRemoteStatic().has_value());
        REQUIRE(peers.responder.GetRemoteStatic().has_value());
        REQUIRE(peers.initiator.GetRemoteEphemeral().has_value());
    }
    SECTION("NX reveals only the responder") {
        auto peers = CreatePeers(HandshakePattern::NX, sink);
        REQUIRE(RunHandshake(peers).IsOk());
        REQUIRE(peers.initiator.GetRemoteStatic().has_value());
        REQUIRE_FALSE(peers.responder.GetRemoteStatic().has_value());
    }
}

TEST_CASE("Handshake - Pre-shared keys", "[noise][handshake][psk]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();

    SECTION("NNpsk0 with matching keys") {
        auto peers = CreatePeers(HandshakePattern::NN, sink, PskSetup{0, FilledPsk(0x11), FilledPsk(0x11)});
        auto keys = RunHandshake(peers);
        REQUIRE(keys.IsOk());
        RequireMirrored(keys.Unwrap());
    }
    SECTION("XXpsk3 with matching keys") {
        auto peers = CreatePeers(HandshakePattern::XX, sink, PskSetup{3, FilledPsk(0x22), FilledPsk(0x22)});
        auto keys = RunHandshake(peers);
        REQUIRE(keys.IsOk());
        RequireMirrored(keys.Unwrap());
    }
    SECTION("psk changes the transcript") {
        auto plain = CreatePeers(HandshakePattern::NN, sink);
        auto with_psk = CreatePeers(HandshakePattern::NN, sink, PskSetup{2, FilledPsk(0x33), FilledPsk(0x33)});
        auto plain_keys = RunHandshake(plain).Unwrap();
        auto psk_keys = RunHandshake(with_psk).Unwrap();
        REQUIRE(plain_keys.initiator.handshake_hash != psk_keys.initiator.handshake_hash);
    }
    SECTION("Mismatched keys fail on the first encrypted payload") {
        auto peers = CreatePeers(HandshakePattern::NN, sink, PskSetup{0, FilledPsk(0x44), FilledPsk(0x45)});
        auto keys = RunHandshake(peers);
        REQUIRE(keys.IsErr());
        REQUIRE(keys.UnwrapErr().type == NoiseFailureType::CryptoError);
    }
    SECTION("Modifier without a key stops at the psk token") {
        auto peers = CreatePeers(HandshakePattern::NN, sink, PskSetup{0, std::nullopt, FilledPsk(0x55)});
        std::vector<uint8_t> buffer(NoiseConstants::MAX_MESSAGE_LEN);
        auto written = peers.initiator.WriteMessage({}, buffer);
        REQUIRE(written.IsErr());
        REQUIRE(written.UnwrapErr().type == NoiseFailureType::PskMissing);
    }
    SECTION("Modifier past the last message is rejected at initialization") {
        auto config = configuration::HandshakeConfig::Initiator(HandshakePattern::NN).WithPskModifier(3);
        auto state = HandshakeState::Initialize(std::move(config));
        REQUIRE(state.IsErr());
        REQUIRE(state.UnwrapErr().type == NoiseFailureType::InvalidMessage);
    }
}

TEST_CASE("Handshake - Misuse", "[noise][handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();
    std::vector<uint8_t> buffer(NoiseConstants::MAX_MESSAGE_LEN);
    std::vector<uint8_t> payload(NoiseConstants::MAX_MESSAGE_LEN);

    SECTION("Responder cannot write first") {
        auto peers = CreatePeers(HandshakePattern::NN, sink);
        REQUIRE_FALSE(peers.responder.IsMyTurn());
        auto written = peers.responder.WriteMessage({}, buffer);
        REQUIRE(written.IsErr());
        REQUIRE(written.UnwrapErr().type == NoiseFailureType::InvalidMessage);
    }
    SECTION("Initiator cannot read before writing") {
        auto peers = CreatePeers(HandshakePattern::NN, sink);
        auto read = peers.initiator.ReadMessage(std::vector<uint8_t>(32, 0x09), payload);
        REQUIRE(read.IsErr());
        REQUIRE(read.UnwrapErr().type == NoiseFailureType::InvalidMessage);
    }
    SECTION("Undersized buffer") {
        auto peers = CreatePeers(HandshakePattern::NN, sink);
        std::array<uint8_t, 16> small{};
        auto written = peers.initiator.WriteMessage({}, small);
        REQUIRE(written.IsErr());
        REQUIRE(written.UnwrapErr().type == NoiseFailureType::BufferTooSmall);
    }
    SECTION("Truncated message") {
        auto peers = CreatePeers(HandshakePattern::NN, sink);
        auto written = peers.initiator.WriteMessage({}, buffer).Unwrap();
        REQUIRE(written.length == NoiseConstants::DH_LEN);
        auto read = peers.responder.ReadMessage(std::span(buffer).first(10), payload);
        REQUIRE(read.IsErr());
        REQUIRE(read.UnwrapErr().type == NoiseFailureType::InvalidMessage);
    }
    SECTION("Missing remote static for a K pattern") {
        auto initiator = HandshakeState::Initialize(
            configuration::HandshakeConfig::Initiator(HandshakePattern::NK), std::nullopt, std::nullopt,
            std::nullopt, std::nullopt, sink);
        REQUIRE(initiator.IsErr());
        REQUIRE(initiator.UnwrapErr().type == NoiseFailureType::RemoteStaticMissing);
    }
    SECTION("Missing local static for XX fails when it is sent") {
        auto responder = HandshakeState::Initialize(
            configuration::HandshakeConfig::Responder(HandshakePattern::XX), std::nullopt, std::nullopt,
            std::nullopt, std::nullopt, sink).Unwrap();
        auto peers = CreatePeers(HandshakePattern::XX, sink);
        auto first = peers.initiator.WriteMessage({}, buffer).Unwrap();
        REQUIRE(responder.ReadMessage(std::span(buffer).first(first.length), payload).IsOk());
        auto second = responder.WriteMessage({}, buffer);
        REQUIRE(second.IsErr());
        REQUIRE(second.UnwrapErr().type == NoiseFailureType::LocalStaticMissing);
    }
    SECTION("Writing after completion") {
        auto peers = CreatePeers(HandshakePattern::NN, sink);
        REQUIRE(RunHandshake(peers).IsOk());
        auto written = peers.initiator.WriteMessage({}, buffer);
        REQUIRE(written.IsErr());
        REQUIRE(written.UnwrapErr().type == NoiseFailureType::HandshakeComplete);
    }
    SECTION("Oversized payload") {
        auto peers = CreatePeers(HandshakePattern::NN, sink);
        const std::vector<uint8_t> huge(NoiseConstants::MAX_MESSAGE_LEN, 0x01);
        auto written = peers.initiator.WriteMessage(huge, buffer);
        REQUIRE(written.IsErr());
        REQUIRE(written.UnwrapErr().type == NoiseFailureType::MessageTooLong);
    }
}

TEST_CASE("Handshake - Transport after completion", "[noise][handshake][transport]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();
    auto peers = CreatePeers(HandshakePattern::XK, sink);
    auto keys = RunHandshake(peers).Unwrap();

    SECTION("Many messages in one direction") {
        for (int i = 0; i < 50; ++i) {
            auto packet = keys.initiator.send.EncryptWithAd(AsBytes("ad"), AsBytes("record")).Unwrap();
            REQUIRE(keys.responder.recv.DecryptWithAd(AsBytes("ad"), packet).IsOk());
        }
        REQUIRE(keys.initiator.send.GetNonce()->CounterNum() == 50);
        REQUIRE(keys.responder.recv.GetNonce()->CounterNum() == 50);
    }
    SECTION("Rekey on both ends keeps the channel open") {
        REQUIRE(keys.initiator.send.Rekey().IsOk());
        REQUIRE(keys.responder.recv.Rekey().IsOk());
        auto packet = keys.initiator.send.EncryptWithAd({}, AsBytes("rekeyed")).Unwrap();
        REQUIRE(keys.responder.recv.DecryptWithAd({}, packet).IsOk());
    }
    SECTION("Rekey on one end closes it") {
        REQUIRE(keys.initiator.send.Rekey().IsOk());
        auto packet = keys.initiator.send.EncryptWithAd({}, AsBytes("rekeyed")).Unwrap();
        REQUIRE(keys.responder.recv.DecryptWithAd({}, packet).IsErr());
    }
}
