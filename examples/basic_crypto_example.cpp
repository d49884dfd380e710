/**
 * @file basic_crypto_example.cpp
 * @brief Encrypts a record with a typed key, then runs an XX handshake
 */

#include "alcove/audit/audit_log.hpp"
#include "alcove/crypto/encoding.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/noise/handshake_state.hpp"
#include "alcove/utilities/thread_task_executor.hpp"
#include "alcove/vault/data.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace alcove;
using namespace alcove::vault;

namespace {
    int Fail(const std::string& step, const std::string& message) {
        std::cerr << "Failed to " << step << ": " << message << std::endl;
        return 1;
    }

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

int main() {
    std::cout << "=== alcove - Basic Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Fail("initialize", init.UnwrapErr().message);
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    auto audit_log = std::make_shared<audit::AuditLog>(
        configuration::AuditConfig(64, "example-log", "accesses.txt"));
    utilities::ThreadTaskExecutor executor;
    audit_log->StartFileFlush(executor);

    std::cout << "2. Encrypting a record under a random key..." << std::endl;
    auto start = nonce::MonotonicNonce::New(nonce::MakeContext("DEMO"));
    if (start.IsErr()) {
        return Fail("create nonce", start.UnwrapErr().message);
    }
    auto key = Key<nonce::Monotonic>::Random("example key", start.Unwrap(), audit_log);
    if (key.IsErr()) {
        return Fail("generate key", key.UnwrapErr().message);
    }

    const std::string record = "account=4242;balance=17";
    auto plain = Data<state::Plain>::New({record.begin(), record.end()}, "record", audit_log);
    if (plain.IsErr()) {
        return Fail("wrap record", plain.UnwrapErr().message);
    }
    auto encrypted = std::move(plain).Unwrap().Encrypt(key.Unwrap());
    if (encrypted.IsErr()) {
        return Fail("encrypt", encrypted.UnwrapErr().message);
    }
    auto packet = encrypted.Unwrap().AsPacket();
    if (packet.IsErr()) {
        return Fail("export packet", packet.UnwrapErr().message);
    }
    std::cout << "   ✓ Packet: " << crypto::ToHex(packet.Unwrap()) << std::endl;

    auto received = Data<state::Encrypted>::FromPacket(packet.Unwrap(), "record", audit_log);
    if (received.IsErr()) {
        return Fail("import packet", received.UnwrapErr().message);
    }
    auto opened = std::move(received).Unwrap().Decrypt(key.Unwrap());
    if (opened.IsErr()) {
        return Fail("decrypt", opened.UnwrapErr().message);
    }
    auto bytes = opened.Unwrap().AsBytes().Unwrap();
    std::cout << "   ✓ Decrypted: " << std::string(bytes.begin(), bytes.end()) << std::endl;
    std::cout << std::endl;

    std::cout << "3. Running a Noise XX handshake..." << std::endl;
    auto initiator_static = noise::KeyPair::Generate(audit_log);
    auto responder_static = noise::KeyPair::Generate(audit_log);
    if (initiator_static.IsErr() || responder_static.IsErr()) {
        return Fail("generate static keys", "X25519 key generation failed");
    }
    auto initiator = noise::HandshakeState::Initialize(
        configuration::HandshakeConfig::Initiator(noise::HandshakePattern::XX),
        std::move(initiator_static).Unwrap(), std::nullopt, std::nullopt, std::nullopt, audit_log);
    auto responder = noise::HandshakeState::Initialize(
        configuration::HandshakeConfig::Responder(noise::HandshakePattern::XX),
        std::move(responder_static).Unwrap(), std::nullopt, std::nullopt, std::nullopt, audit_log);
    if (initiator.IsErr()) {
        return Fail("initialize initiator", initiator.UnwrapErr().message);
    }
    if (responder.IsErr()) {
        return Fail("initialize responder", responder.UnwrapErr().message);
    }

    std::optional<noise::TransportKeys> initiator_keys;
    std::optional<noise::TransportKeys> responder_keys;
    std::vector<uint8_t> message(NoiseConstants::MAX_MESSAGE_LEN);
    std::vector<uint8_t> payload(NoiseConstants::MAX_MESSAGE_LEN);
    while (!initiator.Unwrap().IsComplete() || !responder.Unwrap().IsComplete()) {
        const bool initiator_writes = initiator.Unwrap().IsMyTurn();
        auto& writer = initiator_writes ? initiator.Unwrap() : responder.Unwrap();
        auto& reader = initiator_writes ? responder.Unwrap() : initiator.Unwrap();

        auto written = writer.WriteMessage({}, message);
        if (written.IsErr()) {
            return Fail("write handshake message", written.UnwrapErr().message);
        }
        auto read = reader.ReadMessage(std::span(message).first(written.Unwrap().length), payload);
        if (read.IsErr()) {
            return Fail("read handshake message", read.UnwrapErr().message);
        }
        std::cout << "   → " << (initiator_writes ? "initiator" : "responder")
                  << " sent " << written.Unwrap().length << " bytes" << std::endl;

        auto& writer_keys = initiator_writes ? initiator_keys : responder_keys;
        auto& reader_keys = initiator_writes ? responder_keys : initiator_keys;
        if (written.Unwrap().transport.has_value()) {
            writer_keys.emplace(std::move(*written.Unwrap().transport));
        }
        if (read.Unwrap().transport.has_value()) {
            reader_keys.emplace(std::move(*read.Unwrap().transport));
        }
    }
    std::cout << "   ✓ Handshake hash: " << crypto::ToHex(initiator_keys->handshake_hash) << std::endl;

    auto transport = initiator_keys->send.EncryptWithAd({}, AsBytes("hello responder"));
    if (transport.IsErr()) {
        return Fail("encrypt transport message", transport.UnwrapErr().message);
    }
    auto delivered = responder_keys->recv.DecryptWithAd({}, transport.Unwrap());
    if (delivered.IsErr()) {
        return Fail("decrypt transport message", delivered.UnwrapErr().message);
    }
    std::cout << "   ✓ Responder read: "
              << std::string(delivered.Unwrap().begin(), delivered.Unwrap().end()) << std::endl;
    std::cout << std::endl;

    std::cout << "4. Flushing the audit log..." << std::endl;
    if (auto flushed = audit_log->Flush(); flushed.IsErr()) {
        return Fail("flush audit log", flushed.UnwrapErr().message);
    }
    if (auto stopped = audit_log->StopFileFlush(); stopped.IsErr()) {
        return Fail("stop audit flusher", stopped.UnwrapErr().message);
    }
    std::cout << "   ✓ Accesses written to " << audit_log->Config().OutputPath() << std::endl;

    return 0;
}
