#include <catch2/catch_test_macros.hpp>
#include "alcove/crypto/secure_memory_handle.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/noise/cipher_state.hpp"
#include "alcove/noise/key_pair.hpp"
#include "alcove/vault/data.hpp"
#include "alcove/vault/dynamic_secret.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include "alcove/vault/key.hpp"
#include "alcove/vault/secret_traits.hpp"
#include "helpers/recording_sink.hpp"
#include "test_secrets.pb.h"
#include <array>
#include <memory>
#include <string>
#include <vector>

using namespace alcove;
using namespace alcove::vault;
using alcove::test_helpers::RecordingSink;

namespace {
    template<size_t N>
    bool AllZero(const std::array<uint8_t, N>& bytes) {
        for (const uint8_t b : bytes) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }
}

TEST_CASE("Zeroization - Inputs handed to containers", "[security][zeroization]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();

    SECTION("Key::FromSlice") {
        std::vector<uint8_t> material(Constants::KEY_SIZE, 0x9A);
        auto key = Key<nonce::Monotonic>::FromSlice(
            material, "slice", nonce::MonotonicNonce::New(nonce::MakeContext("ZERO")).Unwrap(), sink);
        REQUIRE(key.IsOk());
        REQUIRE(material == std::vector<uint8_t>(Constants::KEY_SIZE, 0));
    }
    SECTION("FixedSecret::New") {
        std::array<uint8_t, 32> seed{};
        seed.fill(0x5D);
        auto secret = FixedSecret<32, Encrypted>::New(seed, "seed", sink);
        REQUIRE(secret.IsOk());
        REQUIRE(AllZero(seed));
        REQUIRE(secret.Unwrap().With([](const auto& bytes) { return bytes[0]; }).Unwrap() == 0x5D);
    }
    SECTION("Key::FromArray") {
        std::array<uint8_t, Constants::KEY_SIZE> material{};
        material.fill(0x4E);
        auto key = Key<nonce::Monotonic>::FromArray(
            material, "array", nonce::MonotonicNonce::New(nonce::MakeContext("ZERO")).Unwrap(), sink);
        REQUIRE(key.IsOk());
        REQUIRE(AllZero(material));
    }
    SECTION("DynamicSecret::New of a named vector") {
        std::vector<uint8_t> token(12, 0x2B);
        auto secret = DynamicSecret<std::vector<uint8_t>>::New(token, "token", sink);
        REQUIRE(secret.IsOk());
        REQUIRE(token.empty());
    }
    SECTION("KeyPair::FromPrivate") {
        std::array<uint8_t, NoiseConstants::DH_LEN> scalar{};
        scalar.fill(0x33);
        auto pair = noise::KeyPair::FromPrivate(scalar, sink);
        REQUIRE(pair.IsOk());
        REQUIRE(AllZero(scalar));
    }
    SECTION("CipherState::InitializeKey, even when the key is refused") {
        noise::CipherState state(sink);
        std::array<uint8_t, Constants::KEY_SIZE - 1> short_key{};
        short_key.fill(0x71);
        auto installed = state.InitializeKey(short_key, "short", noise::kCipherContext);
        REQUIRE(installed.IsErr());
        REQUIRE(AllZero(short_key));
        REQUIRE_FALSE(state.HasKey());
    }
    SECTION("DynamicSecret::Take of a string") {
        std::string passphrase = "open sesame";
        auto secret = DynamicSecret<std::string>::Take(passphrase, "phrase", sink);
        REQUIRE(secret.IsOk());
        REQUIRE(passphrase.empty());
    }
    SECTION("Data::FromPacket wipes the packet, even a rejected one") {
        std::vector<uint8_t> runt(10, 0xEE);
        REQUIRE(Data<state::Encrypted>::FromPacket(runt, "runt", sink).IsErr());
        REQUIRE(runt.empty());
    }
}

TEST_CASE("Zeroization - Secret traits", "[security][zeroization]") {
    SECTION("Fixed arrays are overwritten in place") {
        std::array<uint8_t, 24> value{};
        value.fill(0xC4);
        SecretTraits<std::array<uint8_t, 24>>::Zeroize(value);
        REQUIRE(AllZero(value));
    }
    SECTION("Byte vectors are emptied") {
        std::vector<uint8_t> value(48, 0x18);
        SecretTraits<std::vector<uint8_t>>::Zeroize(value);
        REQUIRE(value.empty());
    }
    SECTION("Protobuf messages lose every field") {
        proto::test::Credential credential;
        credential.set_user("admin");
        credential.set_password("letmein");
        credential.set_version(9);
        SecretTraits<proto::test::Credential>::Zeroize(credential);
        REQUIRE(credential.user().empty());
        REQUIRE(credential.password().empty());
        REQUIRE(credential.version() == 0);
    }
}

TEST_CASE("Zeroization - Protected memory", "[security][zeroization]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto handle = crypto::SecureMemoryHandle::Allocate(32).Unwrap();
    const std::vector<uint8_t> secret(32, 0x5F);
    REQUIRE(handle.Write(secret).IsOk());
    REQUIRE(handle.Zero().IsOk());

    std::vector<uint8_t> read(32, 0xFF);
    REQUIRE(handle.Read(read).IsOk());
    REQUIRE(read == std::vector<uint8_t>(32, 0));
}
