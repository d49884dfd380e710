#include <catch2/catch_test_macros.hpp>
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/core/constants.hpp"
#include <array>
#include <vector>
using namespace alcove;
using namespace alcove::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Wipe small buffer zeroes it") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(100, 0));
    }
    SECTION("Wipe large buffer zeroes it") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(10000, 0));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap());
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
}

TEST_CASE("SodiumInterop - X25519", "[sodium][crypto][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Both sides derive the same shared secret") {
        std::array<uint8_t, 32> alice_sk{};
        std::array<uint8_t, 32> bob_sk{};
        REQUIRE(SodiumInterop::FillRandom(alice_sk).IsOk());
        REQUIRE(SodiumInterop::FillRandom(bob_sk).IsOk());
        std::array<uint8_t, 32> alice_pk{};
        std::array<uint8_t, 32> bob_pk{};
        REQUIRE(SodiumInterop::ComputeX25519PublicKey(alice_sk, alice_pk).IsOk());
        REQUIRE(SodiumInterop::ComputeX25519PublicKey(bob_sk, bob_pk).IsOk());

        std::array<uint8_t, 32> alice_shared{};
        std::array<uint8_t, 32> bob_shared{};
        REQUIRE(SodiumInterop::ComputeX25519SharedSecret(alice_sk, bob_pk, alice_shared).IsOk());
        REQUIRE(SodiumInterop::ComputeX25519SharedSecret(bob_sk, alice_pk, bob_shared).IsOk());
        REQUIRE(alice_shared == bob_shared);
    }
    SECTION("Low-order peer key is rejected") {
        std::array<uint8_t, 32> sk{};
        REQUIRE(SodiumInterop::FillRandom(sk).IsOk());
        const std::array<uint8_t, 32> zero_point{};
        std::array<uint8_t, 32> shared{};
        auto result = SodiumInterop::ComputeX25519SharedSecret(sk, zero_point, shared);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidKeyLength);
    }
    SECTION("Wrong private key length is rejected") {
        std::vector<uint8_t> sk(31, 0x01);
        std::array<uint8_t, 32> pk{};
        auto result = SodiumInterop::ComputeX25519PublicKey(sk, pk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidKeyLength);
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("GetRandomBytes generates correct size") {
        REQUIRE(SodiumInterop::GetRandomBytes(32).size() == 32);
    }
    SECTION("GetRandomBytes generates different values") {
        REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    }
    SECTION("FillRandom overwrites the buffer") {
        std::array<uint8_t, 64> first{};
        std::array<uint8_t, 64> second{};
        REQUIRE(SodiumInterop::FillRandom(first).IsOk());
        REQUIRE(SodiumInterop::FillRandom(second).IsOk());
        REQUIRE(first != second);
    }
}
