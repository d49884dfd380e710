#include <catch2/catch_test_macros.hpp>
#include "alcove/crypto/blake2s.hpp"
#include "alcove/crypto/encoding.hpp"
#include "alcove/crypto/hkdf.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
#include <string_view>
#include <vector>
using namespace alcove;
using namespace alcove::crypto;

namespace {
    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    std::array<uint8_t, 32> Sequence32() {
        std::array<uint8_t, 32> bytes{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(i);
        }
        return bytes;
    }
}

TEST_CASE("Blake2s - Digest", "[crypto][blake2s]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Empty input") {
        auto digest = Blake2s::Hash({});
        REQUIRE(digest.IsOk());
        REQUIRE(ToHex(digest.Unwrap()) == "69217a3079908094e11121d042354a7c1f55b6482ca1a51e1b250dfd1ed0eef9");
    }
    SECTION("abc") {
        auto digest = Blake2s::Hash(AsBytes("abc"));
        REQUIRE(digest.IsOk());
        REQUIRE(ToHex(digest.Unwrap()) == "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982");
    }
    SECTION("Hashing parts equals hashing the concatenation") {
        auto whole = Blake2s::Hash(AsBytes("handshake-hash"));
        auto parts = Blake2s::HashParts({AsBytes("hand"), {}, AsBytes("shake-hash")});
        REQUIRE(whole.IsOk());
        REQUIRE(parts.IsOk());
        REQUIRE(whole.Unwrap() == parts.Unwrap());
    }
}

TEST_CASE("Blake2s - HMAC", "[crypto][blake2s][hmac]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Known answer") {
        auto mac = Blake2s::Hmac(AsBytes("key"), {AsBytes("The quick brown fox jumps over the lazy dog")});
        REQUIRE(mac.IsOk());
        REQUIRE(ToHex(mac.Unwrap()) == "f93215bb90d4af4c3061cd932fb169fb8bb8a91d0b4022baea1271e1323cd9a0");
    }
    SECTION("Different keys give different tags") {
        auto first = Blake2s::Hmac(AsBytes("key-1"), {AsBytes("payload")});
        auto second = Blake2s::Hmac(AsBytes("key-2"), {AsBytes("payload")});
        REQUIRE(first.Unwrap() != second.Unwrap());
    }
}

TEST_CASE("Hkdf - Noise chaining derivation", "[crypto][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto chaining_key = Sequence32();
    const std::vector<uint8_t> ikm(32, 0xAA);

    SECTION("Two outputs") {
        auto keys = Hkdf::DeriveKeys<2>(chaining_key, ikm);
        REQUIRE(keys.IsOk());
        REQUIRE(ToHex(keys.Unwrap()[0]) == "d01e3c3f8b4ab8c910b43541becbf8cafdcf8753e17e2de30702883e914f7184");
        REQUIRE(ToHex(keys.Unwrap()[1]) == "515b574d1548ef8d755c0cb00c25335407737ae06ed933b35af3a1f10d217c2f");
    }
    SECTION("Three outputs extend the two-output prefix") {
        auto keys = Hkdf::DeriveKeys<3>(chaining_key, ikm);
        REQUIRE(keys.IsOk());
        REQUIRE(ToHex(keys.Unwrap()[0]) == "d01e3c3f8b4ab8c910b43541becbf8cafdcf8753e17e2de30702883e914f7184");
        REQUIRE(ToHex(keys.Unwrap()[2]) == "3beffde088d7412d14b59bce443861f8e7821e93ba162c228ef0d2e1739dec7c");
    }
}

TEST_CASE("Hkdf - Split-style derivation", "[crypto][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto chaining_key = Sequence32();

    SECTION("Empty input key material") {
        auto keys = Hkdf::DeriveKeys<2>(chaining_key, {});
        REQUIRE(keys.IsOk());
        REQUIRE(ToHex(keys.Unwrap()[0]) == "7a38c34bf2b8738d7374ca77c44ecb309a11d2b2528304fa86052c365e722624");
        REQUIRE(ToHex(keys.Unwrap()[1]) == "1a17621f346abdc520746a9fb64d8eb03231d674fc15687537b0780fd9c060fd");
    }
    SECTION("Extract then Expand matches the one-shot derivation") {
        const std::vector<uint8_t> ikm(32, 0xAA);
        auto prk = Hkdf::Extract(chaining_key, ikm);
        REQUIRE(prk.IsOk());
        std::array<uint8_t, 48> staged{};
        REQUIRE(Hkdf::Expand(prk.Unwrap(), AsBytes("label"), staged).IsOk());
        std::array<uint8_t, 48> direct{};
        REQUIRE(Hkdf::DeriveKey(chaining_key, ikm, AsBytes("label"), direct).IsOk());
        REQUIRE(staged == direct);
    }
    SECTION("Empty salt is the all-zero salt") {
        const std::array<uint8_t, Hkdf::HASH_LEN> zero_salt{};
        auto implicit = Hkdf::Extract({}, AsBytes("ikm"));
        auto explicit_zero = Hkdf::Extract(zero_salt, AsBytes("ikm"));
        REQUIRE(implicit.IsOk());
        REQUIRE(implicit.Unwrap() == explicit_zero.Unwrap());
    }
}

TEST_CASE("Hkdf - Expand limits", "[crypto][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto prk = Sequence32();
    SECTION("Maximum output length succeeds") {
        std::vector<uint8_t> okm(Hkdf::MAX_OUTPUT_LEN);
        REQUIRE(Hkdf::Expand(prk, AsBytes("info"), okm).IsOk());
    }
    SECTION("One byte past the maximum fails") {
        std::vector<uint8_t> okm(Hkdf::MAX_OUTPUT_LEN + 1);
        auto result = Hkdf::Expand(prk, AsBytes("info"), okm);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::HkdfExpandTooLong);
    }
    SECTION("Short outputs are prefixes of longer ones") {
        std::array<uint8_t, 16> short_okm{};
        std::array<uint8_t, 80> long_okm{};
        REQUIRE(Hkdf::Expand(prk, AsBytes("info"), short_okm).IsOk());
        REQUIRE(Hkdf::Expand(prk, AsBytes("info"), long_okm).IsOk());
        REQUIRE(std::equal(short_okm.begin(), short_okm.end(), long_okm.begin()));
    }
}

TEST_CASE("Hkdf - Subkeys", "[crypto][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = Sequence32();
    SECTION("Different contexts give different subkeys") {
        std::array<uint8_t, 32> first{};
        std::array<uint8_t, 32> second{};
        REQUIRE(DeriveSubkey(key, AsBytes("context-a"), first).IsOk());
        REQUIRE(DeriveSubkey(key, AsBytes("context-b"), second).IsOk());
        REQUIRE(first != second);
    }
    SECTION("Derivation is deterministic") {
        std::array<uint8_t, 32> first{};
        std::array<uint8_t, 32> second{};
        REQUIRE(DeriveSubkey(key, AsBytes("context"), first).IsOk());
        REQUIRE(DeriveSubkey(key, AsBytes("context"), second).IsOk());
        REQUIRE(first == second);
    }
}
