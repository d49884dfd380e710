#include <catch2/catch_test_macros.hpp>
#include "alcove/crypto/encoding.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include <vector>
using namespace alcove;
using namespace alcove::crypto;

TEST_CASE("Encoding - Hex", "[crypto][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Lowercase encoding") {
        const std::vector<uint8_t> bytes = {0x00, 0x0F, 0xA5, 0xFF};
        REQUIRE(ToHex(bytes) == "000fa5ff");
    }
    SECTION("Empty input") {
        REQUIRE(ToHex({}).empty());
        auto decoded = FromHex("");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().empty());
    }
    SECTION("Uppercase decodes") {
        auto decoded = FromHex("DEADbeef");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    }
    SECTION("Odd length fails") {
        auto decoded = FromHex("abc");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == CryptoFailureType::HexError);
    }
    SECTION("Non-hex character fails") {
        auto decoded = FromHex("zz");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == CryptoFailureType::HexError);
    }
}
