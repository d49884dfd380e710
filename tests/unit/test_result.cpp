#include <catch2/catch_test_macros.hpp>
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include <string>
using namespace alcove;

namespace {
    Result<int, std::string> ParsePositive(const int value) {
        if (value <= 0) {
            return Result<int, std::string>::Err("not positive");
        }
        return Result<int, std::string>::Ok(value);
    }

    Result<std::string, std::string> DescribeTwice(const int value) {
        TRY(ParsePositive(value));
        return Result<std::string, std::string>::Ok(std::to_string(value * 2));
    }
}

TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS(result.Unwrap());
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
}

TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto mapped = Result<int, std::string>::Err("error").MapErr([](std::string s) { return s + "!"; });
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind chains operations") {
        auto bound = Result<int, std::string>::Ok(10).Bind([](int x) { return ParsePositive(x - 20); });
        REQUIRE(bound.IsErr());
        REQUIRE(bound.UnwrapErr() == "not positive");
    }
    SECTION("UnwrapOr falls back on Err") {
        REQUIRE(Result<int, std::string>::Ok(42).UnwrapOr(0) == 42);
        REQUIRE(Result<int, std::string>::Err("error").UnwrapOr(7) == 7);
    }
}

TEST_CASE("Result<T, E> - TRY propagation", "[result][core]") {
    SECTION("Ok passes through to the rest of the function") {
        auto result = DescribeTwice(21);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "42");
    }
    SECTION("Err returns early with the same error") {
        auto result = DescribeTwice(-1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "not positive");
    }
}

TEST_CASE("Failures - Cause chaining", "[result][core][failures]") {
    SECTION("Secret failure keeps the nonce cause") {
        const auto failure = SecretFailure::FromNonce(NonceFailure::CounterExpired("expired"));
        REQUIRE(failure.type == SecretFailureType::NonceError);
        REQUIRE(failure.IsNonce(NonceFailureType::CounterExpired));
        REQUIRE_FALSE(failure.IsCrypto(CryptoFailureType::DecryptionError));
    }
    SECTION("Noise failure unwraps a crypto cause carried by a secret failure") {
        const auto secret = SecretFailure::FromCrypto(CryptoFailure::DecryptionError("bad tag"));
        const auto noise = NoiseFailure::FromSecret(secret);
        REQUIRE(noise.type == NoiseFailureType::CryptoError);
        REQUIRE(noise.IsCrypto(CryptoFailureType::DecryptionError));
    }
    SECTION("Noise failure keeps the secret type when there is no deeper cause") {
        const auto noise = NoiseFailure::FromSecret(SecretFailure::LockPoisoned("poisoned"));
        REQUIRE(noise.type == NoiseFailureType::SecretError);
        REQUIRE(std::get<SecretFailureType>(noise.cause) == SecretFailureType::LockPoisoned);
    }
}
