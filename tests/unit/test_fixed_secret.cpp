#include <catch2/catch_test_macros.hpp>
#include "alcove/core/constants.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include "helpers/recording_sink.hpp"
#include <array>
#include <memory>
#include <stdexcept>
using namespace alcove;
using namespace alcove::vault;
using alcove::test_helpers::RecordingSink;
using alcove::test_helpers::RefusingSink;

TEST_CASE("FixedSecret - Construction", "[vault][fixed]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();

    SECTION("Take copies the buffer in and zeroes the source") {
        std::array<uint8_t, 16> source{};
        source.fill(0x5A);
        auto secret = FixedSecret<16>::Take(source, "taken", sink);
        REQUIRE(secret.IsOk());
        REQUIRE(source == std::array<uint8_t, 16>{});
        auto inside = secret.Unwrap().With([](const std::array<uint8_t, 16>& bytes) { return bytes[0]; });
        REQUIRE(inside.IsOk());
        REQUIRE(inside.Unwrap() == 0x5A);
    }
    SECTION("Random secrets differ") {
        auto first = FixedSecret<32>::Random("a", sink).Unwrap();
        auto second = FixedSecret<32>::Random("b", sink).Unwrap();
        auto same = first.SecretEquals(second);
        REQUIRE(same.IsOk());
        REQUIRE_FALSE(same.Unwrap());
    }
    SECTION("Metadata") {
        auto secret = FixedSecret<24, Encrypted>::New(std::array<uint8_t, 24>{}, "meta", sink).Unwrap();
        REQUIRE(secret.Tag() == "meta");
        REQUIRE(secret.Len() == 24);
        REQUIRE(secret.AccessCount() == 0);
        REQUIRE(secret.GetSecurityLevel() == SecurityLevel::Encrypted);
        REQUIRE_FALSE(secret.IsPoisoned());
        REQUIRE(sink->Count() == 0);
    }
}

TEST_CASE("FixedSecret - Audited access", "[vault][fixed][audit]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();
    auto secret = FixedSecret<8>::New({1, 2, 3, 4, 5, 6, 7, 8}, "counter", sink).Unwrap();

    SECTION("Every access is counted and logged") {
        REQUIRE(secret.With([](const auto&) {}).IsOk());
        REQUIRE(secret.With([](const auto&) {}).IsOk());
        REQUIRE(secret.WithMut([](auto&) {}).IsOk());
        REQUIRE(secret.AccessCount() == 3);
        REQUIRE(sink->CountFor("counter", AuditConstants::OPERATION_ACCESS) == 2);
        REQUIRE(sink->CountFor("counter", AuditConstants::OPERATION_MUTABLE_ACCESS) == 1);
        const auto entries = sink->Entries();
        REQUIRE(entries.back().access_count == 3);
    }
    SECTION("WithMut persists changes") {
        REQUIRE(secret.WithMut([](std::array<uint8_t, 8>& bytes) { bytes[0] = 0xEE; }).IsOk());
        auto first = secret.With([](const std::array<uint8_t, 8>& bytes) { return bytes[0]; });
        REQUIRE(first.Unwrap() == 0xEE);
    }
    SECTION("Async access yields the same result") {
        auto future = secret.WithAsync([](const std::array<uint8_t, 8>& bytes) { return bytes[7]; });
        auto result = future.get();
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 8);
        auto mutated = secret.WithMutAsync([](std::array<uint8_t, 8>& bytes) { bytes[7] = 9; }).get();
        REQUIRE(mutated.IsOk());
        REQUIRE(secret.With([](const std::array<uint8_t, 8>& bytes) { return bytes[7]; }).Unwrap() == 9);
    }
}

TEST_CASE("FixedSecret - Copy", "[vault][fixed]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();
    auto secret = FixedSecret<32>::Random("original", sink).Unwrap();

    auto copy = secret.Copy();
    REQUIRE(copy.IsOk());
    REQUIRE(copy.Unwrap().Tag() == "original");
    REQUIRE(copy.Unwrap().AccessCount() == 0);
    REQUIRE(sink->CountFor("original", AuditConstants::OPERATION_COPY) == 1);
    REQUIRE(secret.SecretEquals(copy.Unwrap()).Unwrap());

    REQUIRE(copy.Unwrap().WithMut([](auto& bytes) { bytes[0] ^= 0xFF; }).IsOk());
    REQUIRE_FALSE(secret.SecretEquals(copy.Unwrap()).Unwrap());
}

TEST_CASE("FixedSecret - Audit refusal", "[vault][fixed][audit]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RefusingSink>(1);
    auto secret = FixedSecret<8>::New({}, "refused", sink).Unwrap();

    REQUIRE(secret.With([](const auto&) {}).IsOk());
    bool ran = false;
    auto refused = secret.With([&ran](const auto&) { ran = true; });
    REQUIRE(refused.IsErr());
    REQUIRE(refused.UnwrapErr().type == SecretFailureType::AuditError);
    REQUIRE(std::get<AuditFailureType>(refused.UnwrapErr().cause) == AuditFailureType::AuditBuffersFull);
    REQUIRE_FALSE(ran);

    SECTION("Refused accesses are not counted") {
        REQUIRE(secret.AccessCount() == 1);
        REQUIRE(secret.WithMut([](auto& bytes) { bytes[0] = 1; }).IsErr());
        REQUIRE(secret.AccessCount() == 1);
    }
}

TEST_CASE("AccessAudit - Count follows accepted entries", "[vault][fixed][audit]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto recorder = std::make_shared<RecordingSink>();
    AccessAudit audit("counted", recorder);
    REQUIRE(audit.Record(AuditConstants::OPERATION_ACCESS).IsOk());
    REQUIRE(audit.Record(AuditConstants::OPERATION_ACCESS).IsOk());
    REQUIRE(audit.Count() == 2);
    const auto entries = recorder->Entries();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].access_count == 1);
    REQUIRE(entries[1].access_count == 2);

    AccessAudit refused("refused", std::make_shared<RefusingSink>());
    REQUIRE(refused.Record(AuditConstants::OPERATION_ACCESS).IsErr());
    REQUIRE(refused.Count() == 0);
}

TEST_CASE("FixedSecret - Poisoning", "[vault][fixed][poison]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sink = std::make_shared<RecordingSink>();
    auto secret = FixedSecret<8>::New({}, "poisoned", sink).Unwrap();

    REQUIRE_THROWS_AS(
        secret.With([](const auto&) -> int { throw std::runtime_error("closure failed"); }),
        std::runtime_error);
    REQUIRE(secret.IsPoisoned());

    SECTION("Next access recovers and records the recovery") {
        REQUIRE(secret.With([](const auto&) {}).IsOk());
        REQUIRE_FALSE(secret.IsPoisoned());
        REQUIRE(sink->CountFor("poisoned", AuditConstants::OPERATION_POISON_RECOVERED) == 1);
    }
}
