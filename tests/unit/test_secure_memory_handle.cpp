#include <catch2/catch_test_macros.hpp>
#include "alcove/core/constants.hpp"
#include "alcove/crypto/secure_memory_handle.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
#include <vector>
using namespace alcove;
using namespace alcove::crypto;

namespace {
    std::array<uint8_t, Constants::KEY_SIZE> KeyBytes(const uint8_t fill) {
        std::array<uint8_t, Constants::KEY_SIZE> key{};
        key.fill(fill);
        return key;
    }
}

TEST_CASE("SecureMemoryHandle - Lifetime", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Key-sized slot") {
        auto slot = SecureMemoryHandle::Allocate(Constants::KEY_SIZE);
        REQUIRE(slot.IsOk());
        REQUIRE_FALSE(slot.Unwrap().IsInvalid());
        REQUIRE(slot.Unwrap().Size() == Constants::KEY_SIZE);
    }
    SECTION("Zero-sized slot is refused") {
        auto slot = SecureMemoryHandle::Allocate(0);
        REQUIRE(slot.IsErr());
        REQUIRE(slot.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Moving a slot leaves the source disposed") {
        auto first = SecureMemoryHandle::Allocate(Constants::KEY_SIZE).Unwrap();
        const auto key = KeyBytes(0x3C);
        REQUIRE(first.Write(key).IsOk());

        SecureMemoryHandle second = std::move(first);
        REQUIRE(first.IsInvalid());
        REQUIRE(first.Size() == 0);
        REQUIRE(second.ReadBytes(Constants::KEY_SIZE).Unwrap() == std::vector<uint8_t>(key.begin(), key.end()));

        std::array<uint8_t, Constants::KEY_SIZE> out{};
        auto stale = first.Read(out);
        REQUIRE(stale.IsErr());
        REQUIRE(stale.UnwrapErr().type == SodiumFailureType::InvalidOperation);
    }
    SECTION("Move assignment releases the previous slot") {
        auto small = SecureMemoryHandle::Allocate(8).Unwrap();
        auto large = SecureMemoryHandle::Allocate(Constants::KEY_SIZE).Unwrap();
        small = std::move(large);
        REQUIRE(small.Size() == Constants::KEY_SIZE);
        REQUIRE(large.IsInvalid());
    }
}

TEST_CASE("SecureMemoryHandle - Copy in and out", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto slot = SecureMemoryHandle::Allocate(Constants::KEY_SIZE).Unwrap();

    SECTION("Shorter write pads the tail with zeros") {
        REQUIRE(slot.Write(KeyBytes(0xEE)).IsOk());
        const std::vector<uint8_t> prefix(10, 0x01);
        REQUIRE(slot.Write(prefix).IsOk());
        const auto stored = slot.ReadBytes(Constants::KEY_SIZE).Unwrap();
        REQUIRE(std::all_of(stored.begin(), stored.begin() + 10, [](uint8_t b) { return b == 0x01; }));
        REQUIRE(std::all_of(stored.begin() + 10, stored.end(), [](uint8_t b) { return b == 0x00; }));
    }
    SECTION("Oversized write is rejected") {
        const std::vector<uint8_t> too_long(Constants::KEY_SIZE + 1, 0x01);
        auto written = slot.Write(too_long);
        REQUIRE(written.IsErr());
        REQUIRE(written.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read needs room for the whole slot") {
        std::array<uint8_t, Constants::KEY_SIZE - 1> cramped{};
        auto read = slot.Read(cramped);
        REQUIRE(read.IsErr());
        REQUIRE(read.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("ReadBytes may take a prefix but not more") {
        REQUIRE(slot.Write(KeyBytes(0x5A)).IsOk());
        REQUIRE(slot.ReadBytes(4).Unwrap() == std::vector<uint8_t>(4, 0x5A));
        auto past_end = slot.ReadBytes(Constants::KEY_SIZE + 1);
        REQUIRE(past_end.IsErr());
        REQUIRE(past_end.UnwrapErr().type == SodiumFailureType::ReadOperationFailed);
    }
}

TEST_CASE("SecureMemoryHandle - Scoped access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto slot = SecureMemoryHandle::Allocate(Constants::KEY_SIZE).Unwrap();
    REQUIRE(slot.Write(KeyBytes(0x11)).IsOk());

    SECTION("Read access sees the stored key and returns the callback result") {
        auto sum = slot.WithReadAccess([](std::span<const uint8_t> bytes) {
            size_t total = 0;
            for (const auto b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == Constants::KEY_SIZE * 0x11);
    }
    SECTION("Write access edits in place") {
        REQUIRE(slot.WithWriteAccess([](std::span<uint8_t> bytes) {
            bytes[0] ^= 0xFF;
            return unit;
        }).IsOk());
        REQUIRE(slot.ReadBytes(1).Unwrap()[0] == static_cast<uint8_t>(0x11 ^ 0xFF));
    }
    SECTION("Zero wipes the key") {
        REQUIRE(slot.Zero().IsOk());
        REQUIRE(slot.ReadBytes(Constants::KEY_SIZE).Unwrap() == std::vector<uint8_t>(Constants::KEY_SIZE, 0x00));
    }
    SECTION("Disposed slot refuses every operation") {
        auto taken = std::move(slot);
        REQUIRE(slot.Zero().IsErr());
        REQUIRE(slot.WithReadAccess([](std::span<const uint8_t>) { return 0; }).IsErr());
        REQUIRE_FALSE(taken.IsInvalid());
    }
}
