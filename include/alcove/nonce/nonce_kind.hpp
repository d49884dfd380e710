#pragma once
#include "alcove/nonce/granularity.hpp"
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

namespace alcove::nonce {

enum class NonceType {
    Monotonic,
    MonotonicTimeStamp,
    RandomTimeStamp
};

inline std::string_view ToString(const NonceType type) {
    switch (type) {
        case NonceType::Monotonic: return "Monotonic";
        case NonceType::MonotonicTimeStamp: return "MonotonicTimeStamp";
        case NonceType::RandomTimeStamp: return "RandomTimeStamp";
    }
    return "Unknown";
}

// Bytes 4..12 hold a big-endian 64-bit counter.
struct Monotonic {
    static constexpr NonceType kType = NonceType::Monotonic;
    static constexpr bool kHasCounter = true;
    static constexpr bool kHasTimestamp = false;
    static constexpr bool kHasRandom = false;
    static constexpr uint64_t kCounterMax = std::numeric_limits<uint64_t>::max();
    static constexpr uint64_t kRotationPoint = NonceConstants::MONOTONIC_ROTATION_POINT;
};

// Bytes 4..8 hold the big-endian age in G units, bytes 8..12 a 32-bit counter.
template<typename G>
struct MonotonicTimeStamp {
    using GranularityType = G;
    static constexpr NonceType kType = NonceType::MonotonicTimeStamp;
    static constexpr bool kHasCounter = true;
    static constexpr bool kHasTimestamp = true;
    static constexpr bool kHasRandom = false;
    static constexpr uint64_t kCounterMax = std::numeric_limits<uint32_t>::max();
    static constexpr uint64_t kRotationPoint = NonceConstants::COUNTER_32_ROTATION_POINT;
};

// Bytes 4..8 hold the big-endian age in G units, bytes 8..12 fresh CSPRNG output.
template<typename G>
struct RandomTimeStamp {
    using GranularityType = G;
    static constexpr NonceType kType = NonceType::RandomTimeStamp;
    static constexpr bool kHasCounter = false;
    static constexpr bool kHasTimestamp = true;
    static constexpr bool kHasRandom = true;
    static constexpr uint64_t kCounterMax = 0;
    static constexpr uint64_t kRotationPoint = 0;
};

template<typename K>
struct IsNonceKind : std::false_type {};
template<>
struct IsNonceKind<Monotonic> : std::true_type {};
template<typename G>
struct IsNonceKind<MonotonicTimeStamp<G>> : std::true_type {};
template<typename G>
struct IsNonceKind<RandomTimeStamp<G>> : std::true_type {};

}  // namespace alcove::nonce
