#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <format>
#include <limits>
#include <string_view>

namespace alcove::nonce {

enum class Granularity {
    Seconds,
    Milliseconds,
    Microseconds
};

// Each granularity encodes a 32-bit count of its unit since the nonce's
// creation epoch and retires after LIFETIME units.
struct Seconds {
    using Duration = std::chrono::seconds;
    static constexpr Granularity kGranularity = Granularity::Seconds;
    static constexpr uint64_t LIFETIME = NonceConstants::GRANULARITY_LIFETIME;
    static constexpr std::string_view kName = "seconds";
};

struct Milliseconds {
    using Duration = std::chrono::milliseconds;
    static constexpr Granularity kGranularity = Granularity::Milliseconds;
    static constexpr uint64_t LIFETIME = NonceConstants::GRANULARITY_LIFETIME;
    static constexpr std::string_view kName = "milliseconds";
};

struct Microseconds {
    using Duration = std::chrono::microseconds;
    static constexpr Granularity kGranularity = Granularity::Microseconds;
    static constexpr uint64_t LIFETIME = NonceConstants::GRANULARITY_LIFETIME;
    static constexpr std::string_view kName = "microseconds";
};

/**
 * @brief Wall-clock microseconds since the UNIX epoch
 */
uint64_t NowMicros();

/**
 * @brief Microseconds elapsed since epoch_us, zero when the clock stepped back
 */
uint64_t ElapsedMicros(uint64_t epoch_us);

template<typename G>
uint64_t ElapsedUnits(const uint64_t epoch_us) {
    const std::chrono::microseconds elapsed(ElapsedMicros(epoch_us));
    return static_cast<uint64_t>(
        std::chrono::duration_cast<typename G::Duration>(elapsed).count());
}

template<typename G>
bool LifetimeElapsed(const uint64_t epoch_us) {
    return ElapsedUnits<G>(epoch_us) > G::LIFETIME;
}

template<typename G>
Result<uint32_t, NonceFailure> Timestamp(const uint64_t epoch_us) {
    const uint64_t units = ElapsedUnits<G>(epoch_us);
    if (units > std::numeric_limits<uint32_t>::max()) {
        return Result<uint32_t, NonceFailure>::Err(
            NonceFailure::U32ConvertError(
                std::format("{} {} since creation do not fit 32 bits", units, G::kName)));
    }
    return Result<uint32_t, NonceFailure>::Ok(static_cast<uint32_t>(units));
}

}  // namespace alcove::nonce
