#pragma once
#include "alcove/core/constants.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include "alcove/crypto/encoding.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/nonce/granularity.hpp"
#include "alcove/nonce/nonce_kind.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <span>
#include <string>

namespace alcove::nonce {

inline constexpr size_t kNonceBytes = Constants::NONCE_SIZE;
inline constexpr size_t kContextBytes = Constants::NONCE_CONTEXT_SIZE;

using NonceBytes = std::array<uint8_t, kNonceBytes>;
using NonceContext = std::array<uint8_t, kContextBytes>;

/**
 * @brief Four-byte context from a four-character literal, e.g. MakeContext("CKEY")
 */
constexpr NonceContext MakeContext(const char (&text)[kContextBytes + 1]) {
    return {static_cast<uint8_t>(text[0]), static_cast<uint8_t>(text[1]),
            static_cast<uint8_t>(text[2]), static_cast<uint8_t>(text[3])};
}

namespace detail {
    inline uint32_t LoadU32(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }
    inline void StoreU32(uint8_t* p, const uint32_t value) {
        p[0] = static_cast<uint8_t>(value >> 24);
        p[1] = static_cast<uint8_t>(value >> 16);
        p[2] = static_cast<uint8_t>(value >> 8);
        p[3] = static_cast<uint8_t>(value);
    }
    inline uint64_t LoadU64(const uint8_t* p) {
        return (static_cast<uint64_t>(LoadU32(p)) << 32) | LoadU32(p + 4);
    }
    inline void StoreU64(uint8_t* p, const uint64_t value) {
        StoreU32(p, static_cast<uint32_t>(value >> 32));
        StoreU32(p + 4, static_cast<uint32_t>(value));
    }
}

/**
 * @brief 96-bit AEAD nonce: context[4] || body[8]
 *
 * The kind decides the body layout (see nonce_kind.hpp). The context never
 * changes after construction. Every mutation first consults NeedsRotation()
 * and refuses once the nonce must not be used again:
 *  - counter kinds once the counter is past half of its range (CounterExpired),
 *  - timestamp kinds once the nonce is older than G::LIFETIME units (TimestampExpired).
 *
 * The creation epoch travels with the nonce (microseconds since the UNIX
 * epoch) so a nonce rebuilt from the wire keeps its age.
 */
template<typename Kind>
class Nonce {
    static_assert(IsNonceKind<Kind>::value,
                  "Nonce kind must be Monotonic, MonotonicTimeStamp<G> or RandomTimeStamp<G>");
public:
    static Result<Nonce, NonceFailure> New(const NonceContext& context, const uint64_t counter) {
        static_assert(Kind::kHasCounter, "Only counter nonces take an initial counter");
        if (counter > Kind::kCounterMax) {
            return Result<Nonce, NonceFailure>::Err(
                NonceFailure::U32ConvertError(
                    std::format("Counter {} does not fit a 32-bit nonce counter", counter)));
        }
        Nonce nonce(context, NowMicros());
        nonce.WriteCounter(counter);
        if constexpr (Kind::kHasTimestamp) {
            nonce.WriteTimestamp(0);
        }
        return Result<Nonce, NonceFailure>::Ok(nonce);
    }

    static Result<Nonce, NonceFailure> New(const NonceContext& context) {
        if constexpr (Kind::kHasCounter) {
            return New(context, 0);
        } else {
            Nonce nonce(context, NowMicros());
            nonce.WriteTimestamp(0);
            auto filled = nonce.RefillRandom();
            if (filled.IsErr()) {
                return Result<Nonce, NonceFailure>::Err(std::move(filled).UnwrapErr());
            }
            return Result<Nonce, NonceFailure>::Ok(nonce);
        }
    }

    static Result<Nonce, NonceFailure> FromBytes(
        std::span<const uint8_t> bytes,
        const uint64_t created_at_us) {
        if (bytes.size() != kNonceBytes) {
            return Result<Nonce, NonceFailure>::Err(
                NonceFailure::InvalidLength(
                    std::format("Nonce must be {} bytes, got {}", kNonceBytes, bytes.size())));
        }
        NonceContext context{};
        std::copy_n(bytes.begin(), kContextBytes, context.begin());
        Nonce nonce(context, created_at_us);
        std::copy(bytes.begin(), bytes.end(), nonce.bytes_.begin());
        return Result<Nonce, NonceFailure>::Ok(nonce);
    }

    Result<Unit, NonceFailure> NeedsRotation() const {
        if constexpr (Kind::kHasTimestamp) {
            if (LifetimeElapsed<typename Kind::GranularityType>(created_at_us_)) {
                return Result<Unit, NonceFailure>::Err(
                    NonceFailure::TimestampExpired(std::string(ErrorMessages::TIMESTAMP_EXPIRED)));
            }
        }
        if constexpr (Kind::kHasCounter) {
            if (CounterNum() > Kind::kRotationPoint) {
                return Result<Unit, NonceFailure>::Err(
                    NonceFailure::CounterExpired(std::string(ErrorMessages::COUNTER_EXPIRED)));
            }
        }
        return Result<Unit, NonceFailure>::Ok(unit);
    }

    /**
     * @brief Advance to the next value, refusing when the nonce needs rotation
     */
    Result<Unit, NonceFailure> ToNext() {
        if (auto rotation = NeedsRotation(); rotation.IsErr()) {
            return rotation;
        }
        if constexpr (Kind::kHasTimestamp) {
            auto timestamp = Timestamp<typename Kind::GranularityType>(created_at_us_);
            if (timestamp.IsErr()) {
                return Result<Unit, NonceFailure>::Err(std::move(timestamp).UnwrapErr());
            }
            WriteTimestamp(timestamp.Unwrap());
        }
        if constexpr (Kind::kHasCounter) {
            WriteCounter(CounterNum() + 1);
        }
        if constexpr (Kind::kHasRandom) {
            return RefillRandom();
        }
        return Result<Unit, NonceFailure>::Ok(unit);
    }

    Result<Unit, NonceFailure> SetCounter(const uint64_t counter) {
        static_assert(Kind::kHasCounter, "Nonce kind has no counter");
        if (counter > Kind::kCounterMax) {
            return Result<Unit, NonceFailure>::Err(
                NonceFailure::U32ConvertError(
                    std::format("Counter {} does not fit a 32-bit nonce counter", counter)));
        }
        WriteCounter(counter);
        return Result<Unit, NonceFailure>::Ok(unit);
    }

    [[nodiscard]] const NonceBytes& AsBytes() const { return bytes_; }
    [[nodiscard]] NonceBytes ToBytes() const { return bytes_; }
    [[nodiscard]] std::string ToHex() const { return crypto::ToHex(bytes_); }

    [[nodiscard]] NonceContext Context() const {
        NonceContext context{};
        std::copy_n(bytes_.begin(), kContextBytes, context.begin());
        return context;
    }

    [[nodiscard]] bool ValidateContext(const NonceContext& context) const {
        return std::equal(context.begin(), context.end(), bytes_.begin());
    }

    [[nodiscard]] uint64_t CreatedAt() const { return created_at_us_; }

    [[nodiscard]] bool IsFresh(const std::chrono::microseconds max_age) const {
        return ElapsedMicros(created_at_us_) <= static_cast<uint64_t>(max_age.count());
    }

    [[nodiscard]] uint64_t CounterNum() const {
        static_assert(Kind::kHasCounter, "Nonce kind has no counter");
        if constexpr (Kind::kType == NonceType::Monotonic) {
            return detail::LoadU64(bytes_.data() + NonceConstants::BODY_OFFSET);
        } else {
            return detail::LoadU32(bytes_.data() + NonceConstants::LOW_WORD_OFFSET);
        }
    }

    [[nodiscard]] uint32_t TimestampNum() const {
        static_assert(Kind::kHasTimestamp, "Nonce kind has no timestamp");
        return detail::LoadU32(bytes_.data() + NonceConstants::BODY_OFFSET);
    }

    [[nodiscard]] uint32_t RandomNum() const {
        static_assert(Kind::kHasRandom, "Nonce kind has no random word");
        return detail::LoadU32(bytes_.data() + NonceConstants::LOW_WORD_OFFSET);
    }

    /**
     * @brief Bytes 4..12 as a big-endian integer
     */
    [[nodiscard]] uint64_t BodyNum() const {
        return detail::LoadU64(bytes_.data() + NonceConstants::BODY_OFFSET);
    }

    [[nodiscard]] static constexpr NonceType GetNonceType() { return Kind::kType; }

    bool operator==(const Nonce& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Nonce& other) const { return !(*this == other); }

private:
    Nonce(const NonceContext& context, const uint64_t created_at_us)
        : created_at_us_(created_at_us) {
        std::copy(context.begin(), context.end(), bytes_.begin());
    }

    void WriteCounter(const uint64_t counter) {
        if constexpr (Kind::kType == NonceType::Monotonic) {
            detail::StoreU64(bytes_.data() + NonceConstants::BODY_OFFSET, counter);
        } else {
            detail::StoreU32(bytes_.data() + NonceConstants::LOW_WORD_OFFSET,
                             static_cast<uint32_t>(counter));
        }
    }

    void WriteTimestamp(const uint32_t timestamp) {
        detail::StoreU32(bytes_.data() + NonceConstants::BODY_OFFSET, timestamp);
    }

    Result<Unit, NonceFailure> RefillRandom() {
        auto filled = crypto::SodiumInterop::FillRandom(
            std::span<uint8_t>(bytes_.data() + NonceConstants::LOW_WORD_OFFSET, 4));
        if (filled.IsErr()) {
            return Result<Unit, NonceFailure>::Err(
                NonceFailure::FillRandomError(filled.UnwrapErr().message));
        }
        return Result<Unit, NonceFailure>::Ok(unit);
    }

    NonceBytes bytes_{};
    uint64_t created_at_us_;
};

using MonotonicNonce = Nonce<Monotonic>;

}  // namespace alcove::nonce
