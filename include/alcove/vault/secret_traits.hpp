#pragma once
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"
#include <google/protobuf/message.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace alcove::vault {

/**
 * @brief How a DynamicSecret payload turns into bytes and back, and how it is scrubbed
 *
 * Specializations exist for byte vectors, strings, byte arrays and every
 * protobuf message type. Serialize output is owned by the caller, who wipes it.
 */
template<typename T, typename Enable = void>
struct SecretTraits;

template<>
struct SecretTraits<std::vector<uint8_t>> {
    static Result<std::vector<uint8_t>, SecretFailure> Serialize(const std::vector<uint8_t>& value);
    static Result<std::vector<uint8_t>, SecretFailure> Deserialize(std::span<const uint8_t> bytes);
    static void Zeroize(std::vector<uint8_t>& value) noexcept;
};

template<>
struct SecretTraits<std::string> {
    static Result<std::vector<uint8_t>, SecretFailure> Serialize(const std::string& value);
    static Result<std::string, SecretFailure> Deserialize(std::span<const uint8_t> bytes);
    static void Zeroize(std::string& value) noexcept;
};

template<size_t N>
struct SecretTraits<std::array<uint8_t, N>> {
    static Result<std::vector<uint8_t>, SecretFailure> Serialize(const std::array<uint8_t, N>& value) {
        return Result<std::vector<uint8_t>, SecretFailure>::Ok(
            std::vector<uint8_t>(value.begin(), value.end()));
    }

    static Result<std::array<uint8_t, N>, SecretFailure> Deserialize(std::span<const uint8_t> bytes) {
        if (bytes.size() != N) {
            return Result<std::array<uint8_t, N>, SecretFailure>::Err(
                SecretFailure::InvalidLength("Stored length does not match the array size"));
        }
        std::array<uint8_t, N> value{};
        std::copy(bytes.begin(), bytes.end(), value.begin());
        return Result<std::array<uint8_t, N>, SecretFailure>::Ok(value);
    }

    static void Zeroize(std::array<uint8_t, N>& value) noexcept {
        sodium_memzero(value.data(), value.size());
    }
};

namespace detail {
    /**
     * Overwrites string and bytes fields in place, recursing into singular
     * sub-messages, then clears the message.
     */
    void ZeroizeMessage(google::protobuf::Message& message) noexcept;
}

template<typename T>
struct SecretTraits<T, std::enable_if_t<std::is_base_of_v<google::protobuf::MessageLite, T>>> {
    static Result<std::vector<uint8_t>, SecretFailure> Serialize(const T& value) {
        std::vector<uint8_t> bytes(value.ByteSizeLong());
        if (!value.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<std::vector<uint8_t>, SecretFailure>::Err(
                SecretFailure::SerializationError("Failed to serialize " + std::string(value.GetTypeName())));
        }
        return Result<std::vector<uint8_t>, SecretFailure>::Ok(std::move(bytes));
    }

    static Result<T, SecretFailure> Deserialize(std::span<const uint8_t> bytes) {
        T value;
        if (!value.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<T, SecretFailure>::Err(
                SecretFailure::SerializationError("Failed to parse " + std::string(value.GetTypeName())));
        }
        return Result<T, SecretFailure>::Ok(std::move(value));
    }

    static void Zeroize(T& value) noexcept {
        if constexpr (std::is_base_of_v<google::protobuf::Message, T>) {
            detail::ZeroizeMessage(value);
        } else {
            value.Clear();
        }
    }
};

}  // namespace alcove::vault
