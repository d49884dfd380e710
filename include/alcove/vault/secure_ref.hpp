#pragma once
#include "alcove/vault/secret_traits.hpp"
#include <utility>

namespace alcove::vault {

/**
 * @brief Owns a transient copy of a secret and scrubs it on every exit path
 *
 * Used as the scratch space behind With/WithMut. Moving transfers the value;
 * the moved-from wrapper scrubs whatever the move left behind.
 */
template<typename T>
class SecureRef {
public:
    explicit SecureRef(T value) : value_(std::move(value)) {}

    ~SecureRef() {
        SecretTraits<T>::Zeroize(value_);
    }

    SecureRef(SecureRef&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(other.value_)) {}

    SecureRef& operator=(SecureRef&&) = delete;
    SecureRef(const SecureRef&) = delete;
    SecureRef& operator=(const SecureRef&) = delete;

    /**
     * @brief Rebuild T from stored bytes. The input bytes are left untouched.
     */
    static Result<SecureRef, SecretFailure> FromBytes(std::span<const uint8_t> bytes) {
        auto value = SecretTraits<T>::Deserialize(bytes);
        if (value.IsErr()) {
            return Result<SecureRef, SecretFailure>::Err(std::move(value).UnwrapErr());
        }
        return Result<SecureRef, SecretFailure>::Ok(SecureRef(std::move(value).Unwrap()));
    }

    /**
     * @brief Serialized form, itself wrapped so the bytes are scrubbed on drop
     */
    Result<SecureRef<std::vector<uint8_t>>, SecretFailure> ToBytes() const {
        auto bytes = SecretTraits<T>::Serialize(value_);
        if (bytes.IsErr()) {
            return Result<SecureRef<std::vector<uint8_t>>, SecretFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return Result<SecureRef<std::vector<uint8_t>>, SecretFailure>::Ok(
            SecureRef<std::vector<uint8_t>>(std::move(bytes).Unwrap()));
    }

    [[nodiscard]] const T& Get() const noexcept { return value_; }
    [[nodiscard]] T& GetMut() noexcept { return value_; }

private:
    T value_;
};

}  // namespace alcove::vault
