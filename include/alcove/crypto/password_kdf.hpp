#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"
#include "alcove/core/constants.hpp"

#include <cstdint>
#include <span>

namespace alcove::crypto {

/**
 * @brief Argon2id password-derived keys with fixed cost
 *
 * memory = 65536 KiB, time = 3, parallelism = 1 (libsodium's Argon2id is
 * single-lane). The output length is the length of the caller's buffer.
 */
class PasswordKdf {
public:
    static Result<Unit, CryptoFailure> DerivePdk(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        std::span<uint8_t> output);

    static constexpr size_t SALT_SIZE = PasswordKdfConstants::SALT_SIZE;

private:
    PasswordKdf() = delete;
};

} // namespace alcove::crypto
