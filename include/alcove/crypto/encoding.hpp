#pragma once

#include "alcove/core/result.hpp"
#include "alcove/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace alcove::crypto {

/**
 * @brief Lowercase hex of bytes
 */
std::string ToHex(std::span<const uint8_t> bytes);

/**
 * @brief Decode hex text (either case, no separators)
 *
 * @return Err(HexError) on odd length or a non-hex character
 */
Result<std::vector<uint8_t>, CryptoFailure> FromHex(std::string_view hex);

} // namespace alcove::crypto
