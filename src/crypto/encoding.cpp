#include "alcove/crypto/encoding.hpp"
#include "alcove/crypto/sodium_interop.hpp"

#include <format>

namespace alcove::crypto {

std::string ToHex(std::span<const uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

Result<std::vector<uint8_t>, CryptoFailure> FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::HexError(
                std::format("Hex string has odd length {}", hex.size())));
    }
    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t decoded_len = 0;
    const char* end = nullptr;
    const int rc = sodium_hex2bin(
        bytes.data(), bytes.size(),
        hex.data(), hex.size(),
        nullptr, &decoded_len, &end);
    if (rc != SodiumConstants::SUCCESS || decoded_len != bytes.size()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::HexError(
                std::format("Invalid hex character at offset {}",
                    end != nullptr ? static_cast<size_t>(end - hex.data()) : decoded_len * 2)));
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(bytes));
}

} // namespace alcove::crypto
