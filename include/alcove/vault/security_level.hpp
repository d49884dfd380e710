#pragma once
#include <string_view>

namespace alcove::vault {

enum class SecurityLevel {
    Ephemeral,
    Encrypted
};

/**
 * @brief Session-only material; never leaves the process
 */
struct Ephemeral {
    static constexpr SecurityLevel kLevel = SecurityLevel::Ephemeral;
    static constexpr bool kPersistable = false;
};

/**
 * @brief Material that may be sealed and persisted
 */
struct Encrypted {
    static constexpr SecurityLevel kLevel = SecurityLevel::Encrypted;
    static constexpr bool kPersistable = true;
};

constexpr bool IsEphemeral(const SecurityLevel level) {
    return level == SecurityLevel::Ephemeral;
}

constexpr bool IsEncrypted(const SecurityLevel level) {
    return level == SecurityLevel::Encrypted;
}

constexpr bool IsPersistable(const SecurityLevel level) {
    return IsEncrypted(level);
}

constexpr std::string_view ToString(const SecurityLevel level) {
    return IsEphemeral(level) ? "ephemeral" : "encrypted";
}

}  // namespace alcove::vault
