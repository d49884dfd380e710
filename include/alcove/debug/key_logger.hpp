#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing for handshake transcripts, nonce movement and audit flushing.
 *
 * SECURITY WARNING: with ALCOVE_DEBUG_KEYS defined this header prints key
 * material to stdout. Use it to compare transcripts between two peers while
 * developing. Never enable it in a release build.
 *
 * Enable via CMake: -DALCOVE_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace alcove::debug {

enum class Side {
    Initiator,
    Responder,
    Local
};

inline Side SideOf(const bool initiator) {
    return initiator ? Side::Initiator : Side::Responder;
}

#ifdef ALCOVE_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Initiator: return "INITIATOR";
        case Side::Responder: return "RESPONDER";
        default: return "LOCAL";
    }
}

#define ALCOVE_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[ALCOVE-DEBUG] %s %s %s: %s\n", \
            ::alcove::debug::SideToString(side), \
            operation, \
            key_name, \
            ::alcove::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define ALCOVE_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[ALCOVE-DEBUG] %s %s %s: %s\n", \
            ::alcove::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define ALCOVE_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[ALCOVE-DEBUG] %s %s %s\n", \
            ::alcove::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define ALCOVE_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stdout, "[ALCOVE-DEBUG] %s ========== %s ==========\n", \
            ::alcove::debug::SideToString(side), \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogHandshakeStart(
    Side side,
    std::string_view protocol_name,
    std::span<const uint8_t> initial_hash) {

    ALCOVE_LOG_SECTION(side, "HANDSHAKE START");
    ALCOVE_LOG_MSG(side, "HANDSHAKE", std::string(protocol_name).c_str());
    ALCOVE_LOG_KEY(side, "HANDSHAKE", "h", initial_hash);
}

inline void LogToken(
    Side side,
    const char* direction,
    const char* token,
    size_t message_offset) {

    char name[48];
    snprintf(name, sizeof(name), "%s token %s", direction, token);
    ALCOVE_LOG_VALUE(side, "TOKEN", name, message_offset);
}

inline void LogMixKey(
    Side side,
    std::span<const uint8_t> chaining_key,
    std::span<const uint8_t> handshake_hash) {

    ALCOVE_LOG_KEY(side, "MIX", "ck", chaining_key);
    ALCOVE_LOG_KEY(side, "MIX", "h", handshake_hash);
}

inline void LogSplit(
    Side side,
    std::span<const uint8_t> handshake_hash) {

    ALCOVE_LOG_SECTION(side, "SPLIT");
    ALCOVE_LOG_KEY(side, "SPLIT", "channel_binding", handshake_hash);
}

inline void LogNonceAdvance(
    Side side,
    std::span<const uint8_t> used_nonce) {

    ALCOVE_LOG_KEY(side, "NONCE", "stamped", used_nonce);
}

inline void LogAuditFlush(size_t entries_written) {
    ALCOVE_LOG_VALUE(Side::Local, "AUDIT", "flushed", entries_written);
}

#else // !ALCOVE_DEBUG_KEYS

#define ALCOVE_LOG_KEY(side, operation, key_name, data) ((void)0)
#define ALCOVE_LOG_VALUE(side, operation, name, value) ((void)0)
#define ALCOVE_LOG_MSG(side, operation, message) ((void)0)
#define ALCOVE_LOG_SECTION(side, section_name) ((void)0)

inline void LogHandshakeStart(Side, std::string_view, std::span<const uint8_t>) {}
inline void LogToken(Side, const char*, const char*, size_t) {}
inline void LogMixKey(Side, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSplit(Side, std::span<const uint8_t>) {}
inline void LogNonceAdvance(Side, std::span<const uint8_t>) {}
inline void LogAuditFlush(size_t) {}

#endif // ALCOVE_DEBUG_KEYS

} // namespace alcove::debug
