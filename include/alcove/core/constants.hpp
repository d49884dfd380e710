#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace alcove {
struct Constants {
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t NONCE_CONTEXT_SIZE = 4;
    static constexpr size_t BLAKE2S_HASH_SIZE = 32;
    static constexpr size_t BLAKE2S_BLOCK_SIZE = 64;
    static constexpr size_t HKDF_MAX_EXPANSION = 255;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct PasswordKdfConstants {
    static constexpr uint64_t OPS_LIMIT = 3;
    static constexpr size_t MEMORY_KIB = 65536;
    static constexpr size_t MEM_LIMIT_BYTES = MEMORY_KIB * 1024;
    static constexpr uint32_t PARALLELISM = 1;
    static constexpr size_t SALT_SIZE = 16;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view DIGEST_BLAKE2S = "BLAKE2S-256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct NonceConstants {
    static constexpr uint64_t GRANULARITY_LIFETIME = 4'000'000'000ULL;
    static constexpr size_t BODY_OFFSET = 4;
    static constexpr size_t LOW_WORD_OFFSET = 8;
    static constexpr uint64_t MONOTONIC_ROTATION_POINT = UINT64_MAX / 2;
    static constexpr uint64_t COUNTER_32_ROTATION_POINT = UINT32_MAX / 2;
};
struct NoiseConstants {
    static constexpr size_t DH_LEN = 32;
    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t BLOCK_LEN = 64;
    static constexpr size_t PSK_LEN = 32;
    static constexpr size_t MAX_MESSAGE_LEN = 65535;
    static constexpr uint64_t MAX_NONCE = UINT64_MAX;
    static constexpr std::string_view PROTOCOL_PREFIX = "Noise_";
    static constexpr std::string_view PROTOCOL_SUITE = "_25519_ChaChaPoly_BLAKE2s";
    static constexpr std::string_view LOCAL_PRIVATE_KEY_TAG = "Local Private DH Key";
    static constexpr std::string_view CIPHER_KEY_TAG = "Cipherstate Key";
    static constexpr std::string_view SEND_KEY_TAG = "Noise Send Key";
    static constexpr std::string_view RECV_KEY_TAG = "Noise Recv Key";
    static constexpr std::string_view CHAINING_KEY_TAG = "Noise Chaining Key";
    static constexpr std::string_view HANDSHAKE_HASH_TAG = "Noise Handshake Hash";
    static constexpr std::string_view PRESHARED_KEY_TAG = "Noise Preshared Key";
};
struct AuditConstants {
    static constexpr size_t DEFAULT_CAPACITY = 1000;
    static constexpr std::string_view DEFAULT_DIRECTORY = "log";
    static constexpr std::string_view DEFAULT_FILE_NAME = "output.txt";
    static constexpr std::chrono::milliseconds DEFAULT_FLUSH_INTERVAL{1000};
    static constexpr std::string_view OPERATION_ACCESS = "access";
    static constexpr std::string_view OPERATION_MUTABLE_ACCESS = "mutable access";
    static constexpr std::string_view OPERATION_COPY = "copy";
    static constexpr std::string_view OPERATION_POISON_RECOVERED = "poisoned lock recovered";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AEAD_ENCRYPTION_FAILED = "ChaCha20-Poly1305 encryption failed";
    static constexpr std::string_view AEAD_DECRYPTION_FAILED = "ChaCha20-Poly1305 decryption failed (authentication tag mismatch)";
    static constexpr std::string_view COUNTER_EXPIRED = "Nonce counter passed its rotation point, rotate the key";
    static constexpr std::string_view TIMESTAMP_EXPIRED = "Nonce lifetime elapsed, rotate the key";
    static constexpr std::string_view AUDIT_BUFFERS_FULL = "Audit log and flushing buffer are both full";
    static constexpr std::string_view FLUSHING_LOG_FULL = "Flushing buffer is full";
};
}
