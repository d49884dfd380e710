#pragma once
#include <string>
#include <string_view>
#include <variant>
namespace alcove {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class CryptoFailureType {
    HexError,
    Argon2Error,
    InvalidKeyLength,
    OsRngError,
    DestTooSmall,
    HkdfExpandTooLong,
    EncryptionError,
    DecryptionError,
    DigestError
};
enum class NonceFailureType {
    U64ConvertError,
    U32ConvertError,
    CounterExpired,
    TimestampExpired,
    FillRandomError,
    InvalidLength,
    KindMismatch
};
enum class AuditFailureType {
    AuditBuffersFull,
    FlushingLogFull,
    IOError,
    JoinError
};
enum class SecretFailureType {
    SerializationError,
    CryptoError,
    LockPoisoned,
    InvalidLength,
    NonceError,
    AuditError,
    ProtectedMemory,
    NotPersistable
};
enum class NoiseFailureType {
    CipherState,
    CryptoError,
    NonceError,
    SecretError,
    HandshakeComplete,
    RemoteStaticMissing,
    LocalStaticMissing,
    LocalEphemeralMissing,
    RemoteEphemeralMissing,
    BothKeysMissing,
    LocalEphemeralExists,
    RemoteEphemeralExists,
    RemoteStaticExists,
    InvalidKeyLength,
    BufferTooSmall,
    MessageTooLong,
    InvalidMessage,
    PskMissing
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure HexError(std::string msg) {
        return {CryptoFailureType::HexError, std::move(msg)};
    }
    static CryptoFailure Argon2Error(std::string msg) {
        return {CryptoFailureType::Argon2Error, std::move(msg)};
    }
    static CryptoFailure InvalidKeyLength(std::string msg) {
        return {CryptoFailureType::InvalidKeyLength, std::move(msg)};
    }
    static CryptoFailure OsRngError(std::string msg) {
        return {CryptoFailureType::OsRngError, std::move(msg)};
    }
    static CryptoFailure DestTooSmall(std::string msg) {
        return {CryptoFailureType::DestTooSmall, std::move(msg)};
    }
    static CryptoFailure HkdfExpandTooLong(std::string msg) {
        return {CryptoFailureType::HkdfExpandTooLong, std::move(msg)};
    }
    static CryptoFailure EncryptionError(std::string msg) {
        return {CryptoFailureType::EncryptionError, std::move(msg)};
    }
    static CryptoFailure DecryptionError(std::string msg) {
        return {CryptoFailureType::DecryptionError, std::move(msg)};
    }
    static CryptoFailure DigestError(std::string msg) {
        return {CryptoFailureType::DigestError, std::move(msg)};
    }
    static CryptoFailure FromSodiumFailure(const SodiumFailure& sf) {
        return {CryptoFailureType::OsRngError, sf.message};
    }
};
class NonceFailure {
public:
    NonceFailureType type;
    std::string message;
    NonceFailure(const NonceFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static NonceFailure U64ConvertError(std::string msg) {
        return {NonceFailureType::U64ConvertError, std::move(msg)};
    }
    static NonceFailure U32ConvertError(std::string msg) {
        return {NonceFailureType::U32ConvertError, std::move(msg)};
    }
    static NonceFailure CounterExpired(std::string msg) {
        return {NonceFailureType::CounterExpired, std::move(msg)};
    }
    static NonceFailure TimestampExpired(std::string msg) {
        return {NonceFailureType::TimestampExpired, std::move(msg)};
    }
    static NonceFailure FillRandomError(std::string msg) {
        return {NonceFailureType::FillRandomError, std::move(msg)};
    }
    static NonceFailure InvalidLength(std::string msg) {
        return {NonceFailureType::InvalidLength, std::move(msg)};
    }
    static NonceFailure KindMismatch(std::string msg) {
        return {NonceFailureType::KindMismatch, std::move(msg)};
    }
};
class AuditFailure {
public:
    AuditFailureType type;
    std::string message;
    AuditFailure(const AuditFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static AuditFailure AuditBuffersFull(std::string msg) {
        return {AuditFailureType::AuditBuffersFull, std::move(msg)};
    }
    static AuditFailure FlushingLogFull(std::string msg) {
        return {AuditFailureType::FlushingLogFull, std::move(msg)};
    }
    static AuditFailure IOError(std::string msg) {
        return {AuditFailureType::IOError, std::move(msg)};
    }
    static AuditFailure JoinError(std::string msg) {
        return {AuditFailureType::JoinError, std::move(msg)};
    }
};
class SecretFailure {
public:
    using Cause = std::variant<std::monostate, CryptoFailureType, NonceFailureType, AuditFailureType>;
    SecretFailureType type;
    std::string message;
    Cause cause;
    SecretFailure(const SecretFailureType t, std::string msg, Cause c = {})
        : type(t), message(std::move(msg)), cause(c) {}
    static SecretFailure SerializationError(std::string msg) {
        return {SecretFailureType::SerializationError, std::move(msg)};
    }
    static SecretFailure LockPoisoned(std::string msg) {
        return {SecretFailureType::LockPoisoned, std::move(msg)};
    }
    static SecretFailure InvalidLength(std::string msg) {
        return {SecretFailureType::InvalidLength, std::move(msg)};
    }
    static SecretFailure ProtectedMemory(std::string msg) {
        return {SecretFailureType::ProtectedMemory, std::move(msg)};
    }
    static SecretFailure NotPersistable(std::string msg) {
        return {SecretFailureType::NotPersistable, std::move(msg)};
    }
    static SecretFailure FromCrypto(const CryptoFailure& cf) {
        return {SecretFailureType::CryptoError, cf.message, cf.type};
    }
    static SecretFailure FromNonce(const NonceFailure& nf) {
        return {SecretFailureType::NonceError, nf.message, nf.type};
    }
    static SecretFailure FromAudit(const AuditFailure& af) {
        return {SecretFailureType::AuditError, af.message, af.type};
    }
    static SecretFailure FromSodiumFailure(const SodiumFailure& sf) {
        return {SecretFailureType::ProtectedMemory, sf.message};
    }
    [[nodiscard]] bool IsNonce(const NonceFailureType t) const {
        const auto* nonce_type = std::get_if<NonceFailureType>(&cause);
        return nonce_type != nullptr && *nonce_type == t;
    }
    [[nodiscard]] bool IsCrypto(const CryptoFailureType t) const {
        const auto* crypto_type = std::get_if<CryptoFailureType>(&cause);
        return crypto_type != nullptr && *crypto_type == t;
    }
};
class NoiseFailure {
public:
    using Cause = std::variant<std::monostate, CryptoFailureType, NonceFailureType, SecretFailureType>;
    NoiseFailureType type;
    std::string message;
    Cause cause;
    NoiseFailure(const NoiseFailureType t, std::string msg, Cause c = {})
        : type(t), message(std::move(msg)), cause(c) {}
    static NoiseFailure CipherState(std::string msg) {
        return {NoiseFailureType::CipherState, std::move(msg)};
    }
    static NoiseFailure HandshakeComplete(std::string msg) {
        return {NoiseFailureType::HandshakeComplete, std::move(msg)};
    }
    static NoiseFailure RemoteStaticMissing(std::string msg) {
        return {NoiseFailureType::RemoteStaticMissing, std::move(msg)};
    }
    static NoiseFailure LocalStaticMissing(std::string msg) {
        return {NoiseFailureType::LocalStaticMissing, std::move(msg)};
    }
    static NoiseFailure LocalEphemeralMissing(std::string msg) {
        return {NoiseFailureType::LocalEphemeralMissing, std::move(msg)};
    }
    static NoiseFailure RemoteEphemeralMissing(std::string msg) {
        return {NoiseFailureType::RemoteEphemeralMissing, std::move(msg)};
    }
    static NoiseFailure BothKeysMissing(std::string msg) {
        return {NoiseFailureType::BothKeysMissing, std::move(msg)};
    }
    static NoiseFailure LocalEphemeralExists(std::string msg) {
        return {NoiseFailureType::LocalEphemeralExists, std::move(msg)};
    }
    static NoiseFailure RemoteEphemeralExists(std::string msg) {
        return {NoiseFailureType::RemoteEphemeralExists, std::move(msg)};
    }
    static NoiseFailure RemoteStaticExists(std::string msg) {
        return {NoiseFailureType::RemoteStaticExists, std::move(msg)};
    }
    static NoiseFailure InvalidKeyLength(std::string msg) {
        return {NoiseFailureType::InvalidKeyLength, std::move(msg)};
    }
    static NoiseFailure BufferTooSmall(std::string msg) {
        return {NoiseFailureType::BufferTooSmall, std::move(msg)};
    }
    static NoiseFailure MessageTooLong(std::string msg) {
        return {NoiseFailureType::MessageTooLong, std::move(msg)};
    }
    static NoiseFailure InvalidMessage(std::string msg) {
        return {NoiseFailureType::InvalidMessage, std::move(msg)};
    }
    static NoiseFailure PskMissing(std::string msg) {
        return {NoiseFailureType::PskMissing, std::move(msg)};
    }
    static NoiseFailure FromCrypto(const CryptoFailure& cf) {
        return {NoiseFailureType::CryptoError, cf.message, cf.type};
    }
    static NoiseFailure FromNonce(const NonceFailure& nf) {
        return {NoiseFailureType::NonceError, nf.message, nf.type};
    }
    static NoiseFailure FromSecret(const SecretFailure& sf) {
        if (const auto* crypto_type = std::get_if<CryptoFailureType>(&sf.cause)) {
            return {NoiseFailureType::CryptoError, sf.message, *crypto_type};
        }
        if (const auto* nonce_type = std::get_if<NonceFailureType>(&sf.cause)) {
            return {NoiseFailureType::NonceError, sf.message, *nonce_type};
        }
        return {NoiseFailureType::SecretError, sf.message, sf.type};
    }
    [[nodiscard]] bool IsNonce(const NonceFailureType t) const {
        const auto* nonce_type = std::get_if<NonceFailureType>(&cause);
        return nonce_type != nullptr && *nonce_type == t;
    }
    [[nodiscard]] bool IsCrypto(const CryptoFailureType t) const {
        const auto* crypto_type = std::get_if<CryptoFailureType>(&cause);
        return crypto_type != nullptr && *crypto_type == t;
    }
};
}
