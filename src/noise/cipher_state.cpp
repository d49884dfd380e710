#include "alcove/noise/cipher_state.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <format>

namespace alcove::noise {
    using nonce::kNonceBytes;
    using nonce::MonotonicNonce;

    namespace {
        constexpr size_t kTagBytes = Constants::TAG_SIZE;

        Result<Unit, NoiseFailure> FromSecretOutcome(const Result<Unit, SecretFailure>& outcome) {
            if (outcome.IsErr()) {
                return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromSecret(outcome.UnwrapErr()));
            }
            return Result<Unit, NoiseFailure>::Ok(unit);
        }

        Result<Unit, NoiseFailure> CheckLength(const size_t length) {
            if (length > NoiseConstants::MAX_MESSAGE_LEN) {
                return Result<Unit, NoiseFailure>::Err(NoiseFailure::MessageTooLong(
                    std::format("Message of {} bytes exceeds {}", length, NoiseConstants::MAX_MESSAGE_LEN)));
            }
            return Result<Unit, NoiseFailure>::Ok(unit);
        }
    }

    CipherState::CipherState(std::shared_ptr<interfaces::IAuditSink> sink)
        : sink_(std::move(sink)) {
    }

    Result<Unit, NoiseFailure> CipherState::InitializeKey(
        std::span<uint8_t> key,
        std::string tag,
        const nonce::NonceContext& context) {
        auto fresh = MonotonicNonce::New(context, 0);
        if (fresh.IsErr()) {
            sodium_memzero(key.data(), key.size());
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromNonce(fresh.UnwrapErr()));
        }
        auto installed = CipherKey::FromSlice(key, std::move(tag), fresh.Unwrap(), sink_);
        if (installed.IsErr()) {
            sodium_memzero(key.data(), key.size());
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromSecret(installed.UnwrapErr()));
        }
        key_.emplace(std::move(installed).Unwrap());
        return Result<Unit, NoiseFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, NoiseFailure> CipherState::EncryptWithAd(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext) {
        if (!key_) {
            TRY(CheckLength(plaintext.size()));
            return Result<std::vector<uint8_t>, NoiseFailure>::Ok(
                std::vector<uint8_t>(plaintext.begin(), plaintext.end()));
        }
        TRY(CheckLength(plaintext.size() + kTagBytes + kNonceBytes));
        std::vector<uint8_t> packet(plaintext.size() + kTagBytes + kNonceBytes);
        nonce::NonceBytes used{};
        const std::span<uint8_t> sealed(packet.data(), plaintext.size() + kTagBytes);
        TRY(FromSecretOutcome(key_->Encrypt(sealed, plaintext, used, associated_data)));
        std::copy(used.begin(), used.end(), packet.begin() + static_cast<std::ptrdiff_t>(sealed.size()));
        return Result<std::vector<uint8_t>, NoiseFailure>::Ok(std::move(packet));
    }

    Result<std::vector<uint8_t>, NoiseFailure> CipherState::DecryptWithAd(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> packet) {
        TRY(CheckLength(packet.size()));
        if (!key_) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Ok(
                std::vector<uint8_t>(packet.begin(), packet.end()));
        }
        if (packet.size() < kTagBytes + kNonceBytes) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Err(NoiseFailure::InvalidMessage(
                std::format("Packet of {} bytes is shorter than tag and nonce", packet.size())));
        }
        const auto sealed = packet.first(packet.size() - kNonceBytes);
        const auto packet_nonce = packet.last(kNonceBytes);
        std::vector<uint8_t> plaintext(sealed.size() - kTagBytes);
        TRY(FromSecretOutcome(key_->Decrypt(plaintext, sealed, packet_nonce, associated_data)));
        if (auto advanced = key_->NextNonce(); advanced.IsErr()) {
            sodium_memzero(plaintext.data(), plaintext.size());
            return Result<std::vector<uint8_t>, NoiseFailure>::Err(NoiseFailure::FromSecret(advanced.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, NoiseFailure>::Ok(std::move(plaintext));
    }

    Result<Unit, NoiseFailure> CipherState::SetNonce(const uint64_t counter) {
        if (!key_) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::CipherState("No key installed"));
        }
        return FromSecretOutcome(key_->SetCounter(counter));
    }

    Result<Unit, NoiseFailure> CipherState::Rekey() {
        if (!key_) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::CipherState("No key installed"));
        }
        const MonotonicNonce current = key_->GetNonce();
        if (auto rotation = current.NeedsRotation(); rotation.IsErr()) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromNonce(rotation.UnwrapErr()));
        }
        auto max_nonce = MonotonicNonce::FromBytes(current.AsBytes(), current.CreatedAt());
        if (max_nonce.IsErr()) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromNonce(max_nonce.UnwrapErr()));
        }
        if (auto set = max_nonce.Unwrap().SetCounter(NoiseConstants::MAX_NONCE); set.IsErr()) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromNonce(set.UnwrapErr()));
        }

        const std::array<uint8_t, Constants::KEY_SIZE> zeros{};
        std::array<uint8_t, Constants::KEY_SIZE + kTagBytes> output{};
        auto encrypted = key_->EncryptWith(output, zeros, max_nonce.Unwrap().AsBytes(), {});
        if (encrypted.IsErr()) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromSecret(encrypted.UnwrapErr()));
        }
        auto rekeyed = CipherKey::FromSlice(
            std::span<uint8_t>(output.data(), Constants::KEY_SIZE), std::string(key_->Tag()), current, sink_);
        sodium_memzero(output.data(), output.size());
        if (rekeyed.IsErr()) {
            return Result<Unit, NoiseFailure>::Err(NoiseFailure::FromSecret(rekeyed.UnwrapErr()));
        }
        key_ = std::move(rekeyed).Unwrap();
        return Result<Unit, NoiseFailure>::Ok(unit);
    }

    std::optional<MonotonicNonce> CipherState::GetNonce() const {
        if (!key_) {
            return std::nullopt;
        }
        return key_->GetNonce();
    }

    Result<std::vector<uint8_t>, NoiseFailure> CipherState::Seal(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext) {
        if (!key_) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Ok(
                std::vector<uint8_t>(plaintext.begin(), plaintext.end()));
        }
        std::vector<uint8_t> ciphertext(plaintext.size() + kTagBytes);
        nonce::NonceBytes used{};
        TRY(FromSecretOutcome(key_->Encrypt(ciphertext, plaintext, used, associated_data)));
        return Result<std::vector<uint8_t>, NoiseFailure>::Ok(std::move(ciphertext));
    }

    Result<std::vector<uint8_t>, NoiseFailure> CipherState::Open(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> ciphertext) {
        if (!key_) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Ok(
                std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()));
        }
        if (ciphertext.size() < kTagBytes) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Err(NoiseFailure::InvalidMessage(
                std::format("Ciphertext of {} bytes is shorter than its tag", ciphertext.size())));
        }
        auto expected = key_->NextNonce();
        if (expected.IsErr()) {
            return Result<std::vector<uint8_t>, NoiseFailure>::Err(NoiseFailure::FromSecret(expected.UnwrapErr()));
        }
        std::vector<uint8_t> plaintext(ciphertext.size() - kTagBytes);
        TRY(FromSecretOutcome(key_->Decrypt(plaintext, ciphertext, expected.Unwrap(), associated_data)));
        return Result<std::vector<uint8_t>, NoiseFailure>::Ok(std::move(plaintext));
    }

}  // namespace alcove::noise
