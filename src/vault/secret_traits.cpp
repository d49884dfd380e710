#include "alcove/vault/secret_traits.hpp"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/reflection.h>

namespace alcove::vault {

    Result<std::vector<uint8_t>, SecretFailure> SecretTraits<std::vector<uint8_t>>::Serialize(
        const std::vector<uint8_t>& value) {
        return Result<std::vector<uint8_t>, SecretFailure>::Ok(value);
    }

    Result<std::vector<uint8_t>, SecretFailure> SecretTraits<std::vector<uint8_t>>::Deserialize(
        std::span<const uint8_t> bytes) {
        return Result<std::vector<uint8_t>, SecretFailure>::Ok(
            std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }

    void SecretTraits<std::vector<uint8_t>>::Zeroize(std::vector<uint8_t>& value) noexcept {
        if (!value.empty()) {
            sodium_memzero(value.data(), value.size());
        }
        value.clear();
    }

    Result<std::vector<uint8_t>, SecretFailure> SecretTraits<std::string>::Serialize(const std::string& value) {
        return Result<std::vector<uint8_t>, SecretFailure>::Ok(
            std::vector<uint8_t>(value.begin(), value.end()));
    }

    Result<std::string, SecretFailure> SecretTraits<std::string>::Deserialize(std::span<const uint8_t> bytes) {
        return Result<std::string, SecretFailure>::Ok(std::string(bytes.begin(), bytes.end()));
    }

    void SecretTraits<std::string>::Zeroize(std::string& value) noexcept {
        if (!value.empty()) {
            sodium_memzero(value.data(), value.size());
        }
        value.clear();
    }

    namespace detail {
        void ZeroizeMessage(google::protobuf::Message& message) noexcept {
            const auto* descriptor = message.GetDescriptor();
            const auto* reflection = message.GetReflection();
            for (int i = 0; i < descriptor->field_count(); ++i) {
                const auto* field = descriptor->field(i);
                if (field->is_repeated() || !reflection->HasField(message, field)) {
                    continue;
                }
                if (field->cpp_type() == google::protobuf::FieldDescriptor::CPPTYPE_STRING) {
                    const std::string& current = reflection->GetStringReference(message, field, nullptr);
                    reflection->SetString(&message, field, std::string(current.size(), '\0'));
                } else if (field->cpp_type() == google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE) {
                    ZeroizeMessage(*reflection->MutableMessage(&message, field));
                }
            }
            message.Clear();
        }
    }

}
