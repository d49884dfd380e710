#pragma once
#include "alcove/vault/security_level.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace alcove::interfaces {
/**
 * Read-only view shared by every secret container. Access to the secret itself
 * goes through each container's typed With/WithMut.
 */
class ISecureContainer {
public:
    virtual ~ISecureContainer() = default;
    [[nodiscard]] virtual std::string_view Tag() const = 0;
    [[nodiscard]] virtual uint64_t AccessCount() const = 0;
    /** Size of the stored (serialized) form in bytes. */
    [[nodiscard]] virtual size_t Len() const = 0;
    [[nodiscard]] virtual vault::SecurityLevel GetSecurityLevel() const = 0;
};
}
