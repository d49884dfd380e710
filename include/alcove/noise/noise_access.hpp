#pragma once
#include "alcove/core/failures.hpp"
#include "alcove/core/result.hpp"

namespace alcove::noise {

/**
 * @brief Collapses the result of a crypto call made inside an audited secret access
 */
template<typename T>
Result<T, NoiseFailure> FlattenAccess(Result<Result<T, CryptoFailure>, SecretFailure> outcome) {
    if (outcome.IsErr()) {
        return Result<T, NoiseFailure>::Err(NoiseFailure::FromSecret(outcome.UnwrapErr()));
    }
    auto& inner = outcome.Unwrap();
    if (inner.IsErr()) {
        return Result<T, NoiseFailure>::Err(NoiseFailure::FromCrypto(inner.UnwrapErr()));
    }
    return Result<T, NoiseFailure>::Ok(std::move(inner).Unwrap());
}

}  // namespace alcove::noise
