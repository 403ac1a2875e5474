#pragma once
#include "pakey/core/result.hpp"
#include "pakey/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace pakey::interfaces {
using pakey::Result;
using pakey::CryptoFailure;
/// Fixed-size cryptographic hash. Compute is one-shot, so no state is
/// carried between calls.
class IDigestAlgorithm {
public:
    virtual ~IDigestAlgorithm() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, CryptoFailure> Compute(
        std::span<const uint8_t> data) const = 0;
    [[nodiscard]] virtual size_t OutputSize() const noexcept = 0;
    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
};
}
