#pragma once
#include "pakey/core/result.hpp"
#include "pakey/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string_view>
namespace pakey::interfaces {
using pakey::Result;
using pakey::Unit;
using pakey::CryptoFailure;
/// Cryptographically secure entropy supplier.
///
/// Implementations are held by value inside a controller and copied along
/// with it, so they must be copyable and Fill must be safe to call
/// concurrently on the same instance.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    [[nodiscard]] virtual Result<Unit, CryptoFailure> Fill(std::span<uint8_t> buffer) const = 0;
    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
};
}
