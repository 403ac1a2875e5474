#include "pakey/crypto/sodium_interop.hpp"

#include <string>

namespace pakey::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, CryptoFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < 0) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, CryptoFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Comparison and Encoding
// ============================================================================

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    // Different sizes are never equal
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS;
}

Result<std::string, CryptoFailure> SodiumInterop::ToHex(std::span<const uint8_t> data) {
    // sodium_bin2hex writes a trailing NUL
    std::string hex(data.size() * 2 + 1, '\0');
    if (sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size()) == nullptr) {
        return Result<std::string, CryptoFailure>::Err(
            CryptoFailure::EncodingFailed(std::string(ErrorMessages::HEX_ENCODING_FAILED)));
    }
    hex.pop_back();
    return Result<std::string, CryptoFailure>::Ok(std::move(hex));
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, CryptoFailure> SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

} // namespace pakey::crypto
