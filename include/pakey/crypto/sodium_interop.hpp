#pragma once

#include "pakey/core/result.hpp"
#include "pakey/core/failures.hpp"
#include "pakey/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>

namespace pakey::crypto {

/**
 * @brief Interop layer for the libsodium primitives the key engine relies on
 *
 * Library initialisation, constant-time comparison, hex encoding,
 * OS-backed random bytes and buffer wiping.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, CryptoFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Comparison and Encoding
    // ========================================================================

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different sizes compare unequal without touching their
     * contents. Equal-sized buffers are compared with sodium_memcmp.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Lowercase hex encoding via sodium_bin2hex
     */
    static Result<std::string, CryptoFailure> ToHex(std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a buffer with bytes from the OS entropy source
     *
     * @return Err(InitializationFailed) if libsodium has not been initialized
     */
    static Result<Unit, CryptoFailure> FillRandom(std::span<uint8_t> buffer);

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the compiler cannot elide
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace pakey::crypto
