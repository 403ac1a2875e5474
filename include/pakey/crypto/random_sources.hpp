#pragma once

#include "pakey/interfaces/i_random_source.hpp"

#include <span>
#include <string_view>

namespace pakey::crypto {

using interfaces::IRandomSource;

/**
 * @brief OS entropy through libsodium's randombytes_buf
 *
 * Initializes libsodium on first use. Only a failed sodium_init() makes it
 * fail (CryptoFailureType::InitializationFailed), so the non-Try
 * generation entry points are safe to use.
 */
class SodiumRandomSource final : public IRandomSource {
public:
    SodiumRandomSource() = default;

    [[nodiscard]] Result<Unit, CryptoFailure> Fill(std::span<uint8_t> buffer) const override;

    [[nodiscard]] std::string_view Name() const noexcept override {
        return "osrng";
    }
};

/**
 * @brief OpenSSL's default DRBG through RAND_bytes
 *
 * RAND_bytes reports seeding failures, which surface as
 * CryptoFailureType::RandomSourceFailed. Use the Try* entry points.
 */
class OpenSslRandomSource final : public IRandomSource {
public:
    OpenSslRandomSource() = default;

    [[nodiscard]] Result<Unit, CryptoFailure> Fill(std::span<uint8_t> buffer) const override;

    [[nodiscard]] std::string_view Name() const noexcept override {
        return "openssl";
    }
};

} // namespace pakey::crypto
