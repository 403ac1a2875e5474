#pragma once

#include "pakey/interfaces/i_digest_algorithm.hpp"

#include <sodium.h>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace pakey::crypto {

using interfaces::IDigestAlgorithm;

// ============================================================================
// libsodium digests
// ============================================================================

/// SHA-256 via crypto_hash_sha256. Default digest of the key format.
class Sha256Digest final : public IDigestAlgorithm {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, CryptoFailure> Compute(
        std::span<const uint8_t> data) const override;
    [[nodiscard]] size_t OutputSize() const noexcept override {
        return crypto_hash_sha256_BYTES;
    }
    [[nodiscard]] std::string_view Name() const noexcept override {
        return "sha256";
    }
};

/// SHA-512 via crypto_hash_sha512.
class Sha512Digest final : public IDigestAlgorithm {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, CryptoFailure> Compute(
        std::span<const uint8_t> data) const override;
    [[nodiscard]] size_t OutputSize() const noexcept override {
        return crypto_hash_sha512_BYTES;
    }
    [[nodiscard]] std::string_view Name() const noexcept override {
        return "sha512";
    }
};

// ============================================================================
// OpenSSL EVP digests
// ============================================================================

enum class EvpAlgorithm : uint8_t {
    Sha224,
    Sha384,
    Sha512_224,
    Sha512_256
};

/**
 * @brief SHA-2 family members libsodium does not ship, through OpenSSL EVP
 *
 * A fresh EVP_MD_CTX is created per Compute call, so a single instance can
 * be used from several threads.
 */
class EvpDigest : public IDigestAlgorithm {
public:
    explicit EvpDigest(EvpAlgorithm algorithm) noexcept
        : algorithm_(algorithm) {}

    [[nodiscard]] Result<std::vector<uint8_t>, CryptoFailure> Compute(
        std::span<const uint8_t> data) const override;
    [[nodiscard]] size_t OutputSize() const noexcept override;
    [[nodiscard]] std::string_view Name() const noexcept override;

    [[nodiscard]] EvpAlgorithm GetAlgorithm() const noexcept {
        return algorithm_;
    }

private:
    EvpAlgorithm algorithm_;
};

class Sha224Digest final : public EvpDigest {
public:
    Sha224Digest() noexcept : EvpDigest(EvpAlgorithm::Sha224) {}
};

class Sha384Digest final : public EvpDigest {
public:
    Sha384Digest() noexcept : EvpDigest(EvpAlgorithm::Sha384) {}
};

class Sha512_224Digest final : public EvpDigest {
public:
    Sha512_224Digest() noexcept : EvpDigest(EvpAlgorithm::Sha512_224) {}
};

class Sha512_256Digest final : public EvpDigest {
public:
    Sha512_256Digest() noexcept : EvpDigest(EvpAlgorithm::Sha512_256) {}
};

} // namespace pakey::crypto
