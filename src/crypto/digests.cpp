#include "pakey/crypto/digests.hpp"
#include "pakey/core/constants.hpp"
#include "pakey/core/format.hpp"
#include "openssl_internal.hpp"

#include <openssl/evp.h>
#include <memory>
#include <string>

namespace pakey::crypto {
using OpenSSL = OpenSSLConstants;
using detail::GetOpenSSLError;
namespace {
    struct EVP_MD_CTX_Deleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
        }
    };
    using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
    const EVP_MD* ResolveMd(const EvpAlgorithm algorithm) {
        switch (algorithm) {
            case EvpAlgorithm::Sha224: return EVP_sha224();
            case EvpAlgorithm::Sha384: return EVP_sha384();
            case EvpAlgorithm::Sha512_224: return EVP_sha512_224();
            case EvpAlgorithm::Sha512_256: return EVP_sha512_256();
        }
        return nullptr;
    }
}

Result<std::vector<uint8_t>, CryptoFailure> Sha256Digest::Compute(
    std::span<const uint8_t> data) const {
    std::vector<uint8_t> out(crypto_hash_sha256_BYTES);
    if (crypto_hash_sha256(out.data(), data.data(), data.size()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                std::string(ErrorMessages::DIGEST_COMPUTE_FAILED) + ": sha256"));
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(out));
}

Result<std::vector<uint8_t>, CryptoFailure> Sha512Digest::Compute(
    std::span<const uint8_t> data) const {
    std::vector<uint8_t> out(crypto_hash_sha512_BYTES);
    if (crypto_hash_sha512(out.data(), data.data(), data.size()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                std::string(ErrorMessages::DIGEST_COMPUTE_FAILED) + ": sha512"));
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(out));
}

Result<std::vector<uint8_t>, CryptoFailure> EvpDigest::Compute(
    std::span<const uint8_t> data) const {
    const EVP_MD* md = ResolveMd(algorithm_);
    if (md == nullptr) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                compat::format("Unsupported EVP digest: {}", Name())));
    }
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                compat::format("{}: {}", ErrorMessages::DIGEST_CONTEXT_FAILED, GetOpenSSLError())));
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                compat::format("Failed to initialize {}: {}", Name(), GetOpenSSLError())));
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                compat::format("{} update failed: {}", Name(), GetOpenSSLError())));
    }
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::DigestFailed(
                compat::format("{} finalization failed: {}", Name(), GetOpenSSLError())));
    }
    out.resize(out_len);
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(out));
}

size_t EvpDigest::OutputSize() const noexcept {
    const EVP_MD* md = ResolveMd(algorithm_);
    if (md == nullptr) {
        return 0;
    }
    return static_cast<size_t>(EVP_MD_get_size(md));
}

std::string_view EvpDigest::Name() const noexcept {
    switch (algorithm_) {
        case EvpAlgorithm::Sha224: return "sha224";
        case EvpAlgorithm::Sha384: return "sha384";
        case EvpAlgorithm::Sha512_224: return "sha512_224";
        case EvpAlgorithm::Sha512_256: return "sha512_256";
    }
    return "unknown";
}

} // namespace pakey::crypto
