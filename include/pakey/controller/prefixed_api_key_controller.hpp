#pragma once

#include "pakey/core/result.hpp"
#include "pakey/core/option.hpp"
#include "pakey/core/failures.hpp"
#include "pakey/crypto/sodium_interop.hpp"
#include "pakey/crypto/token_alphabet.hpp"
#include "pakey/debug/key_logger.hpp"
#include "pakey/interfaces/i_digest_algorithm.hpp"
#include "pakey/interfaces/i_random_source.hpp"
#include "pakey/models/prefixed_api_key.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pakey::controller {

using models::PrefixedApiKey;

template<typename R, typename D>
class ControllerBuilder;

/**
 * @brief Generates prefixed API keys and verifies long-token hashes
 *
 * Owns its random source and digest by value. Every operation is const and
 * keeps no state between calls, so one controller can serve many callers;
 * concurrent generation is as safe as R::Fill is (both built-in sources are
 * thread-safe).
 *
 * Only ControllerBuilder::Finalize() creates controllers.
 *
 * @tparam R Random source, derived from IRandomSource and copyable
 * @tparam D Digest algorithm, derived from IDigestAlgorithm and copyable
 */
template<typename R, typename D>
class PrefixedApiKeyController {
    static_assert(std::is_base_of_v<interfaces::IRandomSource, R>,
                  "R must implement IRandomSource");
    static_assert(std::is_copy_constructible_v<R>,
                  "R must be copyable so the controller can own an instance");
    static_assert(std::is_base_of_v<interfaces::IDigestAlgorithm, D>,
                  "D must implement IDigestAlgorithm");
    static_assert(std::is_copy_constructible_v<D>,
                  "D must be copyable so the controller can own an instance");

public:
    using KeyAndHash = std::pair<PrefixedApiKey, std::string>;

    /// Entry point of the builder chain.
    [[nodiscard]] static ControllerBuilder<R, D> Configure();

    PrefixedApiKeyController(const PrefixedApiKeyController&) = default;
    PrefixedApiKeyController(PrefixedApiKeyController&&) noexcept = default;
    PrefixedApiKeyController& operator=(const PrefixedApiKeyController&) = default;
    PrefixedApiKeyController& operator=(PrefixedApiKeyController&&) noexcept = default;
    ~PrefixedApiKeyController() = default;

    // ========================================================================
    // Generation
    // ========================================================================

    /**
     * @brief Generate a new key
     *
     * Both tokens are drawn uniformly from the base58 alphabet. With a
     * short-token prefix configured the short token is the prefix followed
     * by random symbols, cut to short_token_length.
     *
     * @return Err(RngFailure) if the random source fails; nothing is retried
     */
    [[nodiscard]] Result<PrefixedApiKey, GenerationFailure> TryGenerateKey() const {
        auto short_result = crypto::TokenAlphabet::Sample(rng_, short_token_length_);
        if (short_result.IsErr()) {
            return RngError(std::move(short_result).UnwrapErr());
        }
        std::string short_token = std::move(short_result).Unwrap();
        if (short_token_prefix_.has_value()) {
            short_token = (*short_token_prefix_ + short_token).substr(0, short_token_length_);
        }

        auto long_result = crypto::TokenAlphabet::Sample(rng_, long_token_length_);
        if (long_result.IsErr()) {
            return RngError(std::move(long_result).UnwrapErr());
        }

        PrefixedApiKey key(prefix_, std::move(short_token), std::move(long_result).Unwrap());
        debug::LogKeyGenerated(key.GetPrefix(), key.GetShortToken(), key.GetLongToken());
        return Result<PrefixedApiKey, GenerationFailure>::Ok(std::move(key));
    }

    /**
     * @brief Generate a new key, assuming the random source cannot fail
     *
     * @throws std::runtime_error if it does. Use TryGenerateKey() with
     *         sources that can fail.
     */
    [[nodiscard]] PrefixedApiKey GenerateKey() const {
        return TryGenerateKey().Unwrap();
    }

    /**
     * @brief Generate a key together with the hash of its long token
     *
     * The hash is what a service persists; the key goes to the user.
     */
    [[nodiscard]] Result<KeyAndHash, GenerationFailure> TryGenerateKeyAndHash() const {
        auto key_result = TryGenerateKey();
        if (key_result.IsErr()) {
            return Result<KeyAndHash, GenerationFailure>::Err(std::move(key_result).UnwrapErr());
        }
        PrefixedApiKey key = std::move(key_result).Unwrap();
        auto hash_result = LongTokenHashed(key);
        if (hash_result.IsErr()) {
            return Result<KeyAndHash, GenerationFailure>::Err(std::move(hash_result).UnwrapErr());
        }
        return Result<KeyAndHash, GenerationFailure>::Ok(
            std::make_pair(std::move(key), std::move(hash_result).Unwrap()));
    }

    /// @throws std::runtime_error if the random source or digest fails
    [[nodiscard]] KeyAndHash GenerateKeyAndHash() const {
        return TryGenerateKeyAndHash().Unwrap();
    }

    // ========================================================================
    // Hashing / Verification
    // ========================================================================

    /// Lowercase hex digest of the key's long token with this controller's digest.
    [[nodiscard]] Result<std::string, GenerationFailure> LongTokenHashed(
        const PrefixedApiKey& key) const {
        auto hash_result = key.LongTokenHashed(digest_);
        if (hash_result.IsErr()) {
            const CryptoFailure failure = std::move(hash_result).UnwrapErr();
            debug::LogCapabilityFailure(digest_.Name(), failure.message);
            return Result<std::string, GenerationFailure>::Err(
                GenerationFailure::DigestFailure(failure.message));
        }
        debug::LogLongTokenHash(digest_.Name(), hash_result.Unwrap());
        return Result<std::string, GenerationFailure>::Ok(std::move(hash_result).Unwrap());
    }

    /**
     * @brief Check a key's long token against a stored hash
     *
     * Prefix and short token are not inspected; callers locate the stored
     * hash by short token first. A long token whose length differs from
     * long_token_length or that leaves the alphabet is rejected without
     * hashing. The comparison itself is constant-time.
     *
     * @return Ok(match) or Err(DigestFailure)
     */
    [[nodiscard]] Result<bool, GenerationFailure> TryCheckHash(
        const PrefixedApiKey& key, std::string_view expected_hash) const {
        const std::string& long_token = key.GetLongToken();
        if (long_token.size() != long_token_length_) {
            debug::LogCheckRejected(key.GetShortToken(), "long token length mismatch");
            return Result<bool, GenerationFailure>::Ok(false);
        }
        if (!crypto::TokenAlphabet::IsValidToken(long_token)) {
            debug::LogCheckRejected(key.GetShortToken(), "long token outside alphabet");
            return Result<bool, GenerationFailure>::Ok(false);
        }

        auto hash_result = LongTokenHashed(key);
        if (hash_result.IsErr()) {
            return Result<bool, GenerationFailure>::Err(std::move(hash_result).UnwrapErr());
        }
        const std::string& actual = hash_result.Unwrap();
        const bool matched = crypto::SodiumInterop::ConstantTimeEquals(
            AsBytes(actual), AsBytes(expected_hash));
        debug::LogHashCheck(key.GetShortToken(), matched);
        return Result<bool, GenerationFailure>::Ok(matched);
    }

    /// TryCheckHash with a digest failure counted as a mismatch.
    [[nodiscard]] bool CheckHash(const PrefixedApiKey& key, std::string_view expected_hash) const {
        auto result = TryCheckHash(key, expected_hash);
        if (result.IsErr()) {
            debug::LogCheckRejected(key.GetShortToken(), result.UnwrapErr().message);
            return false;
        }
        return result.Unwrap();
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const std::string& GetPrefix() const noexcept {
        return prefix_;
    }
    [[nodiscard]] const Option<std::string>& GetShortTokenPrefix() const noexcept {
        return short_token_prefix_;
    }
    [[nodiscard]] size_t GetShortTokenLength() const noexcept {
        return short_token_length_;
    }
    [[nodiscard]] size_t GetLongTokenLength() const noexcept {
        return long_token_length_;
    }
    [[nodiscard]] const R& GetRandomSource() const noexcept {
        return rng_;
    }
    [[nodiscard]] const D& GetDigest() const noexcept {
        return digest_;
    }

private:
    friend class ControllerBuilder<R, D>;

    PrefixedApiKeyController(
        std::string prefix,
        R rng,
        D digest,
        Option<std::string> short_token_prefix,
        const size_t short_token_length,
        const size_t long_token_length)
        : prefix_(std::move(prefix))
        , rng_(std::move(rng))
        , digest_(std::move(digest))
        , short_token_prefix_(std::move(short_token_prefix))
        , short_token_length_(short_token_length)
        , long_token_length_(long_token_length) {}

    static Result<PrefixedApiKey, GenerationFailure> RngError(const CryptoFailure& failure) {
        debug::LogCapabilityFailure("rng", failure.message);
        return Result<PrefixedApiKey, GenerationFailure>::Err(
            GenerationFailure::RngFailure(failure.message));
    }

    static std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    std::string prefix_;
    R rng_;
    D digest_;
    Option<std::string> short_token_prefix_;
    size_t short_token_length_;
    size_t long_token_length_;
};

} // namespace pakey::controller

#include "pakey/controller/controller_builder.hpp"
