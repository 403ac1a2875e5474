#pragma once

#include "pakey/controller/prefixed_api_key_controller.hpp"
#include "pakey/configuration/key_format_config.hpp"
#include "pakey/core/constants.hpp"
#include "pakey/core/option.hpp"
#include "pakey/crypto/digests.hpp"
#include "pakey/crypto/random_sources.hpp"
#include "pakey/crypto/token_alphabet.hpp"
#include "pakey/debug/key_logger.hpp"

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

namespace pakey::controller {

/**
 * @brief Accumulates controller configuration and validates it
 *
 * Every setter works on lvalues (returns a reference) and on temporaries
 * (returns the builder by value), so both styles chain:
 *
 * ```cpp
 * auto controller = PakControllerOsSha256::Configure()
 *     .Prefix("mycompany")
 *     .SeamDefaults()
 *     .Finalize();
 *
 * auto builder = PakControllerOsSha256::Configure();
 * builder.Prefix("mycompany").RngOs().DigestSha256();
 * auto controller2 = std::move(builder).Finalize();
 * ```
 *
 * Token lengths start at KeyFormatConfig::Default(). Prefix, random source
 * and digest have no default.
 */
template<typename R, typename D>
class ControllerBuilder {
public:
    using Controller = PrefixedApiKeyController<R, D>;

    ControllerBuilder() = default;

    // ========================================================================
    // Required fields
    // ========================================================================

    /// Name of the issuing company or service. Must be non-empty and must not contain '_'.
    ControllerBuilder& Prefix(std::string prefix) & {
        prefix_ = std::move(prefix);
        return *this;
    }
    ControllerBuilder Prefix(std::string prefix) && {
        Prefix(std::move(prefix));
        return std::move(*this);
    }

    ControllerBuilder& RngSource(R rng) & {
        rng_ = std::move(rng);
        return *this;
    }
    ControllerBuilder RngSource(R rng) && {
        RngSource(std::move(rng));
        return std::move(*this);
    }

    ControllerBuilder& Digest(D digest) & {
        digest_ = std::move(digest);
        return *this;
    }
    ControllerBuilder Digest(D digest) && {
        Digest(std::move(digest));
        return std::move(*this);
    }

    // ========================================================================
    // Token format
    // ========================================================================

    ControllerBuilder& ShortTokenLength(const size_t length) & {
        short_token_length_ = length;
        return *this;
    }
    ControllerBuilder ShortTokenLength(const size_t length) && {
        ShortTokenLength(length);
        return std::move(*this);
    }

    ControllerBuilder& LongTokenLength(const size_t length) & {
        long_token_length_ = length;
        return *this;
    }
    ControllerBuilder LongTokenLength(const size_t length) && {
        LongTokenLength(length);
        return std::move(*this);
    }

    /**
     * @brief Fixed leading characters for every short token
     *
     * Must only use alphabet symbols. Keep it shorter than the short token
     * length or every key gets the same short token.
     */
    ControllerBuilder& ShortTokenPrefix(Option<std::string> short_token_prefix) & {
        short_token_prefix_ = std::move(short_token_prefix);
        return *this;
    }
    ControllerBuilder ShortTokenPrefix(Option<std::string> short_token_prefix) && {
        ShortTokenPrefix(std::move(short_token_prefix));
        return std::move(*this);
    }

    ControllerBuilder& Format(const configuration::KeyFormatConfig& config) & {
        short_token_length_ = config.GetShortTokenLength();
        long_token_length_ = config.GetLongTokenLength();
        return *this;
    }
    ControllerBuilder Format(const configuration::KeyFormatConfig& config) && {
        Format(config);
        return std::move(*this);
    }

    /// 8 / 24, the reference key format
    ControllerBuilder& DefaultLengths() & {
        return Format(configuration::KeyFormatConfig::Default());
    }
    ControllerBuilder DefaultLengths() && {
        DefaultLengths();
        return std::move(*this);
    }

    // ========================================================================
    // Capability helpers (only compile for matching R / D)
    // ========================================================================

    ControllerBuilder& RngOs() & {
        static_assert(std::is_same_v<R, crypto::SodiumRandomSource>,
                      "RngOs() requires R = SodiumRandomSource");
        return RngSource(R{});
    }
    ControllerBuilder RngOs() && {
        RngOs();
        return std::move(*this);
    }

    ControllerBuilder& RngOpenSsl() & {
        static_assert(std::is_same_v<R, crypto::OpenSslRandomSource>,
                      "RngOpenSsl() requires R = OpenSslRandomSource");
        return RngSource(R{});
    }
    ControllerBuilder RngOpenSsl() && {
        RngOpenSsl();
        return std::move(*this);
    }

    ControllerBuilder& DigestSha224() & {
        return DigestOf<crypto::Sha224Digest>();
    }
    ControllerBuilder DigestSha224() && {
        DigestSha224();
        return std::move(*this);
    }

    ControllerBuilder& DigestSha256() & {
        return DigestOf<crypto::Sha256Digest>();
    }
    ControllerBuilder DigestSha256() && {
        DigestSha256();
        return std::move(*this);
    }

    ControllerBuilder& DigestSha384() & {
        return DigestOf<crypto::Sha384Digest>();
    }
    ControllerBuilder DigestSha384() && {
        DigestSha384();
        return std::move(*this);
    }

    ControllerBuilder& DigestSha512() & {
        return DigestOf<crypto::Sha512Digest>();
    }
    ControllerBuilder DigestSha512() && {
        DigestSha512();
        return std::move(*this);
    }

    ControllerBuilder& DigestSha512_224() & {
        return DigestOf<crypto::Sha512_224Digest>();
    }
    ControllerBuilder DigestSha512_224() && {
        DigestSha512_224();
        return std::move(*this);
    }

    ControllerBuilder& DigestSha512_256() & {
        return DigestOf<crypto::Sha512_256Digest>();
    }
    ControllerBuilder DigestSha512_256() && {
        DigestSha512_256();
        return std::move(*this);
    }

    /// OS randomness, SHA-256 and 8 / 24 lengths in one call.
    ControllerBuilder& SeamDefaults() & {
        static_assert(std::is_same_v<R, crypto::SodiumRandomSource> &&
                      std::is_same_v<D, crypto::Sha256Digest>,
                      "SeamDefaults() requires SodiumRandomSource and Sha256Digest");
        RngOs();
        DigestSha256();
        return DefaultLengths();
    }
    ControllerBuilder SeamDefaults() && {
        SeamDefaults();
        return std::move(*this);
    }

    // ========================================================================
    // Finalization
    // ========================================================================

    /**
     * @brief Validate and build the controller
     *
     * Checks run in a fixed order and the first problem is returned:
     * prefix (missing/empty, then separator), random source, digest,
     * short length, long length, short-token prefix.
     */
    [[nodiscard]] Result<Controller, BuilderFailure> Finalize() && {
        auto validation = Validate();
        if (validation.has_value()) {
            debug::LogBuilderRejected(validation->message);
            return Result<Controller, BuilderFailure>::Err(std::move(*validation));
        }

        debug::LogControllerCreated(
            *prefix_, short_token_length_, long_token_length_, rng_->Name(), digest_->Name());
        return Result<Controller, BuilderFailure>::Ok(Controller(
            std::move(*prefix_),
            std::move(*rng_),
            std::move(*digest_),
            std::move(short_token_prefix_),
            short_token_length_,
            long_token_length_));
    }

private:
    template<typename Expected>
    ControllerBuilder& DigestOf() {
        static_assert(std::is_same_v<D, Expected>,
                      "digest helper does not match the builder's digest type");
        return Digest(D{});
    }

    Option<BuilderFailure> Validate() const {
        if (!prefix_.has_value() || prefix_->empty()) {
            return BuilderFailure::MissingPrefix();
        }
        if (prefix_->find(Constants::SEPARATOR) != std::string::npos) {
            return BuilderFailure::InvalidPrefix(
                "prefix must not contain '" + std::string(1, Constants::SEPARATOR) + "'");
        }
        if (!rng_.has_value()) {
            return BuilderFailure::MissingRng();
        }
        if (!digest_.has_value()) {
            return BuilderFailure::MissingDigest();
        }
        if (short_token_length_ == 0) {
            return BuilderFailure::InvalidShortTokenLength();
        }
        if (long_token_length_ == 0) {
            return BuilderFailure::InvalidLongTokenLength();
        }
        if (short_token_prefix_.has_value() &&
            !crypto::TokenAlphabet::IsValidToken(*short_token_prefix_)) {
            return BuilderFailure::InvalidShortTokenPrefix(
                "short token prefix must only use base58 alphabet symbols");
        }
        return None<BuilderFailure>();
    }

    Option<std::string> prefix_;
    Option<R> rng_;
    Option<D> digest_;
    Option<std::string> short_token_prefix_;
    size_t short_token_length_ = KeyFormatConstants::DEFAULT_SHORT_TOKEN_LENGTH;
    size_t long_token_length_ = KeyFormatConstants::DEFAULT_LONG_TOKEN_LENGTH;
};

template<typename R, typename D>
ControllerBuilder<R, D> PrefixedApiKeyController<R, D>::Configure() {
    return ControllerBuilder<R, D>();
}

} // namespace pakey::controller
