#pragma once

#include "pakey/core/constants.hpp"

#include <cmath>
#include <cstddef>

namespace pakey::configuration {

/// Token lengths for a key format
///
/// The defaults (8 short, 24 long) follow the reference key format: the
/// long token alone carries ~140 bits, above a random UUIDv4.
///
/// @example
/// ```cpp
/// auto controller = PakControllerOsSha256::Configure()
///     .Prefix("mycompany")
///     .RngOs()
///     .DigestSha256()
///     .Format(KeyFormatConfig::HighEntropy())
///     .Finalize();
/// ```
class KeyFormatConfig {
public:
    constexpr KeyFormatConfig(const size_t short_token_length, const size_t long_token_length) noexcept
        : short_token_length_(short_token_length)
        , long_token_length_(long_token_length) {}

    /// 8 / 24
    [[nodiscard]] static constexpr KeyFormatConfig Default() noexcept {
        return KeyFormatConfig(KeyFormatConstants::DEFAULT_SHORT_TOKEN_LENGTH,
                               KeyFormatConstants::DEFAULT_LONG_TOKEN_LENGTH);
    }

    /// 12 / 48, for keys that guard high-value resources
    [[nodiscard]] static constexpr KeyFormatConfig HighEntropy() noexcept {
        return KeyFormatConfig(KeyFormatConstants::HIGH_ENTROPY_SHORT_TOKEN_LENGTH,
                               KeyFormatConstants::HIGH_ENTROPY_LONG_TOKEN_LENGTH);
    }

    /// 6 / 22, still ~128 bits in the long token
    [[nodiscard]] static constexpr KeyFormatConfig Compact() noexcept {
        return KeyFormatConfig(KeyFormatConstants::COMPACT_SHORT_TOKEN_LENGTH,
                               KeyFormatConstants::COMPACT_LONG_TOKEN_LENGTH);
    }

    [[nodiscard]] constexpr size_t GetShortTokenLength() const noexcept {
        return short_token_length_;
    }

    [[nodiscard]] constexpr size_t GetLongTokenLength() const noexcept {
        return long_token_length_;
    }

    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return short_token_length_ > 0 && long_token_length_ > 0;
    }

    [[nodiscard]] double ShortTokenEntropyBits() const noexcept {
        return static_cast<double>(short_token_length_) * BitsPerSymbol();
    }

    [[nodiscard]] double LongTokenEntropyBits() const noexcept {
        return static_cast<double>(long_token_length_) * BitsPerSymbol();
    }

    [[nodiscard]] constexpr bool operator==(const KeyFormatConfig& other) const noexcept {
        return short_token_length_ == other.short_token_length_ &&
               long_token_length_ == other.long_token_length_;
    }

    [[nodiscard]] constexpr bool operator!=(const KeyFormatConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    static double BitsPerSymbol() noexcept {
        return std::log2(static_cast<double>(Constants::TOKEN_ALPHABET_SIZE));
    }

    size_t short_token_length_;
    size_t long_token_length_;
};

} // namespace pakey::configuration
