#pragma once

#include "pakey/core/result.hpp"
#include "pakey/core/failures.hpp"
#include "pakey/interfaces/i_random_source.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace pakey::crypto {

/**
 * @brief Base58 token alphabet and uniform symbol sampling
 *
 * The alphabet drops 0, O, I and l and contains nothing that needs URL
 * escaping or breaks double-click selection, so '_' can never appear in a
 * token.
 *
 * Sampling draws one byte per candidate symbol, keeps the low
 * Constants::SYMBOL_BITS bits and rejects values outside the alphabet.
 * Each accepted symbol is uniform over the 58 entries.
 */
class TokenAlphabet {
public:
    [[nodiscard]] static bool Contains(char symbol) noexcept;

    /// True when every character of token is an alphabet symbol.
    [[nodiscard]] static bool IsValidToken(std::string_view token) noexcept;

    /**
     * @brief Draw length symbols from source
     *
     * @return Err(RandomSourceFailed) as soon as the source fails; no retry.
     *         Also Err(RandomSourceFailed) after MAX_REJECTED_BATCHES
     *         consecutive batches without a single usable symbol.
     */
    static Result<std::string, CryptoFailure> Sample(
        const interfaces::IRandomSource& source,
        size_t length);

private:
    TokenAlphabet() = delete;
};

} // namespace pakey::crypto
