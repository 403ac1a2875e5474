#include "pakey/crypto/token_alphabet.hpp"
#include "pakey/crypto/sodium_interop.hpp"
#include "pakey/core/constants.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace pakey::crypto {

bool TokenAlphabet::Contains(const char symbol) noexcept {
    return Constants::TOKEN_ALPHABET.find(symbol) != std::string_view::npos;
}

bool TokenAlphabet::IsValidToken(std::string_view token) noexcept {
    return std::all_of(token.begin(), token.end(), [](const char c) {
        return Contains(c);
    });
}

Result<std::string, CryptoFailure> TokenAlphabet::Sample(
    const interfaces::IRandomSource& source,
    const size_t length) {

    std::string token;
    token.reserve(length);
    std::vector<uint8_t> buffer;
    size_t rejected_batches = 0;

    while (token.size() < length) {
        if (rejected_batches == KeyFormatConstants::MAX_REJECTED_BATCHES) {
            return Result<std::string, CryptoFailure>::Err(
                CryptoFailure::RandomSourceFailed(
                    std::string(ErrorMessages::SAMPLING_STALLED)));
        }

        const size_t remaining = length - token.size();
        // ~10% of candidates are rejected, over-request a little
        const size_t batch = std::min(
            KeyFormatConstants::MAX_SAMPLE_BATCH,
            remaining + remaining / 8 + 1);
        buffer.assign(batch, 0);

        auto fill_result = source.Fill(buffer);
        if (fill_result.IsErr()) {
            SodiumInterop::SecureWipe(buffer);
            return Result<std::string, CryptoFailure>::Err(
                std::move(fill_result).UnwrapErr());
        }

        const size_t accepted_before = token.size();
        for (const uint8_t byte : buffer) {
            const uint8_t candidate = byte & Constants::SYMBOL_MASK;
            if (candidate >= Constants::TOKEN_ALPHABET_SIZE) {
                continue;
            }
            token.push_back(Constants::TOKEN_ALPHABET[candidate]);
            if (token.size() == length) {
                break;
            }
        }
        SodiumInterop::SecureWipe(buffer);
        rejected_batches = token.size() == accepted_before ? rejected_batches + 1 : 0;
    }

    return Result<std::string, CryptoFailure>::Ok(std::move(token));
}

} // namespace pakey::crypto
