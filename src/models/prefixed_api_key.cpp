#include "pakey/models/prefixed_api_key.hpp"
#include "pakey/crypto/sodium_interop.hpp"
#include "pakey/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace pakey::models {
    PrefixedApiKey::PrefixedApiKey(std::string prefix, std::string short_token, std::string long_token)
        : prefix_(std::move(prefix))
          , short_token_(std::move(short_token))
          , long_token_(std::move(long_token)) {
    }

    Result<PrefixedApiKey, ParseFailure> PrefixedApiKey::FromString(const std::string_view pak_string) {
        std::array<std::string_view, Constants::COMPONENT_COUNT> parts;
        size_t count = 0;
        size_t start = 0;
        while (true) {
            const size_t pos = pak_string.find(Constants::SEPARATOR, start);
            const std::string_view part = pak_string.substr(
                start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
            if (count < parts.size()) {
                parts[count] = part;
            }
            ++count;
            if (pos == std::string_view::npos) {
                break;
            }
            start = pos + 1;
        }

        if (count != Constants::COMPONENT_COUNT) {
            return Result<PrefixedApiKey, ParseFailure>::Err(
                ParseFailure::WrongComponentCount(count));
        }
        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].empty()) {
                return Result<PrefixedApiKey, ParseFailure>::Err(
                    ParseFailure::EmptyComponent(i));
            }
        }

        return Result<PrefixedApiKey, ParseFailure>::Ok(PrefixedApiKey(
            std::string(parts[0]), std::string(parts[1]), std::string(parts[2])));
    }

    Result<PrefixedApiKey, ParseFailure> PrefixedApiKey::FromParts(
        const std::string_view prefix, const std::string_view short_token, const std::string_view long_token) {
        // Parsing the joined form rejects empty parts and embedded separators alike
        std::string joined;
        joined.reserve(prefix.size() + short_token.size() + long_token.size() + 2);
        joined.append(prefix).push_back(Constants::SEPARATOR);
        joined.append(short_token).push_back(Constants::SEPARATOR);
        joined.append(long_token);
        auto result = FromString(joined);
        crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(joined.data()), joined.size()));
        return result;
    }

    std::string PrefixedApiKey::ToString() const {
        std::string out;
        out.reserve(prefix_.size() + short_token_.size() + long_token_.size() + 2);
        out.append(prefix_).push_back(Constants::SEPARATOR);
        out.append(short_token_).push_back(Constants::SEPARATOR);
        out.append(long_token_);
        return out;
    }

    std::string PrefixedApiKey::ToDebugString() const {
        return "PrefixedApiKey { prefix: \"" + prefix_ +
               "\", short_token: \"" + short_token_ +
               "\", long_token: \"" + std::string(Constants::MASKED_SECRET) + "\" }";
    }

    Result<std::string, CryptoFailure> PrefixedApiKey::LongTokenHashed(
        const interfaces::IDigestAlgorithm& digest) const {
        const std::span<const uint8_t> input(
            reinterpret_cast<const uint8_t*>(long_token_.data()), long_token_.size());
        auto digest_result = digest.Compute(input);
        if (digest_result.IsErr()) {
            return Result<std::string, CryptoFailure>::Err(std::move(digest_result).UnwrapErr());
        }
        return crypto::SodiumInterop::ToHex(digest_result.Unwrap());
    }

    bool PrefixedApiKey::operator==(const PrefixedApiKey& other) const noexcept {
        return prefix_ == other.prefix_ &&
               short_token_ == other.short_token_ &&
               long_token_ == other.long_token_;
    }

    std::ostream& operator<<(std::ostream& os, const PrefixedApiKey& key) {
        return os << key.ToDebugString();
    }
}
