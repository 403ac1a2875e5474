#pragma once
#include "pakey/core/result.hpp"
#include "pakey/core/failures.hpp"
#include "pakey/interfaces/i_digest_algorithm.hpp"
#include <ostream>
#include <string>
#include <string_view>
namespace pakey::controller {
template<typename R, typename D>
class PrefixedApiKeyController;
}
namespace pakey::models {
/// A key of the form "{prefix}_{short_token}_{long_token}".
///
/// Instances come from a controller (generation) or from FromString
/// (untrusted input). Neither path lets a component be empty or contain
/// the separator, so ToString always parses back to an equal key.
///
/// ToString exposes the secret long token; use ToDebugString or
/// operator<< for anything that may end up in a log.
class PrefixedApiKey {
public:
    /// Parses untrusted text. Token lengths and alphabet are not checked;
    /// that depends on the controller the key is verified against.
    static Result<PrefixedApiKey, ParseFailure> FromString(std::string_view pak_string);
    static Result<PrefixedApiKey, ParseFailure> FromParts(
        std::string_view prefix, std::string_view short_token, std::string_view long_token);
    PrefixedApiKey(const PrefixedApiKey&) = default;
    PrefixedApiKey(PrefixedApiKey&&) noexcept = default;
    PrefixedApiKey& operator=(const PrefixedApiKey&) = default;
    PrefixedApiKey& operator=(PrefixedApiKey&&) noexcept = default;
    ~PrefixedApiKey() = default;
    [[nodiscard]] const std::string& GetPrefix() const noexcept {
        return prefix_;
    }
    [[nodiscard]] const std::string& GetShortToken() const noexcept {
        return short_token_;
    }
    [[nodiscard]] const std::string& GetLongToken() const noexcept {
        return long_token_;
    }
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToDebugString() const;
    /// Lowercase hex digest of the long token.
    [[nodiscard]] Result<std::string, CryptoFailure> LongTokenHashed(
        const interfaces::IDigestAlgorithm& digest) const;
    [[nodiscard]] bool operator==(const PrefixedApiKey& other) const noexcept;
    [[nodiscard]] bool operator!=(const PrefixedApiKey& other) const noexcept {
        return !(*this == other);
    }
private:
    template<typename R, typename D>
    friend class controller::PrefixedApiKeyController;
    PrefixedApiKey(std::string prefix, std::string short_token, std::string long_token);
    std::string prefix_;
    std::string short_token_;
    std::string long_token_;
};
std::ostream& operator<<(std::ostream& os, const PrefixedApiKey& key);
}
