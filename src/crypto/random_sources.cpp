#include "pakey/crypto/random_sources.hpp"
#include "pakey/crypto/sodium_interop.hpp"
#include "pakey/core/constants.hpp"
#include "pakey/core/format.hpp"
#include "openssl_internal.hpp"

#include <openssl/rand.h>
#include <algorithm>
#include <climits>
#include <string>

namespace pakey::crypto {
using OpenSSL = OpenSSLConstants;
using detail::GetOpenSSLError;

Result<Unit, CryptoFailure> SodiumRandomSource::Fill(std::span<uint8_t> buffer) const {
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return init_result;
    }
    return SodiumInterop::FillRandom(buffer);
}

Result<Unit, CryptoFailure> OpenSslRandomSource::Fill(std::span<uint8_t> buffer) const {
    // RAND_bytes takes an int length
    while (!buffer.empty()) {
        const size_t chunk = std::min<size_t>(buffer.size(), INT_MAX);
        if (RAND_bytes(buffer.data(), static_cast<int>(chunk)) != OpenSSL::SUCCESS) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::RandomSourceFailed(
                    compat::format("{}: {}", ErrorMessages::OPENSSL_RAND_FAILED, GetOpenSSLError())));
        }
        buffer = buffer.subspan(chunk);
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

} // namespace pakey::crypto
