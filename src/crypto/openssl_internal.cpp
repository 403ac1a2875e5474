#include "openssl_internal.hpp"
#include "pakey/core/constants.hpp"

#include <openssl/err.h>

namespace pakey::crypto::detail {

std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[OpenSSLConstants::ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

} // namespace pakey::crypto::detail
