/**
 * @file openssl_internal.hpp
 * @brief OpenSSL helpers shared by the crypto sources
 *
 * This header is NOT part of the public API.
 */

#pragma once

#include <string>

namespace pakey::crypto::detail {

/// Pops the oldest entry of the thread's OpenSSL error queue as text.
std::string GetOpenSSLError();

} // namespace pakey::crypto::detail
