#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug logging for key generation and verification.
 *
 * SECURITY WARNING: with PAKEY_DEBUG_KEYS defined this module prints
 * generated long tokens and their hashes to stdout. Only enable it while
 * debugging token formats or digest interop. NEVER enable in production.
 *
 * Enable via CMake: -DPAKEY_DEBUG_KEYS=ON
 */

#include <cstdio>
#include <string>
#include <string_view>

namespace pakey::debug {

#ifdef PAKEY_DEBUG_KEYS

// ============================================================================
// Core logging macros
// ============================================================================

#define PAKEY_LOG_KEY(operation, name, value) \
    do { \
        fprintf(stdout, "[PAK-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define PAKEY_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[PAK-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define PAKEY_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[PAK-DEBUG] %s %s\n", \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define PAKEY_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[PAK-DEBUG] ========== %s ==========\n", \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Controller
// ============================================================================

inline void LogControllerCreated(
    std::string_view prefix,
    size_t short_token_length,
    size_t long_token_length,
    std::string_view rng_name,
    std::string_view digest_name) {

    PAKEY_LOG_SECTION("CONTROLLER CREATED");
    PAKEY_LOG_KEY("BUILD", "prefix", prefix);
    PAKEY_LOG_VALUE("BUILD", "short_token_length", short_token_length);
    PAKEY_LOG_VALUE("BUILD", "long_token_length", long_token_length);
    PAKEY_LOG_KEY("BUILD", "rng", rng_name);
    PAKEY_LOG_KEY("BUILD", "digest", digest_name);
}

inline void LogBuilderRejected(std::string_view reason) {
    PAKEY_LOG_MSG("BUILD", "rejected: " + std::string(reason));
}

// ============================================================================
// Generation / Verification
// ============================================================================

inline void LogKeyGenerated(
    std::string_view prefix,
    std::string_view short_token,
    std::string_view long_token) {

    PAKEY_LOG_SECTION("KEY GENERATED");
    PAKEY_LOG_KEY("GENERATE", "prefix", prefix);
    PAKEY_LOG_KEY("GENERATE", "short_token", short_token);
    PAKEY_LOG_KEY("GENERATE", "long_token", long_token);
}

inline void LogLongTokenHash(std::string_view digest_name, std::string_view hash) {
    PAKEY_LOG_KEY("HASH", std::string(digest_name).c_str(), hash);
}

inline void LogHashCheck(std::string_view short_token, bool matched) {
    PAKEY_LOG_KEY("CHECK", "short_token", short_token);
    PAKEY_LOG_MSG("CHECK", matched ? "match: YES" : "match: NO");
}

inline void LogCheckRejected(std::string_view short_token, std::string_view reason) {
    PAKEY_LOG_KEY("CHECK", "short_token", short_token);
    PAKEY_LOG_MSG("CHECK", "rejected: " + std::string(reason));
}

inline void LogCapabilityFailure(std::string_view capability, std::string_view message) {
    PAKEY_LOG_MSG("FAILURE", std::string(capability) + ": " + std::string(message));
}

#else // !PAKEY_DEBUG_KEYS

// No-op implementations when PAKEY_DEBUG_KEYS is not defined
#define PAKEY_LOG_KEY(operation, name, value) ((void)0)
#define PAKEY_LOG_VALUE(operation, name, value) ((void)0)
#define PAKEY_LOG_MSG(operation, message) ((void)0)
#define PAKEY_LOG_SECTION(section_name) ((void)0)

inline void LogControllerCreated(std::string_view, size_t, size_t, std::string_view,
    std::string_view) {}
inline void LogBuilderRejected(std::string_view) {}
inline void LogKeyGenerated(std::string_view, std::string_view, std::string_view) {}
inline void LogLongTokenHash(std::string_view, std::string_view) {}
inline void LogHashCheck(std::string_view, bool) {}
inline void LogCheckRejected(std::string_view, std::string_view) {}
inline void LogCapabilityFailure(std::string_view, std::string_view) {}

#endif // PAKEY_DEBUG_KEYS

} // namespace pakey::debug
