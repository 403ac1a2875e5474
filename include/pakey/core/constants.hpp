#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace pakey {
struct Constants {
    static constexpr char SEPARATOR = '_';
    static constexpr size_t COMPONENT_COUNT = 3;
    static constexpr std::string_view TOKEN_ALPHABET =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    static constexpr size_t TOKEN_ALPHABET_SIZE = 58;
    // ceil(log2(TOKEN_ALPHABET_SIZE))
    static constexpr uint8_t SYMBOL_BITS = 6;
    static constexpr uint8_t SYMBOL_MASK = (1u << SYMBOL_BITS) - 1;
    static constexpr std::string_view MASKED_SECRET = "***";
};
struct KeyFormatConstants {
    static constexpr size_t DEFAULT_SHORT_TOKEN_LENGTH = 8;
    static constexpr size_t DEFAULT_LONG_TOKEN_LENGTH = 24;
    static constexpr size_t HIGH_ENTROPY_SHORT_TOKEN_LENGTH = 12;
    static constexpr size_t HIGH_ENTROPY_LONG_TOKEN_LENGTH = 48;
    static constexpr size_t COMPACT_SHORT_TOKEN_LENGTH = 6;
    static constexpr size_t COMPACT_LONG_TOKEN_LENGTH = 22;
    // Upper bound on random bytes requested per refill while sampling symbols.
    static constexpr size_t MAX_SAMPLE_BATCH = 256;
    // A healthy source rejects a whole batch with probability below 1%.
    static constexpr size_t MAX_REJECTED_BATCHES = 32;
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view OPENSSL_RAND_FAILED = "OpenSSL RAND_bytes failed";
    static constexpr std::string_view SAMPLING_STALLED =
        "Random source produced no usable token symbols";
    static constexpr std::string_view DIGEST_CONTEXT_FAILED = "Failed to create digest context";
    static constexpr std::string_view DIGEST_COMPUTE_FAILED = "Digest computation failed";
    static constexpr std::string_view HEX_ENCODING_FAILED = "Hex encoding failed";
};
}
