#pragma once
#include <cstddef>
#include <string>
#include <string_view>
namespace pakey {
enum class CryptoFailureType {
    InitializationFailed,
    RandomSourceFailed,
    DigestFailed,
    EncodingFailed
};
enum class BuilderFailureType {
    MissingPrefix,
    InvalidPrefix,
    MissingRng,
    MissingDigest,
    InvalidShortTokenLength,
    InvalidLongTokenLength,
    InvalidShortTokenPrefix
};
enum class ParseFailureType {
    WrongComponentCount,
    EmptyComponent
};
enum class GenerationFailureType {
    RngFailure,
    DigestFailure
};
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure InitializationFailed(std::string msg) {
        return {CryptoFailureType::InitializationFailed, std::move(msg)};
    }
    static CryptoFailure RandomSourceFailed(std::string msg) {
        return {CryptoFailureType::RandomSourceFailed, std::move(msg)};
    }
    static CryptoFailure DigestFailed(std::string msg) {
        return {CryptoFailureType::DigestFailed, std::move(msg)};
    }
    static CryptoFailure EncodingFailed(std::string msg) {
        return {CryptoFailureType::EncodingFailed, std::move(msg)};
    }
};
class BuilderFailure {
public:
    BuilderFailureType type;
    std::string message;
    BuilderFailure(const BuilderFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static BuilderFailure MissingPrefix() {
        return {BuilderFailureType::MissingPrefix, "expected prefix to be set, but wasn't"};
    }
    static BuilderFailure InvalidPrefix(std::string msg) {
        return {BuilderFailureType::InvalidPrefix, std::move(msg)};
    }
    static BuilderFailure MissingRng() {
        return {BuilderFailureType::MissingRng, "expected rng to be set, but wasn't"};
    }
    static BuilderFailure MissingDigest() {
        return {BuilderFailureType::MissingDigest, "expected digest to be set, but wasn't"};
    }
    static BuilderFailure InvalidShortTokenLength() {
        return {BuilderFailureType::InvalidShortTokenLength,
                "expected short_token_length to be positive"};
    }
    static BuilderFailure InvalidLongTokenLength() {
        return {BuilderFailureType::InvalidLongTokenLength,
                "expected long_token_length to be positive"};
    }
    static BuilderFailure InvalidShortTokenPrefix(std::string msg) {
        return {BuilderFailureType::InvalidShortTokenPrefix, std::move(msg)};
    }
};
class ParseFailure {
public:
    ParseFailureType type;
    std::string message;
    // Component count for WrongComponentCount, component index for EmptyComponent.
    size_t detail;
    ParseFailure(const ParseFailureType t, std::string msg, const size_t d)
        : type(t), message(std::move(msg)), detail(d) {}
    static ParseFailure WrongComponentCount(const size_t count) {
        return {ParseFailureType::WrongComponentCount,
                "expected 3 components, found " + std::to_string(count), count};
    }
    static ParseFailure EmptyComponent(const size_t index) {
        return {ParseFailureType::EmptyComponent,
                "component " + std::to_string(index) + " is empty", index};
    }
};
class GenerationFailure {
public:
    GenerationFailureType type;
    std::string message;
    GenerationFailure(const GenerationFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static GenerationFailure RngFailure(std::string msg) {
        return {GenerationFailureType::RngFailure, std::move(msg)};
    }
    static GenerationFailure DigestFailure(std::string msg) {
        return {GenerationFailureType::DigestFailure, std::move(msg)};
    }
};
}
