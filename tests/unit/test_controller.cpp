#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators_range.hpp>
#include "pakey/pakey.hpp"
#include "../helpers/test_capabilities.hpp"
#include <stdexcept>
#include <string>
using namespace pakey;
using namespace pakey::controller;
using namespace pakey::crypto;
using namespace pakey::models;
using namespace pakey::test_helpers;

namespace {
    constexpr auto REFERENCE_KEY = "mycompany_CEUsS4psCmc_BddpcwWyCT3EkDjHSSTRaSK1dxtuQgbjb";
    constexpr auto REFERENCE_HASH = "0f01ab6e0833f280b73b2b618c16102d91c0b7c585d42a080d6e6603239a8bee";

    using PatternController = PrefixedApiKeyController<PatternRandomSource, Sha256Digest>;
    using FailingRngController = PrefixedApiKeyController<FailingRandomSource, Sha256Digest>;
    using FailingDigestController = PrefixedApiKeyController<SodiumRandomSource, FailingDigest>;

    PatternController MakePatternController(Option<std::string> short_token_prefix = None<std::string>()) {
        return PatternController::Configure()
            .Prefix("mycompany")
            .RngSource(PatternRandomSource::AlphabetSequence())
            .DigestSha256()
            .ShortTokenPrefix(std::move(short_token_prefix))
            .Finalize()
            .Unwrap();
    }
}

TEST_CASE("Controller - Key generation", "[controller][generation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Generated key carries prefix and configured lengths") {
        auto controller = PakControllerOsSha256::Configure()
            .Prefix("mycompany")
            .SeamDefaults()
            .Finalize()
            .Unwrap();
        const auto key = controller.GenerateKey();
        REQUIRE(key.GetPrefix() == "mycompany");
        REQUIRE(key.GetShortToken().size() == 8);
        REQUIRE(key.GetLongToken().size() == 24);
        REQUIRE(TokenAlphabet::IsValidToken(key.GetShortToken()));
        REQUIRE(TokenAlphabet::IsValidToken(key.GetLongToken()));
    }

    SECTION("Lengths are honoured for any configuration") {
        const size_t length = GENERATE(range<size_t>(1, 65));
        auto controller = PakControllerOsSha256::Configure()
            .Prefix("mycompany")
            .SeamDefaults()
            .ShortTokenLength(length)
            .LongTokenLength(length + 1)
            .Finalize()
            .Unwrap();
        const auto key = controller.GenerateKey();
        REQUIRE(key.GetShortToken().size() == length);
        REQUIRE(key.GetLongToken().size() == length + 1);
    }

    SECTION("Generated key survives a text round trip") {
        auto controller = PakControllerOsSha256::Configure()
            .Prefix("mycompany")
            .SeamDefaults()
            .Finalize()
            .Unwrap();
        const auto key = controller.GenerateKey();
        auto parsed = PrefixedApiKey::FromString(key.ToString());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap() == key);
    }

    SECTION("Deterministic source gives deterministic tokens") {
        auto controller = MakePatternController();
        const auto key = controller.GenerateKey();
        REQUIRE(key.GetShortToken() == "12345678");
        REQUIRE(key.GetLongToken() == "BCDEFGHJKLMNPQRSTUVWXYZa");
    }
}

TEST_CASE("Controller - Short token prefix", "[controller][generation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Prefix leads the short token") {
        auto controller = MakePatternController(Some(std::string("dev")));
        const auto key = controller.GenerateKey();
        REQUIRE(key.GetShortToken() == "dev12345");
    }

    SECTION("Prefix as long as the short token fills it") {
        auto controller = MakePatternController(Some(std::string("aaaaaaaa")));
        REQUIRE(controller.GenerateKey().GetShortToken() == "aaaaaaaa");
        REQUIRE(controller.GenerateKey().GetShortToken() == "aaaaaaaa");
    }

    SECTION("Longer prefix is truncated") {
        auto controller = PatternController::Configure()
            .Prefix("mycompany")
            .RngSource(PatternRandomSource::AlphabetSequence())
            .DigestSha256()
            .ShortTokenLength(4)
            .ShortTokenPrefix(Some(std::string("abcdefghij")))
            .Finalize()
            .Unwrap();
        REQUIRE(controller.GenerateKey().GetShortToken() == "abcd");
    }

    SECTION("Random remainder still varies") {
        auto controller = PakControllerOsSha256::Configure()
            .Prefix("mycompany")
            .SeamDefaults()
            .ShortTokenLength(16)
            .ShortTokenPrefix(Some(std::string("dev")))
            .Finalize()
            .Unwrap();
        const auto first = controller.GenerateKey();
        const auto second = controller.GenerateKey();
        REQUIRE(first.GetShortToken().substr(0, 3) == "dev");
        REQUIRE(second.GetShortToken().substr(0, 3) == "dev");
        REQUIRE(first.GetShortToken() != second.GetShortToken());
    }
}

TEST_CASE("Controller - Hash and check", "[controller][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto controller = PakControllerOsSha256::Configure()
        .Prefix("mycompany")
        .SeamDefaults()
        .Finalize()
        .Unwrap();

    SECTION("Generated hash verifies") {
        auto [key, hash] = controller.GenerateKeyAndHash();
        REQUIRE(hash.size() == 64);
        REQUIRE(controller.CheckHash(key, hash));
    }

    SECTION("Hash of another key does not verify") {
        auto [key, hash] = controller.GenerateKeyAndHash();
        auto [other_key, other_hash] = controller.GenerateKeyAndHash();
        REQUIRE_FALSE(controller.CheckHash(key, other_hash));
        REQUIRE_FALSE(controller.CheckHash(other_key, hash));
    }

    SECTION("LongTokenHashed agrees with the generated hash") {
        auto [key, hash] = controller.GenerateKeyAndHash();
        auto rehashed = controller.LongTokenHashed(key);
        REQUIRE(rehashed.IsOk());
        REQUIRE(rehashed.Unwrap() == hash);
    }

    SECTION("Reference key verifies with a matching long token length") {
        auto reference_controller = PakControllerOsSha256::Configure()
            .Prefix("mycompany")
            .SeamDefaults()
            .ShortTokenLength(11)
            .LongTokenLength(33)
            .Finalize()
            .Unwrap();
        const auto key = PrefixedApiKey::FromString(REFERENCE_KEY).Unwrap();
        REQUIRE(reference_controller.CheckHash(key, REFERENCE_HASH));
        REQUIRE(reference_controller.TryCheckHash(key, REFERENCE_HASH).Unwrap());
    }

    SECTION("Reference key is rejected by a controller expecting 24 symbols") {
        const auto key = PrefixedApiKey::FromString(REFERENCE_KEY).Unwrap();
        REQUIRE_FALSE(controller.CheckHash(key, REFERENCE_HASH));
    }
}

TEST_CASE("Controller - Capability failures", "[controller][errors]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Source that only yields rejected bytes surfaces as RngFailure") {
        auto controller = PatternController::Configure()
            .Prefix("mycompany")
            .RngSource(PatternRandomSource({0xFF}))
            .DigestSha256()
            .Finalize()
            .Unwrap();
        auto result = controller.TryGenerateKey();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == GenerationFailureType::RngFailure);
        REQUIRE_THROWS_AS(controller.GenerateKey(), std::runtime_error);
    }

    SECTION("Random source failure surfaces as RngFailure") {
        auto controller = FailingRngController::Configure()
            .Prefix("mycompany")
            .RngSource(FailingRandomSource{})
            .DigestSha256()
            .Finalize()
            .Unwrap();
        auto result = controller.TryGenerateKey();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == GenerationFailureType::RngFailure);
        REQUIRE(result.UnwrapErr().message.find("entropy unavailable") != std::string::npos);

        auto with_hash = controller.TryGenerateKeyAndHash();
        REQUIRE(with_hash.IsErr());
        REQUIRE(with_hash.UnwrapErr().type == GenerationFailureType::RngFailure);
    }

    SECTION("Infallible variants throw on random source failure") {
        auto controller = FailingRngController::Configure()
            .Prefix("mycompany")
            .RngSource(FailingRandomSource{})
            .DigestSha256()
            .Finalize()
            .Unwrap();
        REQUIRE_THROWS_AS(controller.GenerateKey(), std::runtime_error);
        REQUIRE_THROWS_AS(controller.GenerateKeyAndHash(), std::runtime_error);
    }

    SECTION("Digest failure surfaces as DigestFailure") {
        auto controller = FailingDigestController::Configure()
            .Prefix("mycompany")
            .RngOs()
            .Digest(FailingDigest{})
            .Finalize()
            .Unwrap();

        auto key_result = controller.TryGenerateKey();
        REQUIRE(key_result.IsOk());

        auto with_hash = controller.TryGenerateKeyAndHash();
        REQUIRE(with_hash.IsErr());
        REQUIRE(with_hash.UnwrapErr().type == GenerationFailureType::DigestFailure);

        const auto key = key_result.Unwrap();
        auto check = controller.TryCheckHash(key, std::string(64, '0'));
        REQUIRE(check.IsErr());
        REQUIRE(check.UnwrapErr().type == GenerationFailureType::DigestFailure);
        REQUIRE_FALSE(controller.CheckHash(key, std::string(64, '0')));
    }
}
