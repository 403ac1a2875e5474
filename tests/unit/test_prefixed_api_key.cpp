#include <catch2/catch_test_macros.hpp>
#include "pakey/models/prefixed_api_key.hpp"
#include "pakey/crypto/digests.hpp"
#include "pakey/crypto/sodium_interop.hpp"
#include <sstream>
#include <string>
using namespace pakey;
using namespace pakey::models;
using namespace pakey::crypto;

namespace {
    constexpr const char* REFERENCE_KEY = "mycompany_CEUsS4psCmc_BddpcwWyCT3EkDjHSSTRaSK1dxtuQgbjb";
    constexpr const char* REFERENCE_HASH =
        "0f01ab6e0833f280b73b2b618c16102d91c0b7c585d42a080d6e6603239a8bee";
}

TEST_CASE("PrefixedApiKey - Parsing", "[key][format]") {
    SECTION("Well-formed key splits into three components") {
        auto result = PrefixedApiKey::FromString("mycompany_abcdefg_bacdegadsa");
        REQUIRE(result.IsOk());
        const auto& key = result.Unwrap();
        REQUIRE(key.GetPrefix() == "mycompany");
        REQUIRE(key.GetShortToken() == "abcdefg");
        REQUIRE(key.GetLongToken() == "bacdegadsa");
    }
    SECTION("Two components are rejected") {
        auto result = PrefixedApiKey::FromString("a_b");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::WrongComponentCount);
        REQUIRE(result.UnwrapErr().detail == 2);
    }
    SECTION("Four components are rejected") {
        auto result = PrefixedApiKey::FromString("mycompany_abcd_efg_bacdegadsa");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::WrongComponentCount);
        REQUIRE(result.UnwrapErr().detail == 4);
    }
    SECTION("No separator at all") {
        auto result = PrefixedApiKey::FromString("nounderscores");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().detail == 1);
    }
    SECTION("Empty input") {
        auto result = PrefixedApiKey::FromString("");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::WrongComponentCount);
    }
    SECTION("Empty middle component") {
        auto result = PrefixedApiKey::FromString("a__c");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::EmptyComponent);
        REQUIRE(result.UnwrapErr().detail == 1);
    }
    SECTION("Empty prefix") {
        auto result = PrefixedApiKey::FromString("_b_c");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::EmptyComponent);
        REQUIRE(result.UnwrapErr().detail == 0);
    }
    SECTION("Empty long token") {
        auto result = PrefixedApiKey::FromString("a_b_");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::EmptyComponent);
        REQUIRE(result.UnwrapErr().detail == 2);
    }
    SECTION("Token alphabet is not enforced by the parser") {
        auto result = PrefixedApiKey::FromString("acme_0OIl_lots-of-chars!");
        REQUIRE(result.IsOk());
    }
}

TEST_CASE("PrefixedApiKey - Serialization", "[key][format]") {
    SECTION("ToString joins with separators") {
        auto key = PrefixedApiKey::FromParts("mycompany", "abcdefg", "bacdegadsa").Unwrap();
        REQUIRE(key.ToString() == "mycompany_abcdefg_bacdegadsa");
    }
    SECTION("Parsed key serializes back to the same text") {
        auto key = PrefixedApiKey::FromString(REFERENCE_KEY).Unwrap();
        REQUIRE(key.ToString() == REFERENCE_KEY);
    }
    SECTION("FromParts rejects a separator inside a component") {
        auto result = PrefixedApiKey::FromParts("my_company", "abc", "def");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::WrongComponentCount);
    }
    SECTION("FromParts rejects an empty component") {
        auto result = PrefixedApiKey::FromParts("acme", "", "def");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ParseFailureType::EmptyComponent);
    }
    SECTION("Equality is component-wise") {
        auto a = PrefixedApiKey::FromString("acme_abc_def").Unwrap();
        auto b = PrefixedApiKey::FromParts("acme", "abc", "def").Unwrap();
        auto c = PrefixedApiKey::FromString("acme_abc_deg").Unwrap();
        REQUIRE(a == b);
        REQUIRE(a != c);
    }
}

TEST_CASE("PrefixedApiKey - Debug output masks the long token", "[key][security]") {
    auto key = PrefixedApiKey::FromString(REFERENCE_KEY).Unwrap();
    const std::string expected =
        "PrefixedApiKey { prefix: \"mycompany\", short_token: \"CEUsS4psCmc\", long_token: \"***\" }";
    REQUIRE(key.ToDebugString() == expected);

    std::ostringstream os;
    os << key;
    REQUIRE(os.str() == expected);
    REQUIRE(os.str().find(key.GetLongToken()) == std::string::npos);
}

TEST_CASE("PrefixedApiKey - Long token hashing", "[key][digest]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = PrefixedApiKey::FromString(REFERENCE_KEY).Unwrap();
    SECTION("SHA-256 matches the reference hash") {
        auto result = key.LongTokenHashed(Sha256Digest{});
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == REFERENCE_HASH);
    }
    SECTION("Hashing is repeatable") {
        const Sha256Digest digest;
        REQUIRE(key.LongTokenHashed(digest).Unwrap() == key.LongTokenHashed(digest).Unwrap());
    }
    SECTION("Different digests give different hashes") {
        auto sha256 = key.LongTokenHashed(Sha256Digest{}).Unwrap();
        auto sha512 = key.LongTokenHashed(Sha512Digest{}).Unwrap();
        REQUIRE(sha512.size() == 128);
        REQUIRE(sha256 != sha512.substr(0, sha256.size()));
    }
}
