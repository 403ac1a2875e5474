/**
 * @file pak_example.cpp
 * @brief Issue a prefixed API key, or check one against a stored hash
 *
 * Usage:
 *   pak_example generate <prefix>
 *   pak_example check <key> <hash>
 */

#include "pakey/pakey.hpp"

#include <iostream>
#include <string>

using namespace pakey;
using namespace pakey::crypto;
using namespace pakey::models;

namespace {

int Usage() {
    std::cerr << "usage: pak_example generate <prefix>" << std::endl;
    std::cerr << "       pak_example check <key> <hash>" << std::endl;
    return 2;
}

int Generate(const std::string& prefix) {
    auto controller_result = PakControllerOsSha256::Configure()
        .Prefix(prefix)
        .SeamDefaults()
        .Finalize();
    if (controller_result.IsErr()) {
        std::cerr << "Invalid configuration: "
                  << controller_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto controller = std::move(controller_result).Unwrap();

    auto generated = controller.TryGenerateKeyAndHash();
    if (generated.IsErr()) {
        std::cerr << "Key generation failed: " << generated.UnwrapErr().message << std::endl;
        return 1;
    }
    auto [key, hash] = std::move(generated).Unwrap();

    std::cout << "Key (give to the user):  " << key.ToString() << std::endl;
    std::cout << "Short token (lookup id): " << key.GetShortToken() << std::endl;
    std::cout << "Hash (store this):       " << hash << std::endl;
    return 0;
}

int Check(const std::string& presented, const std::string& hash) {
    auto parsed = PrefixedApiKey::FromString(presented);
    if (parsed.IsErr()) {
        std::cerr << "Malformed key: " << parsed.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto key = std::move(parsed).Unwrap();

    auto controller_result = PakControllerOsSha256::Configure()
        .Prefix(key.GetPrefix())
        .SeamDefaults()
        .LongTokenLength(key.GetLongToken().size())
        .Finalize();
    if (controller_result.IsErr()) {
        std::cerr << "Invalid configuration: "
                  << controller_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto controller = std::move(controller_result).Unwrap();

    auto check = controller.TryCheckHash(key, hash);
    if (check.IsErr()) {
        std::cerr << "Verification failed: " << check.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << key << (check.Unwrap() ? " matches" : " does NOT match") << std::endl;
    return check.Unwrap() ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    if (argc < 2) {
        return Usage();
    }
    const std::string command = argv[1];
    if (command == "generate" && argc == 3) {
        return Generate(argv[2]);
    }
    if (command == "check" && argc == 4) {
        return Check(argv[2], argv[3]);
    }
    return Usage();
}
