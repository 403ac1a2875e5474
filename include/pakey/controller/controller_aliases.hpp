#pragma once

#include "pakey/controller/prefixed_api_key_controller.hpp"
#include "pakey/controller/controller_builder.hpp"
#include "pakey/crypto/digests.hpp"
#include "pakey/crypto/random_sources.hpp"

namespace pakey {

// OS entropy (libsodium randombytes)
using PakControllerOsSha224 = controller::PrefixedApiKeyController<crypto::SodiumRandomSource, crypto::Sha224Digest>;
using PakControllerOsSha256 = controller::PrefixedApiKeyController<crypto::SodiumRandomSource, crypto::Sha256Digest>;
using PakControllerOsSha384 = controller::PrefixedApiKeyController<crypto::SodiumRandomSource, crypto::Sha384Digest>;
using PakControllerOsSha512 = controller::PrefixedApiKeyController<crypto::SodiumRandomSource, crypto::Sha512Digest>;
using PakControllerOsSha512_224 = controller::PrefixedApiKeyController<crypto::SodiumRandomSource, crypto::Sha512_224Digest>;
using PakControllerOsSha512_256 = controller::PrefixedApiKeyController<crypto::SodiumRandomSource, crypto::Sha512_256Digest>;

// OpenSSL DRBG (RAND_bytes)
using PakControllerOpenSslSha224 = controller::PrefixedApiKeyController<crypto::OpenSslRandomSource, crypto::Sha224Digest>;
using PakControllerOpenSslSha256 = controller::PrefixedApiKeyController<crypto::OpenSslRandomSource, crypto::Sha256Digest>;
using PakControllerOpenSslSha384 = controller::PrefixedApiKeyController<crypto::OpenSslRandomSource, crypto::Sha384Digest>;
using PakControllerOpenSslSha512 = controller::PrefixedApiKeyController<crypto::OpenSslRandomSource, crypto::Sha512Digest>;
using PakControllerOpenSslSha512_224 = controller::PrefixedApiKeyController<crypto::OpenSslRandomSource, crypto::Sha512_224Digest>;
using PakControllerOpenSslSha512_256 = controller::PrefixedApiKeyController<crypto::OpenSslRandomSource, crypto::Sha512_256Digest>;

}
