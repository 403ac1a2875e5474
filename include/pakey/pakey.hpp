#pragma once

#include "pakey/core/result.hpp"
#include "pakey/core/option.hpp"
#include "pakey/core/failures.hpp"
#include "pakey/core/constants.hpp"
#include "pakey/configuration/key_format_config.hpp"
#include "pakey/crypto/sodium_interop.hpp"
#include "pakey/crypto/random_sources.hpp"
#include "pakey/crypto/digests.hpp"
#include "pakey/models/prefixed_api_key.hpp"
#include "pakey/controller/prefixed_api_key_controller.hpp"
#include "pakey/controller/controller_builder.hpp"
#include "pakey/controller/controller_aliases.hpp"
