#pragma once

#include <string>
#include <string_view>
#include <spdlog/common.h>
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/crypto.hpp"
#include "evm_relay/price_converter.hpp"
#include "evm_relay/types.hpp"

namespace evm_relay {
    inline constexpr std::string_view DEFAULT_KEY_ID = "test_key_1";
    inline constexpr std::string_view DEFAULT_ENV_PATH = "../.env";

    struct RelayConfig {
        std::string keyId = std::string(DEFAULT_KEY_ID);
        DerivationPath derivationPath;
        std::string signerKeyEnv = "SIGNER_PRIVATE_KEY";
        std::string fallbackRate = std::string(DEFAULT_FALLBACK_RATE);
        std::string priceApiUrl = std::string(DEFAULT_PRICE_API_URL);
        bool strictChains = false;
        spdlog::level::level_enum logLevel = spdlog::level::info;
        ChainRegistry::EndpointOverrides endpointOverrides;
        std::string stellarRpcOverride;

        [[nodiscard]] ChainRegistry makeRegistry() const { return {endpointOverrides, stellarRpcOverride}; }
    };

    /// "0x01,0x02ff" -> {{0x01}, {0x02, 0xff}}. An empty string is the empty path.
    [[nodiscard]] DerivationPath parseDerivationPath(std::string_view text);

    /// Reads RelayConfig from the process environment (already populated by dotenv::init).
    [[nodiscard]] RelayConfig configFromEnvironment();

    /// Loads the .env file at envPath into the environment, then reads RelayConfig.
    [[nodiscard]] RelayConfig loadRelayConfig(std::string_view envPath = DEFAULT_ENV_PATH);

    [[nodiscard]] SecureString loadPrivateKey(std::string_view envKey);
} // namespace evm_relay
