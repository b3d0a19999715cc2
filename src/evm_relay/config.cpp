#include "evm_relay/config.hpp"

#include <sstream>
#include <stdexcept>
#include <dotenv.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "evm_relay/errors.hpp"
#include "evm_relay/rlp.hpp"

namespace evm_relay {
    namespace {
        std::string trim(std::string_view text) {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
                text.remove_prefix(1);
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
                text.remove_suffix(1);
            return std::string(text);
        }

        std::vector<std::string> splitList(const std::string_view text) {
            std::vector<std::string> parts;
            std::stringstream stream{std::string(text)};
            std::string part;
            while (std::getline(stream, part, ',')) {
                if (auto trimmed = trim(part); !trimmed.empty())
                    parts.push_back(std::move(trimmed));
            }
            return parts;
        }

        bool parseFlag(const std::string &value) {
            return value == "1" || value == "true" || value == "TRUE" || value == "yes";
        }
    } // namespace

    DerivationPath parseDerivationPath(const std::string_view text) {
        DerivationPath path;
        for (const auto &component: splitList(text)) {
            if (!isHexString(component))
                throw RelayException(ErrorKind::InvalidInput, fmt::format("Invalid derivation path component '{}'", component));
            path.push_back(hexToBytes(component, true));
        }
        return path;
    }

    RelayConfig configFromEnvironment() {
        RelayConfig config;
        config.keyId = dotenv::getenv("ECDSA_KEY_ID", config.keyId);
        config.derivationPath = parseDerivationPath(dotenv::getenv("DERIVATION_PATH", ""));
        config.fallbackRate = dotenv::getenv("XLM_ETH_FALLBACK_RATE", config.fallbackRate);
        config.priceApiUrl = dotenv::getenv("PRICE_API_URL", config.priceApiUrl);
        config.strictChains = parseFlag(dotenv::getenv("STRICT_CHAINS", "0"));
        config.logLevel = spdlog::level::from_str(dotenv::getenv("LOG_LEVEL", "info"));
        config.stellarRpcOverride = dotenv::getenv("STELLAR_RPC_URL", "");

        for (const auto &key: ChainRegistry().knownKeys()) {
            const auto urls = splitList(dotenv::getenv(fmt::format("RPC_URL_{}", key).c_str(), ""));
            if (!urls.empty())
                config.endpointOverrides.emplace(key, urls);
        }
        return config;
    }

    RelayConfig loadRelayConfig(const std::string_view envPath) {
        dotenv::init(std::string(envPath).c_str());
        auto config = configFromEnvironment();
        spdlog::debug("Loaded relay configuration from {} (key id {}, {} endpoint override(s))", envPath,
                      config.keyId, config.endpointOverrides.size());
        return config;
    }

    SecureString loadPrivateKey(const std::string_view envKey) {
        auto key = dotenv::getenv(std::string(envKey).c_str());
        if (key.empty())
            throw std::runtime_error(fmt::format("{} not found in .env file", envKey));
        SecureString secureKey(key.begin(), key.end());
        OPENSSL_cleanse(key.data(), key.size());
        if (secureKey.starts_with("0x"))
            return SecureString(secureKey.begin() + 2, secureKey.end());
        return secureKey;
    }
} // namespace evm_relay
