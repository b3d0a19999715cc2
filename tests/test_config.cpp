#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "evm_relay/config.hpp"
#include "evm_relay/errors.hpp"

using namespace evm_relay;

namespace {
    class ScopedEnv {
        std::string name_;

    public:
        ScopedEnv(std::string name, const std::string &value) : name_(std::move(name)) {
            ::setenv(name_.c_str(), value.c_str(), 1);
        }
        ~ScopedEnv() { ::unsetenv(name_.c_str()); }
        ScopedEnv(const ScopedEnv &) = delete;
        ScopedEnv &operator=(const ScopedEnv &) = delete;
    };
} // namespace

TEST(Config, ParsesDerivationPath) {
    EXPECT_TRUE(parseDerivationPath("").empty());
    const auto path = parseDerivationPath("0x01, 0x02ff,00");
    ASSERT_EQ(path.size(), 3u);
    EXPECT_EQ(path[0], Bytes{0x01});
    EXPECT_EQ(path[1], (Bytes{0x02, 0xff}));
    EXPECT_EQ(path[2], Bytes{0x00});

    try {
        static_cast<void>(parseDerivationPath("0x01,zz"));
        FAIL() << "expected InvalidInput";
    } catch (const RelayException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
    }
}

TEST(Config, DefaultsWithoutEnvironment) {
    const auto config = configFromEnvironment();
    EXPECT_EQ(config.keyId, "test_key_1");
    EXPECT_EQ(config.fallbackRate, "0.000081");
    EXPECT_EQ(config.priceApiUrl, DEFAULT_PRICE_API_URL);
    EXPECT_FALSE(config.strictChains);
    EXPECT_TRUE(config.derivationPath.empty());
    EXPECT_TRUE(config.endpointOverrides.empty());
    EXPECT_EQ(config.logLevel, spdlog::level::info);
}

TEST(Config, ReadsEnvironment) {
    const ScopedEnv keyId("ECDSA_KEY_ID", "key_1");
    const ScopedEnv path("DERIVATION_PATH", "0x01");
    const ScopedEnv rate("XLM_ETH_FALLBACK_RATE", "0.0001");
    const ScopedEnv priceUrl("PRICE_API_URL", "");
    const ScopedEnv strict("STRICT_CHAINS", "1");
    const ScopedEnv level("LOG_LEVEL", "debug");
    const ScopedEnv baseRpc("RPC_URL_8453", "https://a.example, https://b.example");
    const ScopedEnv stellar("STELLAR_RPC_URL", "https://soroban.example");

    const auto config = configFromEnvironment();
    EXPECT_EQ(config.keyId, "key_1");
    ASSERT_EQ(config.derivationPath.size(), 1u);
    EXPECT_EQ(config.fallbackRate, "0.0001");
    EXPECT_TRUE(config.priceApiUrl.empty());
    EXPECT_TRUE(config.strictChains);
    EXPECT_EQ(config.logLevel, spdlog::level::debug);

    const auto registry = config.makeRegistry();
    EXPECT_EQ(registry.resolve("8453").rpcEndpoints,
              (std::vector<std::string>{"https://a.example", "https://b.example"}));
    EXPECT_EQ(registry.resolve("17000").rpcEndpoints, ChainRegistry().resolve("17000").rpcEndpoints);
    EXPECT_EQ(registry.stellarProfileFor("17000").rpcEndpoint, "https://soroban.example");
}

TEST(Config, LoadsPrivateKey) {
    {
        const ScopedEnv key("TEST_SIGNER_KEY", "0xabcdef");
        EXPECT_EQ(loadPrivateKey("TEST_SIGNER_KEY"), SecureString("abcdef"));
    }
    EXPECT_THROW(static_cast<void>(loadPrivateKey("TEST_SIGNER_KEY")), std::runtime_error);
}
