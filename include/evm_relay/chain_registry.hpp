#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace evm_relay {
    inline constexpr uint64_t GWEI = 1'000'000'000ULL;
    inline constexpr uint64_t NATIVE_TRANSFER_GAS = 21'000;

    inline constexpr std::string_view HOLESKY_KEY = "17000";
    inline constexpr std::string_view BASE_KEY = "8453";

    struct GasPolicy {
        uint64_t gasLimit = NATIVE_TRANSFER_GAS;
        uint64_t maxFeePerGas = 0;
        uint64_t maxPriorityFeePerGas = 0;

        bool operator==(const GasPolicy &) const = default;
    };

    struct ChainProfile {
        std::string key;
        uint64_t chainId = 0;
        std::vector<std::string> rpcEndpoints;
        GasPolicy gas;

        bool operator==(const ChainProfile &) const = default;
    };

    /// Source-side Soroban contract watched for bridge events on behalf of a destination chain.
    struct StellarProfile {
        std::string contractId;
        std::string rpcEndpoint;

        bool operator==(const StellarProfile &) const = default;
    };

    /**
     * Static table of destination chains. Lookups are pure: the same key always yields the same profile.
     * resolve() falls back to the Holesky profile for unrecognized keys; resolveStrict() rejects them.
     */
    class ChainRegistry {
        std::map<std::string, ChainProfile, std::less<>> profiles_;
        std::map<std::string, StellarProfile, std::less<>> stellarProfiles_;

    public:
        using EndpointOverrides = std::map<std::string, std::vector<std::string>, std::less<>>;

        ChainRegistry() : ChainRegistry(EndpointOverrides{}, std::string{}) {}
        ChainRegistry(const EndpointOverrides &endpointOverrides, const std::string &stellarRpcOverride);

        [[nodiscard]] ChainProfile resolve(std::string_view key) const;
        [[nodiscard]] ChainProfile resolveStrict(std::string_view key) const;
        [[nodiscard]] GasPolicy feesFor(std::string_view key) const { return resolve(key).gas; }
        [[nodiscard]] bool isKnown(std::string_view key) const { return profiles_.contains(key); }
        [[nodiscard]] std::vector<std::string> knownKeys() const;

        [[nodiscard]] StellarProfile stellarProfileFor(std::string_view key) const;
    };
} // namespace evm_relay
