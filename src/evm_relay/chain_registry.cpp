#include "evm_relay/chain_registry.hpp"

#include "evm_relay/errors.hpp"

namespace evm_relay {
    namespace {
        ChainProfile holeskyProfile() {
            return {std::string(HOLESKY_KEY),
                    17000,
                    {"https://ethereum-holesky-rpc.publicnode.com"},
                    {NATIVE_TRANSFER_GAS, 20 * GWEI, 2 * GWEI}};
        }

        ChainProfile baseProfile() {
            return {std::string(BASE_KEY), 8453, {"https://base.drpc.org"}, {NATIVE_TRANSFER_GAS, 1 * GWEI, 1 * GWEI}};
        }

        StellarProfile stellarTestnet() {
            return {"CDTA5IYGUGRI4PAGXJL7TPBEIC3EZY6V23ILF5EDVXFVLCGGMVOK4CRL", "https://soroban-testnet.stellar.org"};
        }

        StellarProfile stellarMainnet() {
            return {"CDMHKRFQPMCBZFY225BNLNXA6YRTOCDD2VDC2AXC4YP3XCYMLYZAHWDS", "https://soroban-mainnet.stellar.org"};
        }
    } // namespace

    ChainRegistry::ChainRegistry(const EndpointOverrides &endpointOverrides, const std::string &stellarRpcOverride) {
        for (auto profile: {holeskyProfile(), baseProfile()}) {
            if (const auto it = endpointOverrides.find(profile.key); it != endpointOverrides.end() && !it->second.empty())
                profile.rpcEndpoints = it->second;
            const std::string key = profile.key;
            profiles_.emplace(key, std::move(profile));
        }
        auto testnet = stellarTestnet();
        auto mainnet = stellarMainnet();
        if (!stellarRpcOverride.empty()) {
            testnet.rpcEndpoint = stellarRpcOverride;
            mainnet.rpcEndpoint = stellarRpcOverride;
        }
        stellarProfiles_.emplace(std::string(HOLESKY_KEY), std::move(testnet));
        stellarProfiles_.emplace(std::string(BASE_KEY), std::move(mainnet));
    }

    ChainProfile ChainRegistry::resolve(const std::string_view key) const {
        if (const auto it = profiles_.find(key); it != profiles_.end())
            return it->second;
        return profiles_.find(HOLESKY_KEY)->second;
    }

    ChainProfile ChainRegistry::resolveStrict(const std::string_view key) const {
        if (const auto it = profiles_.find(key); it != profiles_.end())
            return it->second;
        throw RelayException(ErrorKind::UnknownChain, "No destination chain registered for key '" + std::string(key) + "'");
    }

    std::vector<std::string> ChainRegistry::knownKeys() const {
        std::vector<std::string> keys;
        keys.reserve(profiles_.size());
        for (const auto &[key, profile]: profiles_)
            keys.push_back(key);
        return keys;
    }

    StellarProfile ChainRegistry::stellarProfileFor(const std::string_view key) const {
        if (const auto it = stellarProfiles_.find(key); it != stellarProfiles_.end())
            return it->second;
        return stellarProfiles_.find(HOLESKY_KEY)->second;
    }
} // namespace evm_relay
