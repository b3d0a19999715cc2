#include "evm_relay/setup.hpp"

#include <spdlog/spdlog.h>
#include "evm_relay/event_source.hpp"
#include "evm_relay/http.hpp"
#include "evm_relay/local_signer.hpp"
#include "evm_relay/rpc.hpp"

namespace evm_relay {
    std::unique_ptr<BridgeOrchestrator> makeLiveOrchestrator(const RelayConfig &config, const std::string_view chainKey) {
        auto registry = config.makeRegistry();
        auto http = std::make_shared<CurlHttpClient>();
        auto signer = std::make_shared<LocalKeySigner>(loadPrivateKey(config.signerKeyEnv), config.keyId);

        OrchestratorDependencies deps;
        deps.signer = signer;
        deps.publicKeys = signer;
        deps.rpc = std::make_shared<CurlRpcAggregator>();
        deps.prices = std::make_shared<PriceConverter>(http, config.priceApiUrl, config.fallbackRate);
        deps.events = std::make_shared<EventSource>(http, registry.stellarProfileFor(chainKey));
        deps.record = std::make_shared<TxRecord>();
        deps.registry = std::move(registry);

        OrchestratorOptions options;
        options.keyId = config.keyId;
        options.derivationPath = config.derivationPath;
        options.strictChains = config.strictChains;
        spdlog::debug("Relay for chain {} watches contract {}", chainKey, deps.events->profile().contractId);
        return std::make_unique<BridgeOrchestrator>(std::move(deps), std::move(options));
    }
} // namespace evm_relay
