#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include "evm_relay/address.hpp"
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/rpc.hpp"

namespace evm_relay {
    /// One provider's view of eth_getTransactionCount: a nonce, or the error it reported.
    struct NonceReading {
        std::optional<uint64_t> nonce;
        std::string error;

        /// Providers agree when they report the same nonce or all fail; error wording is not compared.
        bool operator==(const NonceReading &other) const noexcept { return nonce == other.nonce; }
    };

    [[nodiscard]] NonceReading classifyNonceReply(const ProviderReply &reply);

    /**
     * Fetches the signer's current transaction count ("latest" block) through the RPC aggregator.
     * Every call queries fresh; nothing is cached and nothing is retried at this layer.
     */
    class NonceService {
        std::shared_ptr<RpcAggregator> rpc_;

    public:
        explicit NonceService(std::shared_ptr<RpcAggregator> rpc) : rpc_(std::move(rpc)) {}

        [[nodiscard]] std::future<uint64_t> nextNonce(const Address &address, const ChainProfile &chain) const;
    };
} // namespace evm_relay
