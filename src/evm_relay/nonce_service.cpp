#include "evm_relay/nonce_service.hpp"

#include <spdlog/spdlog.h>
#include "evm_relay/rlp.hpp"

namespace evm_relay {
    NonceReading classifyNonceReply(const ProviderReply &reply) {
        if (!reply.response)
            return {std::nullopt, reply.transportError};
        const auto &response = *reply.response;
        if (response.contains("error"))
            return {std::nullopt, jsonRpcErrorMessage(response)};
        if (!response.contains("result") || !response["result"].is_string())
            return {std::nullopt, "missing or non-string result"};
        const auto quantity = response["result"].get<std::string>();
        if (!quantity.starts_with("0x"))
            return {std::nullopt, "malformed quantity: " + quantity};
        try {
            return {safeHexToUint64(quantity), {}};
        } catch (const RLPException &e) {
            return {std::nullopt, "malformed quantity " + quantity + ": " + e.what()};
        }
    }

    std::future<uint64_t> NonceService::nextNonce(const Address &address, const ChainProfile &chain) const {
        auto replies = rpc_->call(RpcServices::forChain(chain), "eth_getTransactionCount",
                                  json::array({address.toHex(), "latest"}));
        return std::async(std::launch::async, [replies = std::move(replies), address, chainId = chain.chainId]() mutable {
            const auto result = reconcile<NonceReading>(replies.get(), classifyNonceReply);
            const auto details = describeResults(result, [](const NonceReading &reading) {
                return reading.nonce ? std::to_string(*reading.nonce) : "error: " + reading.error;
            });
            if (!result.isConsistent()) {
                spdlog::error("Nonce providers disagree for {} on chain {}: {}", address.toHex(), chainId, details);
                throw RelayException(ErrorKind::NonceInconsistent, details);
            }
            const auto &reading = result.value();
            if (!reading.nonce)
                throw RelayException(ErrorKind::NonceFetchFailed, details);
            spdlog::debug("Nonce for {} on chain {}: {}", address.toHex(), chainId, *reading.nonce);
            return *reading.nonce;
        });
    }
} // namespace evm_relay
