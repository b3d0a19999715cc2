#pragma once

#include <future>
#include <memory>
#include <string>
#include <string_view>
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/rpc.hpp"
#include "evm_relay/tx_record.hpp"

namespace evm_relay {
    enum class SendStatusKind {
        Accepted,
        AcceptedWithoutHash,
        NonceTooLow,
        NonceTooHigh,
        InsufficientFunds,
        RpcError,
    };

    [[nodiscard]] std::string_view sendStatusName(SendStatusKind kind) noexcept;

    struct SendStatus {
        SendStatusKind kind = SendStatusKind::RpcError;
        std::string txHash;
        std::string detail;

        /// Providers agree when they classify alike; error wording is not compared.
        bool operator==(const SendStatus &other) const noexcept { return kind == other.kind && txHash == other.txHash; }
    };

    /// Classifies one provider's eth_sendRawTransaction reply.
    [[nodiscard]] SendStatus classifySendReply(const ProviderReply &reply);

    /**
     * Broadcasts a signed transaction and turns the provider replies into a hash or a typed error:
     * Accepted -> hash (recorded), AcceptedWithoutHash -> SubmissionAcknowledgedWithoutHash, node rejections ->
     * NonceTooLow / NonceTooHigh / InsufficientFunds, anything else -> RpcError, disagreement ->
     * InconsistentSubmissionResult. Nothing is retried.
     */
    class Submitter {
        std::shared_ptr<RpcAggregator> rpc_;
        std::shared_ptr<TxRecord> record_;

    public:
        Submitter(std::shared_ptr<RpcAggregator> rpc, std::shared_ptr<TxRecord> record) :
            rpc_(std::move(rpc)), record_(std::move(record)) {}

        [[nodiscard]] std::future<std::string> submit(std::string signedTxHex, const ChainProfile &chain) const;
    };
} // namespace evm_relay
