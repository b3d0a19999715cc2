#include "evm_relay/submitter.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace evm_relay {
    namespace {
        std::string toLower(std::string text) {
            std::ranges::transform(text, text.begin(),
                                   [](const char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
            return text;
        }

        ErrorKind errorKindFor(const SendStatusKind kind) noexcept {
            switch (kind) {
                case SendStatusKind::AcceptedWithoutHash:
                    return ErrorKind::SubmissionAcknowledgedWithoutHash;
                case SendStatusKind::NonceTooLow:
                    return ErrorKind::NonceTooLow;
                case SendStatusKind::NonceTooHigh:
                    return ErrorKind::NonceTooHigh;
                case SendStatusKind::InsufficientFunds:
                    return ErrorKind::InsufficientFunds;
                default:
                    return ErrorKind::RpcError;
            }
        }
    } // namespace

    std::string_view sendStatusName(const SendStatusKind kind) noexcept {
        switch (kind) {
            case SendStatusKind::Accepted:
                return "Accepted";
            case SendStatusKind::AcceptedWithoutHash:
                return "AcceptedWithoutHash";
            case SendStatusKind::NonceTooLow:
                return "NonceTooLow";
            case SendStatusKind::NonceTooHigh:
                return "NonceTooHigh";
            case SendStatusKind::InsufficientFunds:
                return "InsufficientFunds";
            case SendStatusKind::RpcError:
                return "RpcError";
        }
        return "Unknown";
    }

    SendStatus classifySendReply(const ProviderReply &reply) {
        if (!reply.response)
            return {SendStatusKind::RpcError, {}, reply.transportError};
        const auto &response = *reply.response;
        if (response.contains("error")) {
            auto message = jsonRpcErrorMessage(response);
            const auto lower = toLower(message);
            if (lower.contains("nonce too low"))
                return {SendStatusKind::NonceTooLow, {}, std::move(message)};
            if (lower.contains("nonce too high"))
                return {SendStatusKind::NonceTooHigh, {}, std::move(message)};
            if (lower.contains("insufficient funds"))
                return {SendStatusKind::InsufficientFunds, {}, std::move(message)};
            return {SendStatusKind::RpcError, {}, std::move(message)};
        }
        if (!response.contains("result"))
            return {SendStatusKind::RpcError, {}, "response carries neither result nor error"};
        const auto &result = response["result"];
        if (result.is_null() || (result.is_string() && result.get<std::string>().empty()))
            return {SendStatusKind::AcceptedWithoutHash, {}, "node accepted the transaction without returning a hash"};
        if (!result.is_string())
            return {SendStatusKind::RpcError, {}, "unexpected result type: " + result.dump()};
        return {SendStatusKind::Accepted, toLower(result.get<std::string>()), {}};
    }

    std::future<std::string> Submitter::submit(std::string signedTxHex, const ChainProfile &chain) const {
        auto replies = rpc_->call(RpcServices::forChain(chain), "eth_sendRawTransaction", json::array({signedTxHex}));
        return std::async(std::launch::async,
                          [replies = std::move(replies), record = record_, chainId = chain.chainId]() mutable {
                              const auto result = reconcile<SendStatus>(replies.get(), classifySendReply);
                              if (!result.isConsistent()) {
                                  const auto details = describeResults(result, [](const SendStatus &status) {
                                      return status.detail.empty() ? fmt::format("{} {}", sendStatusName(status.kind), status.txHash)
                                                                   : fmt::format("{} ({})", sendStatusName(status.kind), status.detail);
                                  });
                                  spdlog::error("Submission outcome differs across providers on chain {}: {}", chainId, details);
                                  throw RelayException(ErrorKind::InconsistentSubmissionResult, details);
                              }
                              const auto &status = result.value();
                              if (status.kind != SendStatusKind::Accepted)
                                  throw RelayException(errorKindFor(status.kind), status.detail);
                              record->record(status.txHash);
                              spdlog::info("Transaction {} accepted on chain {}", status.txHash, chainId);
                              return status.txHash;
                          });
    }
} // namespace evm_relay
