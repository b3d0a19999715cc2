#include <memory>
#include <gtest/gtest.h>
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/submitter.hpp"
#include "fakes.hpp"

using namespace evm_relay;
using namespace evm_relay::test;

namespace {
    constexpr const char *TX_HASH = "0x5f7eb1b426618c96eb28bec38b42077f90c4128e444d7ef31e5d10ef092335d7";
    constexpr const char *SIGNED_TX = "0x02f8";

    SendStatusKind kindOf(const json &response) {
        return classifySendReply(ProviderReply::ok("alpha", response)).kind;
    }

    ErrorKind submitFailure(const std::shared_ptr<FakeRpcAggregator> &rpc, const std::shared_ptr<TxRecord> &record) {
        const Submitter submitter(rpc, record);
        try {
            static_cast<void>(submitter.submit(SIGNED_TX, ChainRegistry().resolve("8453")).get());
        } catch (const RelayException &e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a RelayException";
        return ErrorKind::InvalidInput;
    }
} // namespace

TEST(Submitter, ClassifiesNodeResponses) {
    const auto accepted = classifySendReply(ProviderReply::ok("alpha", rpcResult("0x5F7EB1B426618C96EB28BEC38B42077F90C4128E444D7EF31E5D10EF092335D7")));
    EXPECT_EQ(accepted.kind, SendStatusKind::Accepted);
    EXPECT_EQ(accepted.txHash, TX_HASH);

    EXPECT_EQ(kindOf(rpcResult(nullptr)), SendStatusKind::AcceptedWithoutHash);
    EXPECT_EQ(kindOf(rpcResult("")), SendStatusKind::AcceptedWithoutHash);
    EXPECT_EQ(kindOf(rpcError("nonce too low: next nonce 7, tx nonce 5")), SendStatusKind::NonceTooLow);
    EXPECT_EQ(kindOf(rpcError("Nonce too high")), SendStatusKind::NonceTooHigh);
    EXPECT_EQ(kindOf(rpcError("insufficient funds for gas * price + value")), SendStatusKind::InsufficientFunds);
    EXPECT_EQ(kindOf(rpcError("transaction underpriced")), SendStatusKind::RpcError);
}

TEST(Submitter, NothingElseCountsAsAccepted) {
    EXPECT_EQ(kindOf(rpcResult(42)), SendStatusKind::RpcError);
    EXPECT_EQ(kindOf(rpcResult(json::object())), SendStatusKind::RpcError);
    EXPECT_EQ(kindOf(json{{"jsonrpc", "2.0"}, {"id", 1}}), SendStatusKind::RpcError);
    EXPECT_EQ(classifySendReply(ProviderReply::failed("alpha", "timeout")).kind, SendStatusKind::RpcError);
}

TEST(Submitter, RecordsAcceptedHash) {
    const auto rpc = std::make_shared<FakeRpcAggregator>();
    rpc->agree("eth_sendRawTransaction", rpcResult(TX_HASH));
    const auto record = std::make_shared<TxRecord>();
    const Submitter submitter(rpc, record);
    EXPECT_FALSE(record->latest().has_value());
    EXPECT_EQ(submitter.submit(SIGNED_TX, ChainRegistry().resolve("8453")).get(), TX_HASH);
    EXPECT_EQ(record->latest(), TX_HASH);

    const auto calls = rpc->calls("eth_sendRawTransaction");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].params, json::array({SIGNED_TX}));
}

TEST(Submitter, RejectionsMapToErrors) {
    const auto record = std::make_shared<TxRecord>();
    const auto rpc = std::make_shared<FakeRpcAggregator>();

    rpc->agree("eth_sendRawTransaction", rpcResult(nullptr));
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::SubmissionAcknowledgedWithoutHash);
    rpc->agree("eth_sendRawTransaction", rpcError("nonce too low"));
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::NonceTooLow);
    rpc->agree("eth_sendRawTransaction", rpcError("nonce too high"));
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::NonceTooHigh);
    rpc->agree("eth_sendRawTransaction", rpcError("insufficient funds for transfer"));
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::InsufficientFunds);
    rpc->agree("eth_sendRawTransaction", rpcError("internal error", -32603));
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::RpcError);

    EXPECT_FALSE(record->latest().has_value());
    EXPECT_TRUE(isSubmissionRejection(ErrorKind::NonceTooLow));
    EXPECT_FALSE(isSubmissionRejection(ErrorKind::RpcError));
}

TEST(Submitter, ProviderDisagreementIsInconsistent) {
    const auto record = std::make_shared<TxRecord>();
    const auto rpc = std::make_shared<FakeRpcAggregator>();
    rpc->setDefault("eth_sendRawTransaction", {ProviderReply::ok("alpha", rpcResult(TX_HASH)),
                                               ProviderReply::ok("beta", rpcError("nonce too low"))});
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::InconsistentSubmissionResult);
    EXPECT_FALSE(record->latest().has_value());

    rpc->setDefault("eth_sendRawTransaction", {ProviderReply::ok("alpha", rpcError("nonce too low: a")),
                                               ProviderReply::ok("beta", rpcError("Nonce too low (b)"))});
    EXPECT_EQ(submitFailure(rpc, record), ErrorKind::NonceTooLow);
}
