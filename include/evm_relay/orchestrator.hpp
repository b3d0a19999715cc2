#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include "evm_relay/address.hpp"
#include "evm_relay/capabilities.hpp"
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/event_ingestor.hpp"
#include "evm_relay/event_source.hpp"
#include "evm_relay/nonce_service.hpp"
#include "evm_relay/price_converter.hpp"
#include "evm_relay/rpc.hpp"
#include "evm_relay/submitter.hpp"
#include "evm_relay/tx_record.hpp"

namespace evm_relay {
    enum class PipelineState {
        Idle,
        Ingesting,
        Converting,
        NonceFetch,
        Building,
        Signing,
        RecoveringSignature,
        Encoding,
        Submitting,
        Succeeded,
        Failed,
    };

    [[nodiscard]] std::string_view stateName(PipelineState state) noexcept;

    struct TransferOutcome {
        TransferIntent intent;
        PipelineState state = PipelineState::Idle;
        /// Last state entered before the failure; Idle for successful outcomes.
        PipelineState failedAt = PipelineState::Idle;
        std::optional<ErrorKind> errorKind;
        std::string error;
        /// Signing address the intent was sent from, once known.
        std::optional<Address> sender;
        std::optional<std::string> txHash;
        std::optional<intx::uint256> valueWei;
        std::optional<uint64_t> nonce;
        bool degradedConversion = false;

        [[nodiscard]] bool succeeded() const noexcept { return state == PipelineState::Succeeded; }
    };

    struct BatchReport {
        std::vector<TransferOutcome> outcomes;

        [[nodiscard]] size_t succeeded() const noexcept;
        [[nodiscard]] size_t failed() const noexcept { return outcomes.size() - succeeded(); }
    };

    struct OrchestratorOptions {
        std::string keyId = "test_key_1";
        DerivationPath derivationPath;
        /// Reject unknown destination chain keys instead of falling back to the default profile.
        bool strictChains = false;
    };

    struct OrchestratorDependencies {
        std::shared_ptr<SigningCapability> signer;
        std::shared_ptr<PublicKeyCapability> publicKeys;
        std::shared_ptr<RpcAggregator> rpc;
        std::shared_ptr<PriceConverter> prices;
        /// Needed only by relayLedger.
        std::shared_ptr<EventSource> events;
        std::shared_ptr<TxRecord> record;
        ChainRegistry registry;
    };

    /**
     * Runs the ingest -> convert -> nonce -> build -> sign -> recover -> encode -> submit pipeline.
     *
     * Every intent is processed independently and ends as a TransferOutcome; a failure in one intent never stops the
     * rest of its batch. Intents sharing a signing address and chain are serialized from nonce fetch through
     * submission. Each call may sign under its own derivation path (a per-caller identity); without one the
     * configured path is used. Public keys are fetched once per path and cached.
     */
    class BridgeOrchestrator {
        OrchestratorDependencies deps_;
        OrchestratorOptions options_;
        NonceService nonces_;
        Submitter submitter_;

        std::mutex publicKeyMutex_;
        std::map<DerivationPath, PublicKeyBytes> publicKeys_;

        std::mutex sendLocksMutex_;
        std::map<std::string, std::shared_ptr<std::mutex>> sendLocks_;

        [[nodiscard]] PublicKeyBytes signerPublicKey(const DerivationPath &path);
        [[nodiscard]] std::shared_ptr<std::mutex> sendLockFor(uint64_t chainId, const Address &sender);
        [[nodiscard]] ChainProfile chainFor(std::string_view key) const;
        [[nodiscard]] TransferOutcome runPipeline(const TransferIntent &intent, const DerivationPath &path);
        [[nodiscard]] BatchReport runBatch(const std::vector<TransferIntent> &intents);

    public:
        BridgeOrchestrator(OrchestratorDependencies deps, OrchestratorOptions options);

        BridgeOrchestrator(const BridgeOrchestrator &) = delete;
        BridgeOrchestrator &operator=(const BridgeOrchestrator &) = delete;

        /// Address the configured key id and derivation path sign for.
        [[nodiscard]] std::future<Address> deriveAddress();
        /// Address for the configured key id under a caller's own derivation path.
        [[nodiscard]] std::future<Address> deriveAddress(DerivationPath path);

        [[nodiscard]] std::future<TransferOutcome> buildAndSend(TransferIntent intent);
        /// Sends from the address of path instead of the configured one; nonce and signature follow that address.
        [[nodiscard]] std::future<TransferOutcome> buildAndSend(TransferIntent intent, DerivationPath path);

        /// Ingests a getEvents payload for chainKey and relays every intent it yields.
        [[nodiscard]] std::future<BatchReport> processBatch(nlohmann::json batch, std::string chainKey);

        /// Fetches the ledger window starting at startLedger from the event source, then behaves as processBatch.
        [[nodiscard]] std::future<BatchReport> relayLedger(uint64_t startLedger, std::string chainKey);

        [[nodiscard]] std::optional<std::string> latestTransactionHash() const { return deps_.record->latest(); }
    };
} // namespace evm_relay
