#include "evm_relay/orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "evm_relay/rlp.hpp"
#include "evm_relay/signature.hpp"
#include "evm_relay/transaction.hpp"

namespace evm_relay {
    namespace {
        std::string intentLabel(const TransferIntent &intent) {
            if (intent.eventId)
                return fmt::format("event {}", *intent.eventId);
            return fmt::format("transfer to {}", intent.recipient);
        }

        template<typename T>
        T awaitCapability(std::future<T> pending, const std::string_view what) {
            try {
                return pending.get();
            } catch (const RelayException &) {
                throw;
            } catch (const std::exception &e) {
                throw RelayException(ErrorKind::SigningFailed, fmt::format("{}: {}", what, e.what()));
            }
        }
    } // namespace

    std::string_view stateName(const PipelineState state) noexcept {
        switch (state) {
            case PipelineState::Idle:
                return "Idle";
            case PipelineState::Ingesting:
                return "Ingesting";
            case PipelineState::Converting:
                return "Converting";
            case PipelineState::NonceFetch:
                return "NonceFetch";
            case PipelineState::Building:
                return "Building";
            case PipelineState::Signing:
                return "Signing";
            case PipelineState::RecoveringSignature:
                return "RecoveringSignature";
            case PipelineState::Encoding:
                return "Encoding";
            case PipelineState::Submitting:
                return "Submitting";
            case PipelineState::Succeeded:
                return "Succeeded";
            case PipelineState::Failed:
                return "Failed";
        }
        return "Unknown";
    }

    size_t BatchReport::succeeded() const noexcept {
        return static_cast<size_t>(std::ranges::count_if(outcomes, [](const TransferOutcome &o) { return o.succeeded(); }));
    }

    BridgeOrchestrator::BridgeOrchestrator(OrchestratorDependencies deps, OrchestratorOptions options) :
        deps_(std::move(deps)), options_(std::move(options)), nonces_(deps_.rpc), submitter_(deps_.rpc, deps_.record) {
        if (!deps_.signer || !deps_.publicKeys || !deps_.rpc || !deps_.prices || !deps_.record)
            throw std::invalid_argument("BridgeOrchestrator requires signer, public key, RPC, price and record services");
    }

    PublicKeyBytes BridgeOrchestrator::signerPublicKey(const DerivationPath &path) {
        std::scoped_lock lock(publicKeyMutex_);
        if (const auto it = publicKeys_.find(path); it != publicKeys_.end())
            return it->second;
        const auto key = awaitCapability(deps_.publicKeys->publicKey(options_.keyId, path), "public key lookup");
        static_cast<void>(evm_relay::deriveAddress(key));
        publicKeys_.emplace(path, key);
        return key;
    }

    std::shared_ptr<std::mutex> BridgeOrchestrator::sendLockFor(const uint64_t chainId, const Address &sender) {
        std::scoped_lock lock(sendLocksMutex_);
        auto &slot = sendLocks_[fmt::format("{}:{}", chainId, sender.toHex())];
        if (!slot)
            slot = std::make_shared<std::mutex>();
        return slot;
    }

    ChainProfile BridgeOrchestrator::chainFor(const std::string_view key) const {
        if (options_.strictChains)
            return deps_.registry.resolveStrict(key);
        if (!deps_.registry.isKnown(key))
            spdlog::warn("Unknown destination chain '{}', using the default profile", key);
        return deps_.registry.resolve(key);
    }

    std::future<Address> BridgeOrchestrator::deriveAddress() { return deriveAddress(options_.derivationPath); }

    std::future<Address> BridgeOrchestrator::deriveAddress(DerivationPath path) {
        return std::async(std::launch::async,
                          [this, path = std::move(path)] { return evm_relay::deriveAddress(signerPublicKey(path)); });
    }

    TransferOutcome BridgeOrchestrator::runPipeline(const TransferIntent &intent, const DerivationPath &path) {
        TransferOutcome outcome;
        outcome.intent = intent;
        const auto label = intentLabel(intent);
        auto state = PipelineState::Idle;
        const auto enter = [&](const PipelineState next) {
            spdlog::debug("{}: {} -> {}", label, stateName(state), stateName(next));
            state = next;
        };
        const auto fail = [&](std::optional<ErrorKind> kind, std::string message) {
            outcome.failedAt = state;
            outcome.errorKind = kind;
            outcome.error = std::move(message);
            enter(PipelineState::Failed);
            outcome.state = state;
            spdlog::error("{} failed during {}: {}", label, stateName(outcome.failedAt), outcome.error);
        };

        try {
            enter(PipelineState::Converting);
            if (intent.sourceAmount == 0)
                throw RelayException(ErrorKind::InvalidAmount, "Transfer amount must be positive");
            const auto conversion = deps_.prices->toWei(intent.sourceAmount).get();
            outcome.valueWei = conversion.wei;
            outcome.degradedConversion = conversion.degraded;
            if (conversion.wei == 0)
                throw RelayException(ErrorKind::InvalidAmount,
                                     fmt::format("{} minor units convert to zero wei", intent.sourceAmount));

            enter(PipelineState::NonceFetch);
            const auto chain = chainFor(intent.destinationChainKey);
            const auto publicKey = signerPublicKey(path);
            const auto sender = evm_relay::deriveAddress(publicKey);
            outcome.sender = sender;
            const auto sendLock = sendLockFor(chain.chainId, sender);
            std::scoped_lock serialized(*sendLock);
            const auto nonce = nonces_.nextNonce(sender, chain).get();
            outcome.nonce = nonce;

            enter(PipelineState::Building);
            UnsignedTransaction tx;
            tx.chainId = chain.chainId;
            tx.nonce = nonce;
            tx.maxPriorityFeePerGas = chain.gas.maxPriorityFeePerGas;
            tx.maxFeePerGas = chain.gas.maxFeePerGas;
            tx.gasLimit = chain.gas.gasLimit;
            tx.to = Address::fromHex(intent.recipient);
            tx.value = conversion.wei;
            const auto unsignedBytes = TransactionCodec::encodeUnsigned(tx);
            const auto digest = TransactionCodec::digest(unsignedBytes);

            enter(PipelineState::Signing);
            const auto signature = awaitCapability(deps_.signer->sign(digest, options_.keyId, path), "signing");

            enter(PipelineState::RecoveringSignature);
            const auto yParity = recoverIndicator(digest, signature, publicKey);

            enter(PipelineState::Encoding);
            const auto signedHex = TransactionCodec::toHex(TransactionCodec::encodeSigned(tx, yParity, signature));

            enter(PipelineState::Submitting);
            outcome.txHash = submitter_.submit(signedHex, chain).get();

            enter(PipelineState::Succeeded);
            outcome.state = state;
            spdlog::info("{} relayed: {} wei to {} on chain {} with nonce {}, tx {}", label,
                         intx::to_string(conversion.wei), tx.to.toChecksumHex(), chain.chainId, nonce, *outcome.txHash);
        } catch (const RelayException &e) {
            fail(e.kind(), e.what());
        } catch (const RLPException &e) {
            fail(ErrorKind::InvalidInput, e.what());
        } catch (const std::exception &e) {
            fail(std::nullopt, e.what());
        }
        return outcome;
    }

    BatchReport BridgeOrchestrator::runBatch(const std::vector<TransferIntent> &intents) {
        BatchReport report;
        report.outcomes.reserve(intents.size());
        for (const auto &intent: intents)
            report.outcomes.push_back(runPipeline(intent, options_.derivationPath));
        if (!intents.empty())
            spdlog::info("Batch finished: {} succeeded, {} failed", report.succeeded(), report.failed());
        return report;
    }

    std::future<TransferOutcome> BridgeOrchestrator::buildAndSend(TransferIntent intent) {
        return buildAndSend(std::move(intent), options_.derivationPath);
    }

    std::future<TransferOutcome> BridgeOrchestrator::buildAndSend(TransferIntent intent, DerivationPath path) {
        return std::async(std::launch::async, [this, intent = std::move(intent), path = std::move(path)] {
            return runPipeline(intent, path);
        });
    }

    std::future<BatchReport> BridgeOrchestrator::processBatch(nlohmann::json batch, std::string chainKey) {
        return std::async(std::launch::async, [this, batch = std::move(batch), chainKey = std::move(chainKey)] {
            spdlog::debug("Batch for chain {}: {} -> {}", chainKey, stateName(PipelineState::Idle),
                          stateName(PipelineState::Ingesting));
            return runBatch(EventIngestor::extractIntents(batch, chainKey));
        });
    }

    std::future<BatchReport> BridgeOrchestrator::relayLedger(const uint64_t startLedger, std::string chainKey) {
        if (!deps_.events)
            throw std::logic_error("relayLedger requires an event source");
        auto pending = deps_.events->fetchEvents(startLedger);
        return std::async(std::launch::async, [this, pending = std::move(pending), chainKey = std::move(chainKey)]() mutable {
            return runBatch(EventIngestor::extractIntents(pending.get(), chainKey));
        });
    }
} // namespace evm_relay
