#include <cstdint>
#include <stdexcept>
#include <string>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "evm_relay/capabilities.hpp"
#include "evm_relay/config.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/event_ingestor.hpp"
#include "evm_relay/setup.hpp"

using namespace evm_relay;

int main(const int argc, char **argv) {
    try {
        spdlog::set_level(spdlog::level::info);
        if (argc < 3)
            throw std::runtime_error("Usage: send_transfer <recipient> <amount in minor units> [destination chain key] [caller id]");
        TransferIntent intent;
        intent.recipient = argv[1];
        intent.sourceAmount = std::stoull(argv[2]);
        intent.destinationChainKey = argc > 3 ? argv[3] : std::string(HOLESKY_KEY);
        const auto config = loadRelayConfig();
        spdlog::set_level(config.logLevel);

        const auto orchestrator = makeLiveOrchestrator(config, intent.destinationChainKey);
        spdlog::info("- TRANSFER {:.7f} TO {} ON CHAIN {} -", scaleToWholeUnits(intent.sourceAmount), intent.recipient,
                     intent.destinationChainKey);
        const auto outcome = argc > 4 ? orchestrator->buildAndSend(intent, callerDerivationPath(argv[4])).get()
                                      : orchestrator->buildAndSend(intent).get();
        if (!outcome.succeeded()) {
            throw std::runtime_error(fmt::format("{} at {}: {}",
                                                 outcome.errorKind ? errorKindName(*outcome.errorKind) : "Error",
                                                 stateName(outcome.failedAt), outcome.error));
        }
        if (outcome.degradedConversion)
            spdlog::warn("Price feed unavailable, value computed with the fallback rate");
        spdlog::info("Sender {}, nonce {}, value {} wei", outcome.sender->toChecksumHex(), *outcome.nonce,
                     intx::to_string(*outcome.valueWei));
        spdlog::info("Transaction hash: {}", *outcome.txHash);
        return 0;
    } catch (const std::exception &e) {
        spdlog::error("Critical error: {}", e.what());
        return 1;
    }
}
