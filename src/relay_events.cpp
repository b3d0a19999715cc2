#include <cstdint>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "evm_relay/config.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/setup.hpp"

using namespace evm_relay;

int main(const int argc, char **argv) {
    try {
        spdlog::set_level(spdlog::level::info);
        if (argc < 2)
            throw std::runtime_error("Usage: relay_events <start ledger> [destination chain key]");
        const uint64_t startLedger = std::stoull(argv[1]);
        const std::string chainKey = argc > 2 ? argv[2] : std::string(HOLESKY_KEY);
        const auto config = loadRelayConfig();
        spdlog::set_level(config.logLevel);

        const auto orchestrator = makeLiveOrchestrator(config, chainKey);
        spdlog::info("- RELAY LEDGERS {}..{} TO CHAIN {} -", startLedger, startLedger + EVENT_LEDGER_WINDOW, chainKey);
        const auto report = orchestrator->relayLedger(startLedger, chainKey).get();
        if (report.outcomes.empty()) {
            spdlog::info("No transfer events in this window");
            return 0;
        }
        for (const auto &outcome: report.outcomes) {
            if (outcome.succeeded()) {
                spdlog::info("{} -> tx {}", outcome.intent.recipient, *outcome.txHash);
            } else {
                spdlog::error("{} -> {} at {}: {}", outcome.intent.recipient,
                              outcome.errorKind ? errorKindName(*outcome.errorKind) : "Error", stateName(outcome.failedAt),
                              outcome.error);
            }
        }
        if (const auto latest = orchestrator->latestTransactionHash())
            spdlog::info("Latest transaction: {}", *latest);
        return report.failed() == 0 ? 0 : 2;
    } catch (const std::exception &e) {
        spdlog::error("Critical error: {}", e.what());
        return 1;
    }
}
