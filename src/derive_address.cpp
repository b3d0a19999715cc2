#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "evm_relay/capabilities.hpp"
#include "evm_relay/config.hpp"
#include "evm_relay/setup.hpp"

using namespace evm_relay;

int main(const int argc, char **argv) {
    try {
        spdlog::set_level(spdlog::level::info);
        const auto config = loadRelayConfig();
        spdlog::set_level(config.logLevel);
        const auto orchestrator = makeLiveOrchestrator(config, HOLESKY_KEY);
        if (argc > 1) {
            const std::string caller = argv[1];
            const auto address = orchestrator->deriveAddress(callerDerivationPath(caller)).get();
            spdlog::info("Address of caller {} under key {}: {}", caller, config.keyId, address.toChecksumHex());
            return 0;
        }
        const auto address = orchestrator->deriveAddress().get();
        spdlog::info("Signer address for key {}: {}", config.keyId, address.toChecksumHex());
        return 0;
    } catch (const std::exception &e) {
        spdlog::error("Critical error: {}", e.what());
        return 1;
    }
}
