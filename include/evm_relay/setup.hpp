#pragma once

#include <memory>
#include <string_view>
#include "evm_relay/config.hpp"
#include "evm_relay/orchestrator.hpp"

namespace evm_relay {
    /// Wires the libcurl adapters, the local signer and the event source for chainKey into an orchestrator.
    [[nodiscard]] std::unique_ptr<BridgeOrchestrator> makeLiveOrchestrator(const RelayConfig &config,
                                                                           std::string_view chainKey);
} // namespace evm_relay
