#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace evm_relay {
    /// Holds the hash of the last successfully submitted transaction. Last write wins.
    class TxRecord {
        mutable std::shared_mutex mtx_;
        std::optional<std::string> latest_;

    public:
        void record(std::string txHash) {
            std::unique_lock lock(mtx_);
            latest_ = std::move(txHash);
        }

        [[nodiscard]] std::optional<std::string> latest() const {
            std::shared_lock lock(mtx_);
            return latest_;
        }
    };
} // namespace evm_relay
