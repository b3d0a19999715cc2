#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace evm_relay {
    /// Soroban amounts are integers in 1/10,000,000 of the whole unit.
    inline constexpr uint64_t SOURCE_UNIT_SCALE = 10'000'000;

    struct TransferIntent {
        std::string recipient;
        uint64_t sourceAmount = 0;
        std::string destinationChainKey;
        std::optional<uint64_t> eventDestChain;
        std::optional<std::string> destToken;
        std::optional<std::string> fromToken;
        std::optional<std::string> eventId;
        std::optional<std::string> sourceTxHash;

        bool operator==(const TransferIntent &) const = default;
    };

    /// Whole-unit value of a minor-unit amount, for display and rate lookups.
    [[nodiscard]] double scaleToWholeUnits(uint64_t minorUnits) noexcept;

    /**
     * Extracts transfer intents from an untrusted getEvents payload.
     *
     * Accepts a bare array of events, {"events": [...]}, or a JSON-RPC response {"result": {"events": [...]}}.
     * Each event carries a map under "valueJson" or "value": [{"key": {"symbol": K}, "val": {...}}, ...]. Every field
     * is optional and type tolerant. An event produces an intent only when it yields a non-empty recipient and an
     * amount above zero; anything else is logged and skipped. Malformed input never throws.
     */
    class EventIngestor {
    public:
        [[nodiscard]] static std::vector<TransferIntent> extractIntents(const nlohmann::json &batch,
                                                                        std::string_view destinationChainKey);
        [[nodiscard]] static std::vector<TransferIntent> extractIntentsFromText(std::string_view rawBatch,
                                                                                std::string_view destinationChainKey);

        /**
         * in_amount as a decimal string, a non-negative integer, or {"lo": n} with "hi" absent or zero, optionally inside
         * one i128/u128/i64/u64 wrapper. Deeper nesting is rejected.
         */
        [[nodiscard]] static std::optional<uint64_t> parseAmount(const nlohmann::json &value);
    };
} // namespace evm_relay
