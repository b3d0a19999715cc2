#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/http.hpp"

namespace evm_relay {
    inline constexpr uint64_t EVENT_LEDGER_WINDOW = 5;
    inline constexpr int EVENT_PAGE_LIMIT = 10;
    inline constexpr size_t EVENT_RESPONSE_MAX_BYTES = 2'000'000;
    inline constexpr int EVENT_REQUEST_ID = 8675309;

    /**
     * Drops the per-fetch fields of a Soroban getEvents response (request id, latestLedger, cursor, _links, _meta)
     * and every header except Content-Type. A body that is not JSON is returned unchanged.
     */
    [[nodiscard]] HttpResponse normalizeEventsResponse(HttpResponse response);

    /// Pulls contract events for a ledger window from a Soroban RPC node.
    class EventSource {
        std::shared_ptr<HttpClient> http_;
        StellarProfile profile_;

    public:
        EventSource(std::shared_ptr<HttpClient> http, StellarProfile profile) :
            http_(std::move(http)), profile_(std::move(profile)) {}

        [[nodiscard]] const StellarProfile &profile() const noexcept { return profile_; }

        /// getEvents over [startLedger, startLedger + EVENT_LEDGER_WINDOW]. Fails with EventFetchFailed.
        [[nodiscard]] std::future<nlohmann::json> fetchEvents(uint64_t startLedger) const;

        [[nodiscard]] static nlohmann::json buildRequest(const std::string &contractId, uint64_t startLedger);
    };
} // namespace evm_relay
