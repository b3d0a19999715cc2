#include "evm_relay/event_source.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "evm_relay/errors.hpp"

namespace evm_relay {
    using json = nlohmann::json;

    HttpResponse normalizeEventsResponse(HttpResponse response) {
        response.headers = retainHeaders(response.headers, {"Content-Type"});
        auto body = json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object())
            return response;
        body.erase("id");
        if (const auto result = body.find("result"); result != body.end() && result->is_object()) {
            for (const char *volatileField: {"latestLedger", "latestLedgerCloseTime", "oldestLedger",
                                             "oldestLedgerCloseTime", "cursor", "_links", "_meta"}) {
                result->erase(volatileField);
            }
        }
        response.body = body.dump();
        return response;
    }

    json EventSource::buildRequest(const std::string &contractId, const uint64_t startLedger) {
        return {{"jsonrpc", "2.0"},
                {"id", EVENT_REQUEST_ID},
                {"method", "getEvents"},
                {"params",
                 {{"startLedger", startLedger},
                  {"endLedger", startLedger + EVENT_LEDGER_WINDOW},
                  {"xdrFormat", "json"},
                  {"filters", json::array({{{"type", "contract"}, {"contractIds", json::array({contractId})}, {"topics", json::array()}}})},
                  {"pagination", {{"limit", EVENT_PAGE_LIMIT}}}}}};
    }

    std::future<json> EventSource::fetchEvents(const uint64_t startLedger) const {
        HttpRequest request;
        request.url = profile_.rpcEndpoint;
        request.method = "POST";
        request.headers = {{"Content-Type", "application/json"}};
        request.body = buildRequest(profile_.contractId, startLedger).dump();
        request.maxResponseBytes = EVENT_RESPONSE_MAX_BYTES;
        request.transform = normalizeEventsResponse;
        request.maxAttempts = 3;
        auto pending = http_->fetch(std::move(request));
        return std::async(std::launch::async, [pending = std::move(pending), startLedger]() mutable {
            HttpResponse response;
            try {
                response = pending.get();
            } catch (const std::exception &e) {
                throw RelayException(ErrorKind::EventFetchFailed, fmt::format("getEvents transport: {}", e.what()));
            }
            if (!response.ok())
                throw RelayException(ErrorKind::EventFetchFailed, fmt::format("getEvents HTTP status {}", response.status));
            auto body = json::parse(response.body, nullptr, false);
            if (body.is_discarded())
                throw RelayException(ErrorKind::EventFetchFailed, "getEvents returned a non-JSON body");
            if (body.contains("error"))
                throw RelayException(ErrorKind::EventFetchFailed, fmt::format("getEvents error: {}", body["error"].dump()));
            spdlog::debug("Fetched events for ledgers {}..{}", startLedger, startLedger + EVENT_LEDGER_WINDOW);
            return body;
        });
    }
} // namespace evm_relay
