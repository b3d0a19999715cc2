#include "evm_relay/event_ingestor.hpp"

#include <charconv>
#include <initializer_list>
#include <spdlog/spdlog.h>
#include "evm_relay/rlp.hpp"

namespace evm_relay {
    using json = nlohmann::json;

    namespace {
        const json *findEvents(const json &batch) {
            if (batch.is_array())
                return &batch;
            if (!batch.is_object())
                return nullptr;
            const json *holder = &batch;
            if (const auto result = batch.find("result"); result != batch.end() && result->is_object())
                holder = &*result;
            if (const auto it = holder->find("events"); it != holder->end() && it->is_array())
                return &*it;
            return nullptr;
        }

        const json *findMap(const json &event) {
            for (const char *key: {"valueJson", "value"}) {
                const auto it = event.find(key);
                if (it == event.end())
                    continue;
                if (it->is_array())
                    return &*it;
                if (it->is_object()) {
                    if (const auto map = it->find("map"); map != it->end() && map->is_array())
                        return &*map;
                }
            }
            return nullptr;
        }

        std::optional<std::string> optionalString(const json &object, const char *key) {
            if (!object.is_object())
                return std::nullopt;
            const auto it = object.find(key);
            if (it == object.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        }

        std::optional<std::string> stringValue(const json &val, std::initializer_list<const char *> keys) {
            if (val.is_string())
                return val.get<std::string>();
            for (const char *key: keys) {
                if (auto value = optionalString(val, key))
                    return value;
            }
            return std::nullopt;
        }

        std::optional<uint64_t> parseDecimal(const std::string_view text) {
            uint64_t value = 0;
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (ec != std::errc{} || ptr != end || text.empty())
                return std::nullopt;
            return value;
        }

        std::optional<uint64_t> scalarAmount(const json &value) {
            if (value.is_string())
                return parseDecimal(value.get_ref<const std::string &>());
            if (value.is_number_unsigned())
                return value.get<uint64_t>();
            if (value.is_number_integer()) {
                const auto signedValue = value.get<int64_t>();
                return signedValue < 0 ? std::nullopt : std::optional<uint64_t>(static_cast<uint64_t>(signedValue));
            }
            return std::nullopt;
        }

        std::optional<uint64_t> parseDestChain(const json &val) {
            if (val.is_object()) {
                if (const auto bytes = optionalString(val, "bytes")) {
                    try {
                        return safeHexToUint64(*bytes);
                    } catch (const RLPException &e) {
                        spdlog::debug("Ignoring dest_chain bytes '{}': {}", *bytes, e.what());
                        return std::nullopt;
                    }
                }
                for (const char *key: {"u32", "u64", "i32", "i64"}) {
                    if (const auto it = val.find(key); it != val.end())
                        return EventIngestor::parseAmount(*it);
                }
            }
            return std::nullopt;
        }

        std::optional<TransferIntent> parseEvent(const json &event, const std::string_view destinationChainKey,
                                                 const size_t index) {
            if (!event.is_object()) {
                spdlog::warn("Skipping event {}: not an object", index);
                return std::nullopt;
            }
            const json *map = findMap(event);
            if (!map) {
                spdlog::warn("Skipping event {}: no decoded value map", index);
                return std::nullopt;
            }
            TransferIntent intent;
            intent.destinationChainKey = std::string(destinationChainKey);
            intent.eventId = optionalString(event, "id");
            intent.sourceTxHash = optionalString(event, "txHash");
            for (const auto &entry: *map) {
                if (!entry.is_object() || !entry.contains("key") || !entry.contains("val"))
                    continue;
                const auto symbol = stringValue(entry["key"], {"symbol", "string"});
                if (!symbol)
                    continue;
                const auto &val = entry["val"];
                if (*symbol == "recipient_address") {
                    intent.recipient = stringValue(val, {"string", "address"}).value_or("");
                } else if (*symbol == "in_amount") {
                    intent.sourceAmount = EventIngestor::parseAmount(val).value_or(0);
                } else if (*symbol == "dest_chain") {
                    intent.eventDestChain = parseDestChain(val);
                } else if (*symbol == "dest_token") {
                    intent.destToken = stringValue(val, {"string", "symbol", "address"});
                } else if (*symbol == "from_token") {
                    intent.fromToken = stringValue(val, {"address", "string"});
                }
            }
            if (intent.recipient.empty()) {
                spdlog::warn("Skipping event {}{}: missing recipient_address", index,
                             intent.eventId ? " (" + *intent.eventId + ")" : std::string{});
                return std::nullopt;
            }
            if (intent.sourceAmount == 0) {
                spdlog::warn("Skipping event {}{}: in_amount missing, malformed or zero", index,
                             intent.eventId ? " (" + *intent.eventId + ")" : std::string{});
                return std::nullopt;
            }
            return intent;
        }
    } // namespace

    double scaleToWholeUnits(const uint64_t minorUnits) noexcept {
        return static_cast<double>(minorUnits) / static_cast<double>(SOURCE_UNIT_SCALE);
    }

    std::optional<uint64_t> EventIngestor::parseAmount(const json &value) {
        const json *amount = &value;
        if (value.is_object()) {
            for (const char *key: {"i128", "u128", "i64", "u64"}) {
                if (const auto it = value.find(key); it != value.end()) {
                    amount = &*it;
                    break;
                }
            }
        }
        if (!amount->is_object())
            return scalarAmount(*amount);

        // 128-bit halves; anything that does not fit in the low word is rejected.
        const auto lo = amount->find("lo");
        if (lo == amount->end())
            return std::nullopt;
        if (const auto hi = amount->find("hi"); hi != amount->end()) {
            const auto high = scalarAmount(*hi);
            if (!high || *high != 0)
                return std::nullopt;
        }
        return scalarAmount(*lo);
    }

    std::vector<TransferIntent> EventIngestor::extractIntents(const json &batch, const std::string_view destinationChainKey) {
        std::vector<TransferIntent> intents;
        const json *events = findEvents(batch);
        if (!events) {
            spdlog::warn("Event batch has no events array; nothing to ingest");
            return intents;
        }
        for (size_t i = 0; i < events->size(); ++i) {
            if (auto intent = parseEvent((*events)[i], destinationChainKey, i))
                intents.push_back(std::move(*intent));
        }
        spdlog::info("Ingested {} transfer intent(s) from {} event(s)", intents.size(), events->size());
        return intents;
    }

    std::vector<TransferIntent> EventIngestor::extractIntentsFromText(const std::string_view rawBatch,
                                                                      const std::string_view destinationChainKey) {
        const auto batch = json::parse(rawBatch, nullptr, false);
        if (batch.is_discarded()) {
            spdlog::warn("Event batch is not valid JSON; nothing to ingest");
            return {};
        }
        return extractIntents(batch, destinationChainKey);
    }
} // namespace evm_relay
