#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "evm_relay/event_ingestor.hpp"

using namespace evm_relay;
using json = nlohmann::json;

namespace {
    constexpr const char *RECIPIENT = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";

    json entry(const std::string &symbol, json val) { return {{"key", {{"symbol", symbol}}}, {"val", std::move(val)}}; }

    json event(json map, const std::string &id = "0000000001-0000000001") {
        return {{"type", "contract"}, {"id", id}, {"txHash", "ab12"}, {"valueJson", {{"map", std::move(map)}}}};
    }

    json transferEvent(json amount) {
        return event(json::array({entry("recipient_address", {{"string", RECIPIENT}}), entry("in_amount", std::move(amount)),
                                  entry("dest_chain", {{"bytes", "2105"}}), entry("dest_token", {{"string", "ETH"}}),
                                  entry("from_token", {{"address", "CAS3J7GYLGXMF6TDJBBYYSE3HQ6BBSMLNUQ34T6TZMYMW2EVH34XOWMA"}})}));
    }

    json batchOf(const std::vector<json> &events) { return {{"events", events}}; }
} // namespace

TEST(EventIngestor, AmountAsDecimalString) {
    const auto intents = EventIngestor::extractIntents(batchOf({transferEvent("110000000")}), "8453");
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].sourceAmount, 110000000u);
    EXPECT_EQ(intents[0].recipient, RECIPIENT);
    EXPECT_EQ(intents[0].destinationChainKey, "8453");
    EXPECT_EQ(intents[0].eventDestChain, 8453u);
    EXPECT_EQ(intents[0].destToken, "ETH");
    EXPECT_EQ(intents[0].fromToken, "CAS3J7GYLGXMF6TDJBBYYSE3HQ6BBSMLNUQ34T6TZMYMW2EVH34XOWMA");
    EXPECT_EQ(intents[0].eventId, "0000000001-0000000001");
    EXPECT_EQ(intents[0].sourceTxHash, "ab12");
}

TEST(EventIngestor, AmountAsNumber) {
    const auto intents = EventIngestor::extractIntents(batchOf({transferEvent(110000000)}), "8453");
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].sourceAmount, 110000000u);
}

TEST(EventIngestor, AmountAsLoStructure) {
    const auto intents = EventIngestor::extractIntents(batchOf({transferEvent({{"lo", 110000000}})}), "8453");
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].sourceAmount, 110000000u);

    const auto wrapped =
            EventIngestor::extractIntents(batchOf({transferEvent({{"i128", {{"hi", 0}, {"lo", 110000000}}}})}), "8453");
    ASSERT_EQ(wrapped.size(), 1u);
    EXPECT_EQ(wrapped[0].sourceAmount, 110000000u);
}

TEST(EventIngestor, MissingRecipientYieldsNothing) {
    const auto noRecipient = event(json::array({entry("in_amount", "110000000")}));
    EXPECT_TRUE(EventIngestor::extractIntents(batchOf({noRecipient}), "8453").empty());

    const auto emptyRecipient = event(json::array({entry("recipient_address", {{"string", ""}}),
                                                   entry("in_amount", "110000000")}));
    EXPECT_TRUE(EventIngestor::extractIntents(batchOf({emptyRecipient}), "8453").empty());
}

TEST(EventIngestor, OnlyWellFormedEventsProduceIntents) {
    const auto good = transferEvent("110000000");
    const auto zeroAmount = transferEvent("0");
    const auto garbage = json("not an event");
    const auto intents = EventIngestor::extractIntents(batchOf({zeroAmount, good, garbage}), "17000");
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].sourceAmount, 110000000u);
    EXPECT_EQ(intents[0].destinationChainKey, "17000");
}

TEST(EventIngestor, RejectsUnusableAmounts) {
    EXPECT_FALSE(EventIngestor::parseAmount("12ab").has_value());
    EXPECT_FALSE(EventIngestor::parseAmount("").has_value());
    EXPECT_FALSE(EventIngestor::parseAmount(-5).has_value());
    EXPECT_FALSE(EventIngestor::parseAmount(1.5).has_value());
    EXPECT_FALSE(EventIngestor::parseAmount({{"hi", 1}, {"lo", 5}}).has_value());
    EXPECT_FALSE(EventIngestor::parseAmount(json::array({1})).has_value());
    EXPECT_EQ(EventIngestor::parseAmount({{"u64", "42"}}), 42u);
}

TEST(EventIngestor, RejectsNestedAmountWrappers) {
    EXPECT_FALSE(EventIngestor::parseAmount({{"i128", {{"i128", "42"}}}}).has_value());
    EXPECT_FALSE(EventIngestor::parseAmount({{"lo", {{"lo", 5}}}}).has_value());
    EXPECT_FALSE(EventIngestor::parseAmount({{"u128", {{"hi", {{"u64", 0}}}, {"lo", 5}}}}).has_value());
}

TEST(EventIngestor, SurvivesDeeplyNestedAmount) {
    constexpr size_t depth = 200'000;
    std::string amount;
    amount.reserve(depth * 10 + 1);
    for (size_t i = 0; i < depth; ++i)
        amount += "{\"i128\":";
    amount += '1';
    amount.append(depth, '}');

    const auto valid = transferEvent("110000000").dump();
    auto hostile = transferEvent("0").dump();
    const std::string placeholder = "\"0\"";
    hostile.replace(hostile.find(placeholder), placeholder.size(), amount);
    const auto text = "{\"events\":[" + hostile + "," + valid + "]}";

    const auto intents = EventIngestor::extractIntentsFromText(text, "8453");
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].sourceAmount, 110000000u);
}

TEST(EventIngestor, IgnoresNestedResultWrappers) {
    const auto events = json::array({transferEvent("10000000")});
    const json nested = {{"result", {{"result", {{"events", events}}}}}};
    EXPECT_TRUE(EventIngestor::extractIntents(nested, "8453").empty());
}

TEST(EventIngestor, AcceptsResponseShapes) {
    const auto events = json::array({transferEvent("10000000")});
    EXPECT_EQ(EventIngestor::extractIntents(events, "8453").size(), 1u);
    const json rpcResponse = {{"jsonrpc", "2.0"}, {"id", 8675309}, {"result", {{"events", events}, {"latestLedger", 100}}}};
    EXPECT_EQ(EventIngestor::extractIntents(rpcResponse, "8453").size(), 1u);
    EXPECT_TRUE(EventIngestor::extractIntents(json::object(), "8453").empty());
    EXPECT_TRUE(EventIngestor::extractIntents(json(42), "8453").empty());
}

TEST(EventIngestor, ToleratesMalformedText) {
    EXPECT_TRUE(EventIngestor::extractIntentsFromText("{\"events\": [", "8453").empty());
    const auto text = batchOf({transferEvent("110000000")}).dump();
    EXPECT_EQ(EventIngestor::extractIntentsFromText(text, "8453").size(), 1u);
}

TEST(EventIngestor, ScalesMinorUnits) {
    EXPECT_DOUBLE_EQ(scaleToWholeUnits(110000000), 11.0);
    EXPECT_DOUBLE_EQ(scaleToWholeUnits(5000000), 0.5);
}
