#pragma once

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include "evm_relay/chain_registry.hpp"
#include "evm_relay/errors.hpp"

namespace evm_relay {
    using json = nlohmann::json;

    struct RpcServices {
        uint64_t chainId = 0;
        std::vector<std::string> endpoints;

        [[nodiscard]] static RpcServices forChain(const ChainProfile &chain) { return {chain.chainId, chain.rpcEndpoints}; }
    };

    /// One provider's answer: the JSON-RPC response object, or the transport failure that prevented one.
    struct ProviderReply {
        std::string provider;
        std::optional<json> response;
        std::string transportError;

        [[nodiscard]] static ProviderReply ok(std::string provider, json response) {
            return {std::move(provider), std::move(response), {}};
        }
        [[nodiscard]] static ProviderReply failed(std::string provider, std::string error) {
            return {std::move(provider), std::nullopt, std::move(error)};
        }
    };

    /// Per-provider classifications of one call. Consistent when every provider produced an equal value.
    template<typename T>
    class MultiResult {
        std::vector<std::pair<std::string, T>> results_;

    public:
        explicit MultiResult(std::vector<std::pair<std::string, T>> results) : results_(std::move(results)) {}

        [[nodiscard]] bool isConsistent() const {
            for (const auto &[provider, value]: results_) {
                if (!(value == results_.front().second))
                    return false;
            }
            return !results_.empty();
        }
        [[nodiscard]] const T &value() const { return results_.front().second; }
        [[nodiscard]] const std::vector<std::pair<std::string, T>> &results() const noexcept { return results_; }
    };

    template<typename T, typename Classify>
    MultiResult<T> reconcile(const std::vector<ProviderReply> &replies, Classify &&classify) {
        if (replies.empty())
            throw RelayException(ErrorKind::RpcError, "No provider replies received");
        std::vector<std::pair<std::string, T>> results;
        results.reserve(replies.size());
        for (const auto &reply: replies) {
            results.emplace_back(reply.provider, classify(reply));
        }
        return MultiResult<T>(std::move(results));
    }

    /// Builds "provider: description; provider: description" for inconsistency reports.
    template<typename T, typename Describe>
    std::string describeResults(const MultiResult<T> &result, Describe &&describe) {
        std::string out;
        for (const auto &[provider, value]: result.results()) {
            if (!out.empty())
                out += "; ";
            out += fmt::format("{}: {}", provider, describe(value));
        }
        return out;
    }

    [[nodiscard]] json makeJsonRpcRequest(std::string_view method, json params, int id = 1);

    /// Extracts error.message (or the raw error document) from a JSON-RPC error response.
    [[nodiscard]] std::string jsonRpcErrorMessage(const json &response);

    class RpcAggregator {
    public:
        virtual ~RpcAggregator() = default;
        [[nodiscard]] virtual std::future<std::vector<ProviderReply>> call(const RpcServices &services,
                                                                           std::string_view method, json params) = 0;
    };

    /**
     * Sends the same JSON-RPC request to every endpoint of a chain over libcurl. Reads are retried with backoff;
     * eth_sendRawTransaction is sent exactly once per provider.
     */
    class CurlRpcAggregator final : public RpcAggregator {
        int readAttempts_;

    public:
        explicit CurlRpcAggregator(int readAttempts = 3) : readAttempts_(readAttempts) {}

        [[nodiscard]] std::future<std::vector<ProviderReply>> call(const RpcServices &services, std::string_view method,
                                                                   json params) override;

        [[nodiscard]] static json postJsonRpc(std::string_view endpoint, const json &payload);
    };
} // namespace evm_relay
