#include "evm_relay/rpc.hpp"

#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "evm_relay/curl_pool.hpp"
#include "evm_relay/retry.hpp"

namespace evm_relay {
    json makeJsonRpcRequest(const std::string_view method, json params, const int id) {
        return {{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}, {"id", id}};
    }

    std::string jsonRpcErrorMessage(const json &response) {
        if (!response.contains("error"))
            return {};
        const auto &error = response["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string())
            return error["message"].get<std::string>();
        if (error.is_string())
            return error.get<std::string>();
        return error.dump();
    }

    json CurlRpcAggregator::postJsonRpc(const std::string_view endpoint, const json &payload) {
        const auto handle = getCurlPool().acquire();
        if (!handle)
            throw std::runtime_error("Failed to acquire CURL handle");
        std::string response;
        response.reserve(8192);
        CurlCallbackData callbackData{&response, MAX_RESPONSE_SIZE, 0};
        const auto payloadStr = payload.dump();
        const std::string url(endpoint);
        curl_slist *rawHeaders = curl_slist_append(nullptr, "Content-Type: application/json");
        const std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(rawHeaders, &curl_slist_free_all);
        if (!headers)
            throw std::runtime_error("Failed to create headers");
        curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, payloadStr.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payloadStr.size()));
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, curlWriteCallback);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &callbackData);
        if (const auto res = curl_easy_perform(handle.get()); res != CURLE_OK)
            throw std::runtime_error(fmt::format("CURL request failed: {}", curl_easy_strerror(res)));
        long httpCode = 0;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &httpCode);
        if (httpCode < 200 || httpCode >= 300)
            throw std::runtime_error(fmt::format("HTTP error: {}", httpCode));
        return json::parse(response);
    }

    std::future<std::vector<ProviderReply>> CurlRpcAggregator::call(const RpcServices &services,
                                                                     const std::string_view method, json params) {
        const int attempts = method == "eth_sendRawTransaction" ? 1 : readAttempts_;
        return std::async(std::launch::async, [services, method = std::string(method), params = std::move(params),
                                               attempts] {
            if (services.endpoints.empty())
                throw RelayException(ErrorKind::RpcError,
                                     fmt::format("No RPC endpoints configured for chain {}", services.chainId));
            const json payload = makeJsonRpcRequest(method, params);
            std::vector<std::future<ProviderReply>> pending;
            pending.reserve(services.endpoints.size());
            for (const auto &endpoint: services.endpoints) {
                pending.push_back(std::async(std::launch::async, [endpoint, &payload, &method, attempts] {
                    try {
                        return ProviderReply::ok(endpoint, executeWithRetrySync([&] { return postJsonRpc(endpoint, payload); },
                                                                                method, attempts));
                    } catch (const std::exception &e) {
                        spdlog::warn("{} via {} failed: {}", method, endpoint, e.what());
                        return ProviderReply::failed(endpoint, e.what());
                    }
                }));
            }
            std::vector<ProviderReply> replies;
            replies.reserve(pending.size());
            for (auto &future: pending)
                replies.push_back(future.get());
            return replies;
        });
    }
} // namespace evm_relay
