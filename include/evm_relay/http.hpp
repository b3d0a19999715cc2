#pragma once

#include <functional>
#include <future>
#include <string>
#include <string_view>
#include <vector>
#include "evm_relay/curl_pool.hpp"

namespace evm_relay {
    struct HttpHeader {
        std::string name;
        std::string value;

        bool operator==(const HttpHeader &) const = default;
    };

    struct HttpResponse {
        long status = 0;
        std::vector<HttpHeader> headers;
        std::string body;

        [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    /// Canonicalizes a raw response so that independent fetches of the same resource compare equal.
    using ResponseTransform = std::function<HttpResponse(HttpResponse)>;

    struct HttpRequest {
        std::string url;
        std::string method = "GET";
        std::vector<HttpHeader> headers;
        std::string body;
        size_t maxResponseBytes = MAX_RESPONSE_SIZE;
        ResponseTransform transform;
        int maxAttempts = 1;
    };

    class HttpClient {
    public:
        virtual ~HttpClient() = default;
        [[nodiscard]] virtual std::future<HttpResponse> fetch(HttpRequest request) = 0;
    };

    class CurlHttpClient final : public HttpClient {
    public:
        [[nodiscard]] std::future<HttpResponse> fetch(HttpRequest request) override;
    };

    /// Keeps only the named headers (case-insensitive), dropping dates, request ids and other per-fetch noise.
    [[nodiscard]] std::vector<HttpHeader> retainHeaders(const std::vector<HttpHeader> &headers,
                                                        const std::vector<std::string_view> &names);
} // namespace evm_relay
