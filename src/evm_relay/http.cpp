#include "evm_relay/http.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <fmt/format.h>
#include "evm_relay/retry.hpp"

namespace evm_relay {
    namespace {
        size_t curlHeaderCallback(char *buffer, const size_t size, const size_t nitems, void *userp) noexcept {
            auto *headers = static_cast<std::vector<HttpHeader> *>(userp);
            const size_t total = size * nitems;
            const std::string_view line(buffer, total);
            if (const auto colon = line.find(':'); colon != std::string_view::npos) {
                auto value = line.substr(colon + 1);
                while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                    value.remove_prefix(1);
                while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
                    value.remove_suffix(1);
                headers->push_back({std::string(line.substr(0, colon)), std::string(value)});
            }
            return total;
        }

        bool equalsIgnoreCase(const std::string_view a, const std::string_view b) noexcept {
            return std::ranges::equal(a, b, [](const char x, const char y) {
                return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
            });
        }

        HttpResponse performRequest(const HttpRequest &request) {
            const auto handle = getCurlPool().acquire();
            if (!handle)
                throw std::runtime_error("Failed to acquire CURL handle");
            HttpResponse response;
            CurlCallbackData callbackData{&response.body, request.maxResponseBytes, 0};
            curl_slist *rawHeaders = nullptr;
            for (const auto &[name, value]: request.headers) {
                const auto line = fmt::format("{}: {}", name, value);
                curl_slist *appended = curl_slist_append(rawHeaders, line.c_str());
                if (!appended) {
                    curl_slist_free_all(rawHeaders);
                    throw std::runtime_error("Failed to create headers");
                }
                rawHeaders = appended;
            }
            const std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(rawHeaders, &curl_slist_free_all);
            curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
            if (request.method == "POST") {
                curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
                curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            } else if (request.method != "GET") {
                curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
            if (headers)
                curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
            curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, curlWriteCallback);
            curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &callbackData);
            curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, curlHeaderCallback);
            curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &response.headers);
            if (const auto res = curl_easy_perform(handle.get()); res != CURLE_OK)
                throw std::runtime_error(fmt::format("CURL request to {} failed: {}", request.url, curl_easy_strerror(res)));
            curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
            return response;
        }
    } // namespace

    std::future<HttpResponse> CurlHttpClient::fetch(HttpRequest request) {
        const int attempts = request.maxAttempts;
        return executeWithRetry(
                [request = std::move(request)] {
                    auto response = performRequest(request);
                    if (request.transform)
                        response = request.transform(std::move(response));
                    return response;
                },
                "HTTP fetch", attempts);
    }

    std::vector<HttpHeader> retainHeaders(const std::vector<HttpHeader> &headers,
                                          const std::vector<std::string_view> &names) {
        std::vector<HttpHeader> kept;
        for (const auto &header: headers) {
            if (std::ranges::any_of(names, [&](const std::string_view name) { return equalsIgnoreCase(header.name, name); }))
                kept.push_back(header);
        }
        return kept;
    }
} // namespace evm_relay
