#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <curl/curl.h>

namespace evm_relay {
    inline constexpr int RPC_CONNECT_TIMEOUT_SECONDS = 10;
    inline constexpr int RPC_TIMEOUT_SECONDS = 30;
    inline constexpr size_t CURL_POOL_SIZE = 32;
    inline constexpr size_t MAX_RESPONSE_SIZE = 10'000'000;

    struct CurlCallbackData {
        std::string *response;
        size_t maxSize;
        std::atomic<size_t> currentSize{0};
    };

    /// Appends to the response buffer; returns 0 (aborting the transfer) once the size cap would be exceeded.
    size_t curlWriteCallback(const void *contents, size_t size, size_t nmemb, void *userp) noexcept;

    class CurlPool {
        struct CurlDeleter {
            void operator()(CURL *curl) const noexcept {
                if (curl)
                    curl_easy_cleanup(curl);
            }
        };
        using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

        std::queue<CurlPtr> handles_;
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::atomic<bool> shutdown_{false};
        std::atomic<size_t> activeHandles_{0};
        std::atomic<size_t> totalCreated_{0};
        static constexpr size_t MAX_HANDLES = CURL_POOL_SIZE;
        static constexpr size_t MIN_HANDLES = 4;

        static void setupCurlHandle(CURL *h);
        void release(CurlPtr h);

    public:
        class Handle {
            CurlPool *pool_;
            CurlPtr curl_;

        public:
            Handle(CurlPool *p, CurlPtr c) : pool_(p), curl_(std::move(c)) {}
            Handle(const Handle &) = delete;
            Handle &operator=(const Handle &) = delete;
            Handle(Handle &&) = default;
            Handle &operator=(Handle &&) = default;
            ~Handle() {
                if (curl_ && pool_)
                    pool_->release(std::move(curl_));
            }
            [[nodiscard]] CURL *get() const { return curl_.get(); }
            explicit operator bool() const { return curl_ != nullptr; }
        };

        CurlPool();
        ~CurlPool();
        CurlPool(const CurlPool &) = delete;
        CurlPool &operator=(const CurlPool &) = delete;

        [[nodiscard]] Handle acquire();
    };

    CurlPool &getCurlPool();
} // namespace evm_relay
