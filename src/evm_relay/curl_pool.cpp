#include "evm_relay/curl_pool.hpp"

#include <chrono>
#include <stdexcept>

namespace evm_relay {
    size_t curlWriteCallback(const void *contents, const size_t size, const size_t nmemb, void *userp) noexcept {
        auto *data = static_cast<CurlCallbackData *>(userp);
        const auto totalSize = size * nmemb;
        if (data->currentSize.load() + totalSize > data->maxSize) {
            return 0;
        }
        data->response->append(static_cast<const char *>(contents), totalSize);
        data->currentSize.fetch_add(totalSize);
        return totalSize;
    }

    CurlPool::CurlPool() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        for (size_t i = 0; i < MIN_HANDLES; ++i) {
            if (auto *h = curl_easy_init()) {
                setupCurlHandle(h);
                handles_.emplace(h);
                ++totalCreated_;
            }
        }
    }

    CurlPool::~CurlPool() {
        shutdown_.store(true, std::memory_order_release);
        cv_.notify_all();
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, [this] { return activeHandles_.load(std::memory_order_acquire) == 0; });
            while (!handles_.empty())
                handles_.pop();
        }
        curl_global_cleanup();
    }

    CurlPool::Handle CurlPool::acquire() {
        std::unique_lock lock(mtx_);
        if (handles_.empty() && totalCreated_ < MAX_HANDLES) {
            lock.unlock();
            if (auto *h = curl_easy_init()) {
                setupCurlHandle(h);
                ++totalCreated_;
                activeHandles_.fetch_add(1, std::memory_order_acq_rel);
                return Handle(this, CurlPtr(h));
            }
            lock.lock();
        }
        if (!cv_.wait_for(lock, std::chrono::seconds(RPC_TIMEOUT_SECONDS),
                          [this] { return !handles_.empty() || shutdown_.load(std::memory_order_acquire); })) {
            throw std::runtime_error("Timeout acquiring CURL handle");
        }
        if (shutdown_.load(std::memory_order_acquire))
            throw std::runtime_error("Pool is shutting down");
        auto handle = std::move(handles_.front());
        handles_.pop();
        activeHandles_.fetch_add(1, std::memory_order_acq_rel);
        return Handle(this, std::move(handle));
    }

    void CurlPool::setupCurlHandle(CURL *h) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(RPC_TIMEOUT_SECONDS));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(RPC_CONNECT_TIMEOUT_SECONDS));
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    }

    void CurlPool::release(CurlPtr h) {
        if (!h)
            return;
        curl_easy_reset(h.get());
        setupCurlHandle(h.get());
        std::lock_guard lock(mtx_);
        if (handles_.size() < MAX_HANDLES) {
            handles_.push(std::move(h));
        }
        activeHandles_.fetch_sub(1, std::memory_order_acq_rel);
        cv_.notify_all();
    }

    CurlPool &getCurlPool() {
        static CurlPool pool;
        return pool;
    }
} // namespace evm_relay
