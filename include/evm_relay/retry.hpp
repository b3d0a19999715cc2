#pragma once

#include <algorithm>
#include <chrono>
#include <future>
#include <string>
#include <string_view>
#include <thread>
#include <spdlog/spdlog.h>

namespace evm_relay {
    inline constexpr int MAX_RPC_ATTEMPTS = 3;
    inline constexpr int BASE_RETRY_DELAY_MS = 1000;
    inline constexpr int MAX_RETRY_BACKOFF_MS = 30000;

    template<typename Func>
    auto executeWithRetrySync(Func &&func, const std::string_view operation, const int maxAttempts = MAX_RPC_ATTEMPTS,
                              const std::chrono::milliseconds baseDelay = std::chrono::milliseconds(BASE_RETRY_DELAY_MS))
            -> decltype(func()) {
        int attemptCount = 0;
        auto backoff = baseDelay;
        while (true) {
            ++attemptCount;
            try {
                return func();
            } catch (const std::exception &e) {
                if (attemptCount >= maxAttempts) {
                    spdlog::error("Fatal error in {} after {} attempts: {}", operation, attemptCount, e.what());
                    throw;
                }
                spdlog::warn("{} attempt {} failed: {}", operation, attemptCount, e.what());
                std::this_thread::sleep_for(backoff);
                backoff = std::min(backoff * 2, std::chrono::milliseconds(MAX_RETRY_BACKOFF_MS));
            }
        }
    }

    template<typename Func>
    auto executeWithRetry(Func &&func, const std::string_view operation, const int maxAttempts = MAX_RPC_ATTEMPTS) {
        return std::async(std::launch::async,
                          [func = std::forward<Func>(func), op = std::string(operation), maxAttempts]() mutable {
                              return executeWithRetrySync(func, op, maxAttempts);
                          });
    }
} // namespace evm_relay
