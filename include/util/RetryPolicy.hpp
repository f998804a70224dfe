#pragma once

#include "util/errors.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <thread>

namespace sm::util {

// Exponential backoff: baseDelay * 2^n, capped at maxDelay, at most maxRetries re-attempts.
struct RetryPolicy {
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using OnRetry = std::function<void(unsigned int attempt, const MigrationError&)>;

    unsigned int maxRetries = 5;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{16000};
    Sleeper sleep = [](const std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };

    [[nodiscard]] std::chrono::milliseconds delayFor(const unsigned int retry) const {
        auto d = baseDelay;
        for (unsigned int i = 0; i < retry && d < maxDelay; ++i) d *= 2;
        return std::min(d, maxDelay);
    }

    template <typename Fn>
    auto run(Fn&& fn, const std::initializer_list<ErrorCode> retryOn, const OnRetry& onRetry = {}) const
        -> decltype(fn()) {
        for (unsigned int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const MigrationError& e) {
                const bool retryable = std::find(retryOn.begin(), retryOn.end(), e.code()) != retryOn.end();
                if (!retryable || attempt >= maxRetries) throw;
                if (onRetry) onRetry(attempt + 1, e);
                sleep(delayFor(attempt));
            }
        }
    }
};

}
