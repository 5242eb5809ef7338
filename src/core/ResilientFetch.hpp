#pragma once

#include <chrono>
#include <functional>
#include <random>
#include <string>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace relnotes {

struct RetryPolicy {
    int maxRetries{Constants::MAX_RETRIES};
    std::chrono::milliseconds baseDelay{Constants::RETRY_BASE_DELAY};
    double jitterRatio{Constants::RETRY_JITTER_RATIO};  // 0 disables jitter
};

/// Emitted once per retry, before sleeping
struct RetryEvent {
    std::string operation;
    int attempt{0};        // 1-based retry number
    int maxRetries{0};
    std::chrono::milliseconds delay{0};
    Error error;
};

/**
 * @brief Retry wrapper for remote history calls
 *
 * Runs a call returning Expected<T> and retries it while the error is
 * transient (rate limit, 5xx, network, timeout), up to maxRetries times
 * with exponential backoff: baseDelay * 2^(n-1), scaled by a random factor
 * in [1 - jitterRatio, 1 + jitterRatio].
 *
 * A rate-limit error whose reset time lies in the future waits until the
 * reset plus one second instead of the backoff value.
 *
 * Any other error (not found, unauthorized, ...) is returned from the first
 * attempt untouched. When retries run out, the last error is returned.
 *
 * Sleep and clock are injectable so tests run instantly.
 */
class ResilientFetch {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using RetryObserver = std::function<void(const RetryEvent&)>;

    explicit ResilientFetch(RetryPolicy policy = RetryPolicy{}, Sleeper sleeper = nullptr, Clock clock = nullptr);

    template <typename Call>
    auto execute(const std::string& operation, Call&& call) -> decltype(call()) {
        for (int attempt = 0;; ++attempt) {
            auto result = call();
            if (result) return result;
            if (!isTransient(result.error()) || attempt >= retryPolicy.maxRetries) {
                return result;
            }
            std::chrono::milliseconds delay = computeDelay(result.error(), attempt + 1);
            notifyRetry(RetryEvent{operation, attempt + 1, retryPolicy.maxRetries, delay, result.error()});
            sleeper(delay);
        }
    }

    /// Delay before retry number @p retryNumber (1-based) after @p err
    std::chrono::milliseconds computeDelay(const Error& err, int retryNumber);

    /// Jittered exponential backoff for retry number @p retryNumber (1-based)
    std::chrono::milliseconds backoffDelay(int retryNumber);

    void setRetryObserver(RetryObserver observer) { onRetry = std::move(observer); }
    const RetryPolicy& policy() const { return retryPolicy; }

private:
    RetryPolicy retryPolicy;
    Sleeper sleeper;
    Clock clock;
    RetryObserver onRetry;
    std::mt19937 rng;

    void notifyRetry(const RetryEvent& event);
};

}
