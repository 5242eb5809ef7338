#include "core/ResilientFetch.hpp"

#include <sstream>
#include <thread>

#include "util/Logger.hpp"

namespace relnotes {

namespace {
    void realSleep(std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    }

    std::chrono::system_clock::time_point realNow() {
        return std::chrono::system_clock::now();
    }
}

ResilientFetch::ResilientFetch(RetryPolicy policy, Sleeper sleeperFn, Clock clockFn)
    : retryPolicy(policy),
      sleeper(sleeperFn ? std::move(sleeperFn) : Sleeper(realSleep)),
      clock(clockFn ? std::move(clockFn) : Clock(realNow)),
      rng(std::random_device{}()) {}

std::chrono::milliseconds ResilientFetch::backoffDelay(int retryNumber) {
    double base = static_cast<double>(retryPolicy.baseDelay.count());
    for (int i = 1; i < retryNumber; ++i) base *= 2.0;

    if (retryPolicy.jitterRatio > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - retryPolicy.jitterRatio, 1.0 + retryPolicy.jitterRatio);
        base *= dist(rng);
    }
    return std::chrono::milliseconds(static_cast<long long>(base));
}

std::chrono::milliseconds ResilientFetch::computeDelay(const Error& err, int retryNumber) {
    if (err.code == ErrorCode::RateLimited) {
        auto untilReset = std::chrono::duration_cast<std::chrono::milliseconds>(err.rateLimitReset - clock());
        if (untilReset > std::chrono::milliseconds::zero()) {
            return untilReset + Constants::RATE_LIMIT_PADDING;
        }
    }
    return backoffDelay(retryNumber);
}

void ResilientFetch::notifyRetry(const RetryEvent& event) {
    std::ostringstream msg;
    msg << event.operation << " failed (" << errorCodeName(event.error.code) << ": " << event.error.message
        << "), attempt " << event.attempt << "/" << event.maxRetries
        << ", retrying in " << event.delay.count() << "ms";
    Logger::instance().warn(msg.str());
    if (onRetry) onRetry(event);
}

}
