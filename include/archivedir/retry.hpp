#pragma once

#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/log.hpp"
#include "archivedir/stream.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace archivedir::retry {

struct RetryPolicy {
    std::uint32_t max_attempts = constants::kDefaultRetryAttempts;
    std::chrono::milliseconds initial_delay = constants::kDefaultRetryDelay;
    double backoff_multiplier = constants::kDefaultRetryMultiplier;
    std::chrono::milliseconds max_delay = constants::kDefaultRetryMaxDelay;
    std::chrono::milliseconds attempt_timeout = constants::kDefaultAttemptTimeout;
    bool use_jitter = false;
};

// Delay before the attempt that follows failed attempt `attempt` (1-based):
// initial_delay * multiplier^(attempt-1), capped at max_delay.
std::chrono::milliseconds CalculateRetryDelay(const RetryPolicy& policy, std::uint32_t attempt);

// Sleeps in short slices; throws Cancelled(component) as soon as `cancel` is set.
void SleepFor(std::chrono::milliseconds delay, const stream::CancelToken& cancel, const std::string& component);

// Calls fn(attempt) until it returns. Only SinkTransientError is retried;
// after max_attempts failures it is rethrown as an exhausted
// SinkTransientError. Everything else propagates on the first throw.
template <typename Fn>
auto Run(const RetryPolicy& policy, const std::string& component, const std::string& what,
         const stream::CancelToken& cancel, Fn&& fn) -> decltype(fn(std::uint32_t{1})) {
    const std::uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
    for (std::uint32_t attempt = 1;; ++attempt) {
        cancel.ThrowIfCancelled(component);
        try {
            return fn(attempt);
        } catch (const SinkTransientError& exc) {
            if (attempt >= attempts) {
                throw SinkTransientError(component, what + " failed after " + std::to_string(attempt) +
                                                        " attempts: " + exc.what());
            }
            auto delay = CalculateRetryDelay(policy, attempt);
            log::Warn(component + ": " + what + " attempt " + std::to_string(attempt) + "/" +
                      std::to_string(attempts) + " failed (" + exc.what() + "), retrying in " +
                      std::to_string(delay.count()) + " ms");
            SleepFor(delay, cancel, component);
        }
    }
}

}  // namespace archivedir::retry
