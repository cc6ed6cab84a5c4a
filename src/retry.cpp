#include "archivedir/retry.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace archivedir::retry {

namespace {

constexpr std::chrono::milliseconds kSleepSlice{25};

}  // namespace

std::chrono::milliseconds CalculateRetryDelay(const RetryPolicy& policy, std::uint32_t attempt) {
    auto delay = static_cast<double>(policy.initial_delay.count());
    for (std::uint32_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }
    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(delay, 0.0)));
}

void SleepFor(std::chrono::milliseconds delay, const stream::CancelToken& cancel, const std::string& component) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    for (;;) {
        cancel.ThrowIfCancelled(component);
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kSleepSlice));
    }
}

}  // namespace archivedir::retry
