/**
 * @file retry_policy.cpp
 * @brief Exponential backoff calculation
 */

#include <chunk_relay/core/retry_policy.h>

#include <algorithm>
#include <random>

namespace chunk_relay {

auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace chunk_relay
