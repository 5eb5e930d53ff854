/**
 * @file retry_policy.h
 * @brief Retry policy with exponential backoff for destination operations
 */

#ifndef CHUNK_RELAY_CORE_RETRY_POLICY_H
#define CHUNK_RELAY_CORE_RETRY_POLICY_H

#include <chunk_relay/core/types.h>

#include <chrono>
#include <cstddef>

namespace chunk_relay {

/**
 * @brief Retry policy for chunk puts and adapter-internal reads
 */
struct retry_policy {
    /// Maximum number of attempts, first attempt included
    std::size_t max_attempts = 5;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{500};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Scale each delay by a random factor in [0.5, 1.5)
    bool use_jitter = true;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_attempts == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry policy needs at least one attempt"});
        }
        if (backoff_multiplier < 1.0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "backoff multiplier must be >= 1.0"});
        }
        if (initial_delay.count() < 0 || max_delay < initial_delay) {
            return unexpected(error{error_code::invalid_configuration,
                                    "invalid retry delay bounds"});
        }
        return {};
    }
};

/**
 * @brief Calculate delay with exponential backoff and jitter
 * @param policy Retry policy configuration
 * @param attempt Number of the attempt that just failed (1-based)
 * @return Delay to wait before the next attempt
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy,
                                         std::size_t attempt) -> std::chrono::milliseconds;

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_RETRY_POLICY_H
