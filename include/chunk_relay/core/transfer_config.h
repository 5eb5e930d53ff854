/**
 * @file transfer_config.h
 * @brief Per-session transfer configuration
 */

#ifndef CHUNK_RELAY_CORE_TRANSFER_CONFIG_H
#define CHUNK_RELAY_CORE_TRANSFER_CONFIG_H

#include <chunk_relay/core/chunk_config.h>
#include <chunk_relay/core/retry_policy.h>
#include <chunk_relay/core/types.h>

#include <chrono>
#include <cstddef>

namespace chunk_relay {

/**
 * @brief Configuration shared by the sessions of one engine
 */
struct transfer_config {
    /// Default number of chunks dispatched but not yet resolved
    static constexpr std::size_t default_max_in_flight = 4;

    chunk_config chunk;

    /// Chunks held in memory at once; the stream is not pulled beyond this
    std::size_t max_in_flight_chunks = default_max_in_flight;

    retry_policy retry;

    /// Bound on a single put/complete attempt against one destination
    std::chrono::milliseconds chunk_timeout{120000};

    /// How long terminal progress entries and finished sessions are kept
    std::chrono::milliseconds progress_retention{300000};

    /// Largest single GET-range request; 0 means the chunk size
    std::size_t range_request_size = 0;

    /// Fail the session when the backup destination fails
    bool backup_mandatory = false;

    [[nodiscard]] auto effective_range_request_size() const -> std::size_t {
        return range_request_size == 0 ? chunk.chunk_size : range_request_size;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto r = chunk.validate(); !r) {
            return r;
        }
        if (auto r = retry.validate(); !r) {
            return r;
        }
        if (max_in_flight_chunks == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max in-flight chunks must be positive"});
        }
        if (chunk_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk timeout must be positive"});
        }
        return {};
    }
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_TRANSFER_CONFIG_H
