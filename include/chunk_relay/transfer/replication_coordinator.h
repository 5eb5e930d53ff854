/**
 * @file replication_coordinator.h
 * @brief Fans the chunks of one upload out to every destination
 *
 * Each destination runs its own state machine:
 *
 *   pending --begin--> active --all chunks + complete--> complete
 *                        |
 *                        +--retries exhausted / permanent error--> failed
 *
 * A destination's failure never blocks or aborts another destination's put
 * of the same chunk. Puts run on the transfer pool; every attempt is bounded
 * by the chunk timeout and abandoned when the session is cancelled.
 * Transient failures are retried with exponential backoff.
 *
 * Acknowledgments are tracked per destination: confirmed bytes only advance
 * when every lower sequence number is acknowledged as well.
 */

#ifndef CHUNK_RELAY_TRANSFER_REPLICATION_COORDINATOR_H
#define CHUNK_RELAY_TRANSFER_REPLICATION_COORDINATOR_H

#include <chunk_relay/adapters/thread_pool_adapter.h>
#include <chunk_relay/core/chunk_stream.h>
#include <chunk_relay/core/transfer_config.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/store/remote_store.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace chunk_relay {

class replication_coordinator : public std::enable_shared_from_this<replication_coordinator> {
public:
    using put_future = std::shared_future<result<void>>;

    /**
     * @brief Called with the new confirmed byte count after an acknowledgment
     */
    using progress_callback = std::function<void(uint64_t confirmed_bytes)>;

    /**
     * @param id Object being written
     * @param destinations Destinations in order; the first is the primary
     * @param config Retry, timeout and in-flight settings
     * @param pool Pool that runs the destination operations
     * @param session_label Session id used in log context
     */
    [[nodiscard]] static auto create(object_id id,
                                     std::vector<destination> destinations,
                                     const transfer_config& config,
                                     std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                                     std::string session_label = {})
        -> std::shared_ptr<replication_coordinator>;

    ~replication_coordinator();

    replication_coordinator(const replication_coordinator&) = delete;
    auto operator=(const replication_coordinator&) -> replication_coordinator& = delete;

    void set_progress_callback(progress_callback callback);

    /**
     * @brief Start the object on every destination
     *
     * A best-effort destination that cannot start is marked failed.
     * @return The error of a mandatory destination that cannot start
     */
    auto begin(const std::string& content_type) -> result<void>;

    /**
     * @brief Put one chunk to every destination
     *
     * The chunk buffer is shared by the destination tasks and released once
     * all of them resolve. Destinations that already failed resolve
     * immediately with their failure.
     * @return One future per destination, in destination order
     */
    auto dispatch(stream_chunk chunk) -> std::vector<put_future>;

    /**
     * @brief Block until fewer than limit chunks are unresolved
     * @return false if cancellation was requested while waiting
     */
    auto wait_for_capacity(std::size_t limit) -> bool;

    /**
     * @brief Block until every dispatched chunk has resolved
     */
    void wait_idle();

    /**
     * @brief Finish the object on every destination still active
     *
     * Best-effort destinations that failed earlier are aborted.
     * @param metadata Metadata without locations
     * @return Metadata with primary and backup locations filled in
     */
    auto complete(stored_object_metadata metadata) -> result<stored_object_metadata>;

    /**
     * @brief Abandon the object on every destination (multipart abort)
     */
    void abort_all();

    /**
     * @brief Stop retries and abandon in-flight attempts
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief First failure of a mandatory destination, if any
     */
    [[nodiscard]] auto mandatory_failure() const -> std::optional<error>;

    /**
     * @brief Contiguous bytes acknowledged by every mandatory destination
     */
    [[nodiscard]] auto confirmed_bytes() const -> uint64_t;

    [[nodiscard]] auto statuses() const -> std::vector<destination_status>;

    [[nodiscard]] auto in_flight() const -> std::size_t;

    [[nodiscard]] auto object() const -> const object_id&;

private:
    replication_coordinator(object_id id,
                            std::vector<destination> destinations,
                            const transfer_config& config,
                            std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                            std::string session_label);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_TRANSFER_REPLICATION_COORDINATOR_H
