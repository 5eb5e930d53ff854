/**
 * @file progress_tracker.h
 * @brief Process-wide registry of transfer progress
 *
 * Sessions publish acknowledged byte counts; callers poll snapshots by
 * session id. Snapshot reads never wait for a writer: each entry publishes
 * an immutable snapshot through an atomic shared pointer and readers only
 * load that pointer.
 */

#ifndef CHUNK_RELAY_CORE_PROGRESS_TRACKER_H
#define CHUNK_RELAY_CORE_PROGRESS_TRACKER_H

#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace chunk_relay {

/**
 * @brief Registry of progress entries keyed by session id
 *
 * Lifecycle of an entry:
 * - created by register_session() when a session starts
 * - updated by record_progress() on every contiguous acknowledgment
 * - frozen by mark_terminal()
 * - removed by the first snapshot() that observes the terminal state, by
 *   purge_expired() once the retention period has passed, or by remove()
 *
 * Each entry has a single writer (its session). record_progress() ignores
 * values lower than the last one recorded, so bytes_transferred never
 * decreases between polls.
 *
 * @code
 * auto tracker = progress_tracker::global();
 * tracker->register_session(id, transfer_direction::upload, total);
 * tracker->record_progress(id, 16 * 1024 * 1024);
 * auto snap = tracker->snapshot(id);
 * @endcode
 */
class progress_tracker {
public:
    struct config {
        std::chrono::milliseconds rate_window{5000};   ///< trailing window for the current rate
        std::chrono::milliseconds retention{300000};   ///< lifetime of unobserved terminal entries
    };

    using listener = std::function<void(const progress_snapshot&)>;

    progress_tracker();
    explicit progress_tracker(config cfg);
    ~progress_tracker();

    progress_tracker(const progress_tracker&) = delete;
    auto operator=(const progress_tracker&) -> progress_tracker& = delete;

    /**
     * @brief Shared process-wide instance
     */
    [[nodiscard]] static auto global() -> std::shared_ptr<progress_tracker>;

    /**
     * @brief Create the entry for a starting session
     * @return invalid_state if the id is already registered
     */
    auto register_session(const session_id& id, transfer_direction direction,
                          std::optional<uint64_t> total_size) -> result<void>;

    /**
     * @brief Publish the confirmed byte count of a session
     *
     * Values not greater than the current count are ignored. Updates to a
     * terminal entry are ignored.
     */
    auto record_progress(const session_id& id, uint64_t confirmed_bytes) -> result<void>;

    /**
     * @brief Set the total size once a stream of unknown length has ended
     */
    auto set_total_size(const session_id& id, uint64_t total_size) -> result<void>;

    /**
     * @brief Publish the terminal state of a session
     */
    auto mark_terminal(const session_id& id, session_state state) -> result<void>;

    /**
     * @brief Latest published snapshot
     *
     * The first read that returns a terminal snapshot also removes the entry.
     * @return session_not_found for unknown or already removed sessions
     */
    [[nodiscard]] auto snapshot(const session_id& id) -> result<progress_snapshot>;

    auto remove(const session_id& id) -> bool;

    /**
     * @brief Drop terminal entries older than the retention period
     * @return Number of entries removed
     */
    auto purge_expired() -> std::size_t;

    /**
     * @brief Drop terminal entries older than @p retention
     *
     * Used by owners that carry their own retention setting, such as an
     * engine sharing the process-wide tracker.
     */
    auto purge_expired(std::chrono::milliseconds retention) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Push hook invoked after every publish, on the writer's thread
     */
    void set_listener(listener callback);

    [[nodiscard]] auto get_config() const -> const config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_PROGRESS_TRACKER_H
