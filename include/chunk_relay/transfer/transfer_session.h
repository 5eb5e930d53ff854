/**
 * @file transfer_session.h
 * @brief One upload from a source stream to its destinations
 *
 * State machine:
 *
 *   created --start()--> active --+--> completed
 *      |                          +--> failed
 *      +--cancel()--> cancelled <-+--- cancel()
 *
 * completed, failed and cancelled are terminal; a terminal session never
 * changes state again.
 *
 * start() returns immediately. A dispatcher thread owned by the session
 * pulls chunks from the chunk stream and hands them to the replication
 * coordinator, never holding more than max_in_flight_chunks unresolved
 * chunks. The stream is not read further while that limit is reached.
 */

#ifndef CHUNK_RELAY_TRANSFER_TRANSFER_SESSION_H
#define CHUNK_RELAY_TRANSFER_TRANSFER_SESSION_H

#include <chunk_relay/adapters/thread_pool_adapter.h>
#include <chunk_relay/core/chunk_stream.h>
#include <chunk_relay/core/progress_tracker.h>
#include <chunk_relay/core/transfer_config.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/store/remote_store.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunk_relay {

class transfer_session {
public:
    using state_callback = std::function<void(session_state old_state, session_state new_state)>;

    /**
     * @brief Everything a session needs
     */
    struct parameters {
        object_id object;
        std::string content_type;  ///< detected from the object ID when empty
        std::unique_ptr<byte_source> source;
        std::vector<destination> destinations;  ///< first is the primary
        transfer_config config;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
        std::shared_ptr<progress_tracker> tracker;
    };

    /**
     * @brief Validate parameters and create a session in state created
     */
    [[nodiscard]] static auto create(parameters params)
        -> result<std::shared_ptr<transfer_session>>;

    /**
     * @brief Cancels a running session and waits for its dispatcher
     */
    ~transfer_session();

    transfer_session(const transfer_session&) = delete;
    auto operator=(const transfer_session&) -> transfer_session& = delete;

    /**
     * @brief Begin dispatching chunks
     * @return already_started unless the session is in state created
     */
    auto start() -> result<void>;

    /**
     * @brief Request cooperative cancellation
     *
     * No chunk is dispatched after this call. In-flight puts finish or
     * time out and their results are discarded. A session that has not
     * started is cancelled immediately.
     * @return invalid_state if the session is already terminal
     */
    auto cancel() -> result<void>;

    /**
     * @brief Block until the session is terminal
     */
    auto await_completion() -> session_outcome;

    /**
     * @brief Block until the session is terminal or the timeout passes
     */
    auto await_completion(std::chrono::milliseconds timeout) -> std::optional<session_outcome>;

    [[nodiscard]] auto id() const -> const session_id&;
    [[nodiscard]] auto object() const -> const object_id&;
    [[nodiscard]] auto direction() const noexcept -> transfer_direction;
    [[nodiscard]] auto state() const -> session_state;
    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t;

    /**
     * @brief Declared size of the source, if known
     */
    [[nodiscard]] auto total_size() const -> std::optional<uint64_t>;

    /**
     * @brief Current per-destination status
     */
    [[nodiscard]] auto destinations() const -> std::vector<destination_status>;

    /**
     * @brief Chunks handed to the coordinator so far
     */
    [[nodiscard]] auto chunks_dispatched() const -> uint64_t;

    [[nodiscard]] auto started_at() const -> std::optional<std::chrono::system_clock::time_point>;
    [[nodiscard]] auto completed_at() const
        -> std::optional<std::chrono::system_clock::time_point>;

    /**
     * @brief Push hook invoked on every state transition, on the transitioning thread
     */
    void on_state_change(state_callback callback);

private:
    explicit transfer_session(parameters params, std::unique_ptr<chunk_stream> stream);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_TRANSFER_TRANSFER_SESSION_H
