/**
 * @file transfer_engine.h
 * @brief Entry point for uploads, downloads and range reads
 *
 * The engine owns the configured primary and backup stores, starts upload
 * sessions against them and serves reads through a range_server. It keeps
 * a catalog of the objects its sessions completed so reads can fall back to
 * the backup; objects written elsewhere are resolved with head_object.
 *
 * @code
 * auto engine = transfer_engine::builder()
 *                   .with_primary(s3_object_store::create(s3_cfg).value())
 *                   .with_backup(backup_channel_store::create(channel_cfg).value())
 *                   .with_chunk_size(16 * 1024 * 1024)
 *                   .build();
 *
 * auto source = stream_source::open_file("movie.mkv");
 * auto id = make_object_id("movie.mkv");
 * auto session = engine.value().upload(id, std::move(source.value()));
 * auto snap = engine.value().progress(session.value());
 * @endcode
 */

#ifndef CHUNK_RELAY_TRANSFER_TRANSFER_ENGINE_H
#define CHUNK_RELAY_TRANSFER_TRANSFER_ENGINE_H

#include <chunk_relay/adapters/thread_pool_adapter.h>
#include <chunk_relay/core/byte_source.h>
#include <chunk_relay/core/progress_tracker.h>
#include <chunk_relay/core/transfer_config.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/store/remote_store.h>
#include <chunk_relay/transfer/range_server.h>
#include <chunk_relay/transfer/transfer_session.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace chunk_relay {

/**
 * @brief Sequential reader of a stored object
 *
 * Reads go through the range server in pieces of the engine's range request
 * size. The read is tracked in the progress tracker as a download session:
 * completed at end of stream, failed on the first read error and cancelled
 * when the stream is destroyed before the end.
 */
class download_stream : public byte_source {
public:
    ~download_stream() override;

    download_stream(const download_stream&) = delete;
    auto operator=(const download_stream&) -> download_stream& = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto size_hint() const -> std::optional<uint64_t> override;

    /**
     * @brief Progress tracker key of this download
     */
    [[nodiscard]] auto id() const -> const session_id&;

    [[nodiscard]] auto metadata() const -> const stored_object_metadata&;

    [[nodiscard]] auto bytes_read() const noexcept -> uint64_t;

    [[nodiscard]] auto state() const noexcept -> session_state;

private:
    friend class transfer_engine;

    download_stream(stored_object_metadata metadata,
                    std::shared_ptr<const range_server> server,
                    std::shared_ptr<progress_tracker> tracker,
                    std::size_t read_size);

    void finish(session_state final_state);

    stored_object_metadata metadata_;
    std::shared_ptr<const range_server> server_;
    std::shared_ptr<progress_tracker> tracker_;
    std::size_t read_size_;
    session_id id_;
    session_state state_ = session_state::active;
    std::optional<error> failure_;

    std::vector<std::byte> buffer_;
    std::size_t buffer_pos_ = 0;
    uint64_t fetched_ = 0;     ///< object bytes fetched into buffers so far
    uint64_t delivered_ = 0;   ///< object bytes handed to the caller
};

/**
 * @brief Reachability of one configured destination
 */
struct destination_check {
    std::string name;
    bool mandatory = true;
    std::optional<error> failure;

    [[nodiscard]] auto ok() const noexcept -> bool { return !failure.has_value(); }
};

class transfer_engine {
public:
    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the primary store (required)
         */
        auto with_primary(std::shared_ptr<remote_store> store) -> builder&;

        /**
         * @brief Set the backup store
         */
        auto with_backup(std::shared_ptr<remote_store> store) -> builder&;

        /**
         * @brief Fail uploads when the backup fails (default: best-effort)
         */
        auto with_backup_mandatory(bool mandatory) -> builder&;

        /**
         * @brief Set chunk size for uploads
         * @param size Chunk size in bytes (default: 16MB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set the number of chunks in flight per session (default: 4)
         */
        auto with_max_in_flight(std::size_t chunks) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        /**
         * @brief Bound on one put attempt against one destination
         */
        auto with_chunk_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Attach a digest to every chunk
         */
        auto with_integrity(bool enable,
                            checksum_algorithm algorithm = checksum_algorithm::crc32)
            -> builder&;

        /**
         * @brief How long finished sessions are kept for queries
         */
        auto with_progress_retention(std::chrono::milliseconds retention) -> builder&;

        /**
         * @brief Largest single range request (default: chunk size)
         */
        auto with_range_request_size(std::size_t size) -> builder&;

        auto with_thread_pool(std::shared_ptr<adapters::transfer_thread_pool_interface> pool)
            -> builder&;

        /**
         * @brief Use a private tracker instead of the process-wide one
         */
        auto with_progress_tracker(std::shared_ptr<progress_tracker> tracker) -> builder&;

        /**
         * @brief Replace the whole transfer configuration
         */
        auto with_config(transfer_config config) -> builder&;

        /**
         * @brief Build the engine
         * @return Engine or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        transfer_config config_;
        std::shared_ptr<remote_store> primary_;
        std::shared_ptr<remote_store> backup_;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
        std::shared_ptr<progress_tracker> tracker_;
    };

    // Non-copyable, movable
    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;

    /**
     * @brief Cancels running sessions and waits for them
     */
    ~transfer_engine();

    // ========================================================================
    // Uploads
    // ========================================================================

    /**
     * @brief Start uploading a stream
     * @param id Object to create
     * @param source Source of the object bytes
     * @param destinations Destinations, first is the primary; empty means the
     *        configured primary and backup
     * @param content_type MIME type, detected from the object id when empty
     * @return Session id to poll with progress()
     */
    [[nodiscard]] auto upload(const object_id& id,
                              std::unique_ptr<byte_source> source,
                              std::vector<destination> destinations = {},
                              std::string content_type = {}) -> result<session_id>;

    /**
     * @brief Upload a local file under a generated object id
     */
    [[nodiscard]] auto upload_file(const std::filesystem::path& path) -> result<session_id>;

    /**
     * @brief Session started by this engine
     * @return session_not_found for unknown or released sessions
     */
    [[nodiscard]] auto session(const session_id& id) const
        -> result<std::shared_ptr<transfer_session>>;

    /**
     * @brief Block until an upload session is terminal
     */
    [[nodiscard]] auto await_completion(const session_id& id) -> result<session_outcome>;

    auto cancel(const session_id& id) -> result<void>;

    /**
     * @brief Forget a terminal session
     * @return invalid_state for a running session
     */
    auto release(const session_id& id) -> result<void>;

    [[nodiscard]] auto active_sessions() const -> std::size_t;

    // ========================================================================
    // Reads
    // ========================================================================

    /**
     * @brief Sequential full read of an object
     */
    [[nodiscard]] auto download(const object_id& id) -> result<std::unique_ptr<download_stream>>;

    /**
     * @brief Read a whole object into an output stream
     * @return Number of bytes written
     */
    [[nodiscard]] auto download_to(const object_id& id, std::ostream& output) -> result<uint64_t>;

    /**
     * @brief Read bytes [start, end] of an object; empty end reads to the end
     */
    [[nodiscard]] auto stream_range(const object_id& id,
                                    uint64_t start,
                                    std::optional<uint64_t> end = std::nullopt)
        -> result<range_read_result>;

    /**
     * @brief Read the range named by an HTTP Range header value
     */
    [[nodiscard]] auto stream_range(const object_id& id, std::string_view range_header)
        -> result<range_read_result>;

    /**
     * @brief Metadata of a stored object
     * @return object_not_found if neither store has the object
     */
    [[nodiscard]] auto metadata(const object_id& id) -> result<stored_object_metadata>;

    // ========================================================================
    // Queries and management
    // ========================================================================

    /**
     * @brief Latest progress of an upload or download
     * @return session_not_found for unknown or already observed terminal sessions
     */
    [[nodiscard]] auto progress(const session_id& id) -> result<progress_snapshot>;

    /**
     * @brief Objects on the primary store whose id starts with prefix
     */
    [[nodiscard]] auto list_objects(const std::string& prefix = std::string(object_key_prefix))
        -> result<std::vector<stored_object_metadata>>;

    /**
     * @brief Delete an object from the primary and, best-effort, from the backup
     */
    auto delete_object(const object_id& id) -> result<void>;

    /**
     * @brief Direct time-limited URL for external players
     */
    [[nodiscard]] auto player_url(const object_id& id,
                                  std::chrono::seconds expiry = std::chrono::seconds(3600))
        -> result<std::string>;

    /**
     * @brief Run check_connection() on every configured destination
     */
    [[nodiscard]] auto check_destinations() -> std::vector<destination_check>;

    [[nodiscard]] auto config() const -> const transfer_config&;

    [[nodiscard]] auto tracker() const -> std::shared_ptr<progress_tracker>;

private:
    transfer_engine(transfer_config config,
                    std::shared_ptr<remote_store> primary,
                    std::shared_ptr<remote_store> backup,
                    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                    std::shared_ptr<progress_tracker> tracker);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_TRANSFER_TRANSFER_ENGINE_H
