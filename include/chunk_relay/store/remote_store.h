/**
 * @file remote_store.h
 * @brief Capability interface implemented by every transfer destination
 *
 * A remote store receives the chunks of an object, reassembles them into a
 * stored object and serves partial-content reads from it. The primary
 * variant is an S3-compatible bucket (s3_object_store); the backup variant
 * keeps chunks as documents in a messaging channel (backup_channel_store).
 */

#ifndef CHUNK_RELAY_STORE_REMOTE_STORE_H
#define CHUNK_RELAY_STORE_REMOTE_STORE_H

#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunk_relay {

/**
 * @brief Result of head_object()
 */
struct object_head {
    bool exists = false;
    uint64_t size = 0;
    std::string content_type;
    std::optional<std::string> etag;
    std::optional<std::chrono::system_clock::time_point> last_modified;
};

/**
 * @brief Abstract remote store
 *
 * Writing an object follows begin_object, put_chunk for every chunk (in any
 * order, possibly concurrently and possibly repeated for the same sequence
 * number), then complete_object or abort_object. A chunk put again replaces
 * the earlier copy. Implementations are thread-safe.
 *
 * Write-path calls make a single attempt; the caller owns the retry policy.
 * Read-path calls may retry transient failures internally.
 */
class remote_store {
public:
    virtual ~remote_store() = default;

    /**
     * @brief Short destination name used in logs and destination_status
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Location string recorded in stored_object_metadata
     */
    [[nodiscard]] virtual auto location_of(const object_id& id) const -> std::string = 0;

    // ========================================================================
    // Write path
    // ========================================================================

    /**
     * @brief Check that an object cut into chunk_size pieces can be written here
     *
     * Sessions call this before the first chunk so a layout the store cannot
     * accept fails up front rather than partway through the upload. The
     * default accepts every layout.
     * @param object_size_limit Largest size the object can reach
     */
    [[nodiscard]] virtual auto validate_layout(std::size_t /*chunk_size*/,
                                               uint64_t /*object_size_limit*/) const
        -> result<void> {
        return {};
    }

    /**
     * @brief Prepare to receive the chunks of an object
     */
    [[nodiscard]] virtual auto begin_object(const object_id& id,
                                            const std::string& content_type)
        -> result<void> = 0;

    /**
     * @brief Store one chunk of an object being written
     */
    [[nodiscard]] virtual auto put_chunk(const object_id& id,
                                         const chunk_descriptor& descriptor,
                                         std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Assemble the received chunks into the stored object
     * @param metadata Final object metadata; size must equal the bytes received
     * @return Location of the stored object
     */
    [[nodiscard]] virtual auto complete_object(const stored_object_metadata& metadata)
        -> result<std::string> = 0;

    /**
     * @brief Abandon an object being written and release its partial data
     */
    [[nodiscard]] virtual auto abort_object(const object_id& id) -> result<void> = 0;

    // ========================================================================
    // Read path
    // ========================================================================

    /**
     * @brief Read bytes [first, last] of a stored object
     *
     * Fails with range_not_satisfiable if first is not below the object size.
     * last is clamped to the object size.
     */
    [[nodiscard]] virtual auto get_range(const object_id& id, uint64_t first, uint64_t last)
        -> result<std::vector<std::byte>> = 0;

    /**
     * @brief Size and existence of a stored object
     */
    [[nodiscard]] virtual auto head_object(const object_id& id) -> result<object_head> = 0;

    /**
     * @brief List stored objects whose ID starts with prefix
     */
    [[nodiscard]] virtual auto list_objects(const std::string& prefix)
        -> result<std::vector<stored_object_metadata>> = 0;

    /**
     * @brief Delete a stored object
     *
     * Fails with object_not_found if the object does not exist.
     */
    [[nodiscard]] virtual auto delete_object(const object_id& id) -> result<void> = 0;

    // ========================================================================
    // Extras
    // ========================================================================

    /**
     * @brief Time-limited direct GET URL for external players
     *
     * Stores without direct links fail with operation_not_supported.
     */
    [[nodiscard]] virtual auto presigned_url(const object_id& id, std::chrono::seconds expiry)
        -> result<std::string> = 0;

    /**
     * @brief Verify that the backing service is reachable with the configured credentials
     */
    [[nodiscard]] virtual auto check_connection() -> result<void> = 0;
};

/**
 * @brief A store together with its role in a session
 */
struct destination {
    std::shared_ptr<remote_store> store;
    bool mandatory = true;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_STORE_REMOTE_STORE_H
