/**
 * @file range_server.h
 * @brief Partial-content reads of stored objects
 *
 * Translates a requested byte range into bounded get_range calls against
 * the primary store. When the primary is unreachable and the object is
 * fully replicated to the backup, the read continues from the backup.
 */

#ifndef CHUNK_RELAY_TRANSFER_RANGE_SERVER_H
#define CHUNK_RELAY_TRANSFER_RANGE_SERVER_H

#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/core/types.h>
#include <chunk_relay/store/http_client.h>
#include <chunk_relay/store/remote_store.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunk_relay {

/**
 * @brief Inclusive byte range; an empty last means "to end of object"
 */
struct byte_range {
    uint64_t first = 0;
    std::optional<uint64_t> last;
};

/**
 * @brief Parse an HTTP Range header value
 *
 * Accepts "bytes=a-b", "bytes=a-" and the suffix form "bytes=-n" (the last
 * n bytes). A suffix longer than the object selects the whole object.
 *
 * @return range_not_satisfiable for malformed or unsatisfiable ranges,
 *         operation_not_supported for multi-range requests
 */
[[nodiscard]] auto parse_range_header(std::string_view header, uint64_t object_size)
    -> result<byte_range>;

/**
 * @brief Payload and effective range of a partial read
 */
struct range_read_result {
    std::vector<std::byte> data;
    uint64_t first = 0;
    uint64_t last = 0;          ///< inclusive
    uint64_t total_size = 0;
    std::string content_type;
    std::string served_by;      ///< name of the store that returned the bytes

    [[nodiscard]] auto content_length() const noexcept -> uint64_t {
        return data.size();
    }

    /**
     * @brief Headers of a 206 Partial Content response for this read
     */
    [[nodiscard]] auto response_headers() const -> http_headers;
};

class range_server {
public:
    /**
     * @param primary Authoritative store
     * @param backup Fallback store, may be null
     * @param max_request_size Largest single get_range request
     */
    range_server(std::shared_ptr<remote_store> primary,
                 std::shared_ptr<remote_store> backup,
                 std::size_t max_request_size);

    /**
     * @brief Read bytes [start, end] of an object
     *
     * end is clamped to size - 1; an empty end reads to the end of the object.
     * @return range_not_satisfiable if start >= size or end < start,
     *         destination_unavailable if no store could serve the bytes
     */
    [[nodiscard]] auto read(const stored_object_metadata& metadata,
                            uint64_t start,
                            std::optional<uint64_t> end = std::nullopt) const
        -> result<range_read_result>;

    [[nodiscard]] auto read(const stored_object_metadata& metadata, const byte_range& range) const
        -> result<range_read_result>;

    [[nodiscard]] auto max_request_size() const noexcept -> std::size_t {
        return max_request_size_;
    }

    [[nodiscard]] auto has_backup() const noexcept -> bool {
        return backup_ != nullptr;
    }

private:
    [[nodiscard]] auto can_fall_back(const stored_object_metadata& metadata) const -> bool;

    std::shared_ptr<remote_store> primary_;
    std::shared_ptr<remote_store> backup_;
    std::size_t max_request_size_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_TRANSFER_RANGE_SERVER_H
