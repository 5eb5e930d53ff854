/**
 * @file transfer_types.h
 * @brief Data model shared by sessions, stores and the range server
 *
 * Defines identifiers, chunk descriptors, stored object metadata and the
 * per-destination and per-session status records.
 */

#ifndef CHUNK_RELAY_CORE_TRANSFER_TYPES_H
#define CHUNK_RELAY_CORE_TRANSFER_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace chunk_relay {

/**
 * @brief Opaque identifier of a stored object
 *
 * Assigned at upload start and immutable afterwards. Objects created through
 * make_object_id() follow the layout "files/<uuid>/<file name>".
 */
using object_id = std::string;

/// Default prefix for objects created by make_object_id()
inline constexpr std::string_view object_key_prefix = "files/";

/**
 * @brief Unique identifier for a transfer session (16-byte UUID)
 */
struct session_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr session_id() noexcept = default;

    explicit constexpr session_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random (version 4) session ID
     */
    [[nodiscard]] static auto generate() -> session_id;

    /**
     * @brief Convert to UUID string form
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse from UUID string
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<session_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const session_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const session_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

/**
 * @brief Transfer direction of a session
 */
enum class transfer_direction {
    upload,
    download,
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) noexcept
    -> std::string_view {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Session state machine: created -> active -> {completed, failed, cancelled}
 */
enum class session_state {
    created,
    active,
    completed,
    failed,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(session_state state) noexcept
    -> std::string_view {
    switch (state) {
        case session_state::created: return "created";
        case session_state::active: return "active";
        case session_state::completed: return "completed";
        case session_state::failed: return "failed";
        case session_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(session_state state) noexcept
    -> bool {
    return state == session_state::completed ||
           state == session_state::failed ||
           state == session_state::cancelled;
}

/**
 * @brief State of one destination within one session
 */
enum class destination_state {
    pending,
    active,
    complete,
    failed,
};

[[nodiscard]] constexpr auto to_string(destination_state state) noexcept
    -> std::string_view {
    switch (state) {
        case destination_state::pending: return "pending";
        case destination_state::active: return "active";
        case destination_state::complete: return "complete";
        case destination_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Position and size of one chunk within its object
 *
 * Within a session sequence numbers are contiguous from 0 and the byte
 * ranges are contiguous, non-overlapping and cover [0, total size).
 */
struct chunk_descriptor {
    uint64_t sequence_number = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    std::optional<std::string> checksum;  ///< hex digest when integrity is on

    /// One past the last byte of the chunk
    [[nodiscard]] constexpr auto end_offset() const noexcept -> uint64_t {
        return offset + length;
    }
};

/**
 * @brief Metadata of a fully stored object
 *
 * Written once when the primary destination completes; never mutated
 * except by deletion.
 */
struct stored_object_metadata {
    object_id id;
    uint64_t size = 0;
    std::string content_type;
    std::chrono::system_clock::time_point created_at{};
    std::string primary_location;
    std::optional<std::string> backup_location;
};

/**
 * @brief Per (session, destination) transfer status
 */
struct destination_status {
    std::string destination;
    bool mandatory = true;
    uint64_t bytes_transferred = 0;          ///< sum of acknowledged chunk bytes
    uint64_t confirmed_bytes = 0;            ///< end of the contiguous acknowledged prefix
    std::optional<uint64_t> last_chunk_acked;
    destination_state state = destination_state::pending;
    uint32_t retry_count = 0;
    std::optional<error> last_error;
    std::size_t queued_operations = 0;       ///< attempts queued or running on the pool
};

/**
 * @brief Read-only progress view of a session
 */
struct progress_snapshot {
    session_id id;
    transfer_direction direction = transfer_direction::upload;
    session_state state = session_state::created;
    uint64_t bytes_transferred = 0;
    std::optional<uint64_t> total_size;
    double percent = 0.0;
    std::optional<double> eta_seconds;
    double current_rate_bytes_per_sec = 0.0;
};

/**
 * @brief Terminal record returned by await_completion()
 */
struct session_outcome {
    session_state state = session_state::created;
    std::optional<stored_object_metadata> metadata;  ///< set only when completed
    uint64_t confirmed_bytes = 0;                    ///< furthest offset acked by all mandatory destinations
    std::vector<destination_status> destinations;
    std::optional<error> failure;
};

/**
 * @brief Create an object ID of the form "files/<uuid>/<file name>"
 * @param file_name Original file name; path separators and control
 *        characters are replaced
 */
[[nodiscard]] auto make_object_id(std::string_view file_name) -> object_id;

/**
 * @brief Return the file name component of an object ID
 */
[[nodiscard]] auto object_file_name(const object_id& id) -> std::string;

/**
 * @brief Format a byte count as "<value with 2 decimals> <unit>"
 *
 * Units are B, KB, MB, GB and TB with a factor of 1024.
 */
[[nodiscard]] auto format_size(uint64_t bytes) -> std::string;

}  // namespace chunk_relay

template <>
struct std::hash<chunk_relay::session_id> {
    auto operator()(const chunk_relay::session_id& id) const noexcept -> std::size_t {
        std::size_t h = 0;
        for (auto b : id.bytes) {
            h = h * 31 + b;
        }
        return h;
    }
};

#endif  // CHUNK_RELAY_CORE_TRANSFER_TYPES_H
