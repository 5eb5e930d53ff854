/**
 * @file chunk_config.h
 * @brief Configuration for chunk streaming
 */

#ifndef CHUNK_RELAY_CORE_CHUNK_CONFIG_H
#define CHUNK_RELAY_CORE_CHUNK_CONFIG_H

#include <chunk_relay/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chunk_relay {

/**
 * @brief Algorithm used for per-chunk integrity digests
 */
enum class checksum_algorithm {
    crc32,
    sha256,
};

[[nodiscard]] constexpr auto to_string(checksum_algorithm algorithm) noexcept
    -> std::string_view {
    switch (algorithm) {
        case checksum_algorithm::crc32: return "crc32";
        case checksum_algorithm::sha256: return "sha256";
        default: return "unknown";
    }
}

/**
 * @brief Configuration for chunk operations
 */
struct chunk_config {
    /// Default chunk size (16MB)
    static constexpr std::size_t default_chunk_size = 16 * 1024 * 1024;

    /// Minimum allowed chunk size (1KB)
    static constexpr std::size_t min_chunk_size = 1024;

    /// Maximum allowed chunk size (512MB)
    static constexpr std::size_t max_chunk_size = 512 * 1024 * 1024;

    /// Default upper bound for a single object (4GB)
    static constexpr uint64_t default_max_object_size = 4ULL * 1024 * 1024 * 1024;

    /// Chunk size to use for splitting
    std::size_t chunk_size = default_chunk_size;

    /// Attach a digest to every chunk descriptor
    bool verify_integrity = false;

    /// Digest algorithm when verify_integrity is set
    checksum_algorithm algorithm = checksum_algorithm::crc32;

    /// Largest object the stream accepts
    uint64_t max_object_size = default_max_object_size;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (max_object_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max object size must be positive"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given object size
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t object_size) const -> uint64_t {
        if (object_size == 0) return 0;
        return (object_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_CHUNK_CONFIG_H
