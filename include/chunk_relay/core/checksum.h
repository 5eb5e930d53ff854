/**
 * @file checksum.h
 * @brief Checksum utilities for chunk integrity verification
 */

#ifndef CHUNK_RELAY_CORE_CHECKSUM_H
#define CHUNK_RELAY_CORE_CHECKSUM_H

#include <chunk_relay/core/chunk_config.h>
#include <chunk_relay/core/types.h>

#include <cstddef>
#include <span>
#include <string>

namespace chunk_relay {

/**
 * @brief Checksum utilities for CRC32 and SHA-256 calculations
 *
 * CRC32 is the cheap per-chunk default. SHA-256 is computed with OpenSSL
 * and used when chunks travel through stores that may corrupt payloads.
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Verify CRC32 checksum of data
     */
    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;

    /**
     * @brief Calculate SHA-256 hash of data
     * @return SHA-256 hash as lowercase hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Compute a hex digest with the given algorithm
     *
     * CRC32 digests are rendered as 8 lowercase hex digits.
     */
    [[nodiscard]] static auto compute(checksum_algorithm algorithm,
                                      std::span<const std::byte> data) -> std::string;

    /**
     * @brief Verify data against a hex digest
     * @return chunk_checksum_mismatch if the digest differs
     */
    [[nodiscard]] static auto verify(checksum_algorithm algorithm,
                                     std::span<const std::byte> data,
                                     const std::string& expected) -> result<void>;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_CHECKSUM_H
