/**
 * @file store_utils.h
 * @brief Encoding, signing and parsing helpers shared by the stores
 */

#ifndef CHUNK_RELAY_STORE_STORE_UTILS_H
#define CHUNK_RELAY_STORE_STORE_UTILS_H

#include <chunk_relay/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunk_relay::store_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to lowercase hexadecimal string
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief URL encode a string (RFC 3986)
 * @param encode_slash Whether to encode forward slashes
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

// ============================================================================
// Cryptographic Utilities (OpenSSL)
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t>;

auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t>;

auto hmac_sha256(const std::vector<uint8_t>& key, const std::string& data)
    -> std::vector<uint8_t>;

auto hmac_sha256(const std::string& key, const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format as YYYYMMDD'T'HHMMSS'Z' (UTC)
 */
auto format_iso8601_time(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Format as YYYYMMDD (UTC)
 */
auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Parse an ISO 8601 / RFC 3339 UTC timestamp ("2024-01-31T10:00:00.000Z")
 */
auto parse_rfc3339_time(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point>;

// ============================================================================
// XML / JSON Utilities
// ============================================================================

/**
 * @brief Extract the text of the first <tag> element
 */
auto extract_xml_element(const std::string& xml, const std::string& tag)
    -> std::optional<std::string>;

/**
 * @brief Extract the inner text of every <tag> element, in document order
 */
auto extract_xml_elements(const std::string& xml, const std::string& tag)
    -> std::vector<std::string>;

/**
 * @brief Extract a scalar JSON value by key (first occurrence)
 *
 * String values are returned without quotes. Meant for the small, known
 * response shapes of the channel API.
 */
auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string>;

/**
 * @brief Extract the JSON object that is the value of key, braces included
 */
auto extract_json_object(const std::string& json, const std::string& key)
    -> std::optional<std::string>;

/**
 * @brief Extract a scalar value that is a direct member of the outer object
 *
 * Unlike extract_json_value(), a key inside a nested object or array does
 * not match.
 */
auto extract_top_level_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string>;

/**
 * @brief Extract an object that is a direct member of the outer object
 */
auto extract_top_level_json_object(const std::string& json, const std::string& key)
    -> std::optional<std::string>;

// ============================================================================
// Content Type Detection
// ============================================================================

/**
 * @brief Detect MIME content type from a file name or key
 * @return MIME type, "application/octet-stream" when unknown
 */
auto detect_content_type(const std::string& key) -> std::string;

// ============================================================================
// Status Mapping
// ============================================================================

/**
 * @brief 429, 503 and other 5xx statuses
 */
auto is_retryable_status(int status_code) -> bool;

/**
 * @brief Map a non-success HTTP status to an error
 * @param context Operation description placed in the message
 */
auto status_to_error(int status_code, const std::string& context) -> error;

}  // namespace chunk_relay::store_utils

#endif  // CHUNK_RELAY_STORE_STORE_UTILS_H
