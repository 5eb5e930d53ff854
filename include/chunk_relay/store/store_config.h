/**
 * @file store_config.h
 * @brief Configuration for the primary and backup remote stores
 */

#ifndef CHUNK_RELAY_STORE_STORE_CONFIG_H
#define CHUNK_RELAY_STORE_STORE_CONFIG_H

#include <chunk_relay/core/retry_policy.h>
#include <chunk_relay/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunk_relay {

/**
 * @brief Static access key credentials for S3-compatible stores
 */
struct store_credentials {
    /// Access key ID
    std::string access_key_id;

    /// Secret access key
    std::string secret_access_key;

    /// Session token for temporary credentials
    std::optional<std::string> session_token;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return access_key_id.empty() || secret_access_key.empty();
    }
};

/**
 * @brief Primary store configuration (AWS S3 or an S3-compatible provider)
 */
struct s3_store_config {
    /// Bucket name
    std::string bucket;

    /// Region used for request signing
    std::string region = "us-east-1";

    /// Custom endpoint for S3-compatible providers (Wasabi, MinIO, ...)
    std::optional<std::string> endpoint;

    /// Address the bucket in the path instead of the host name
    bool use_path_style = false;

    /// Use HTTPS
    bool use_ssl = true;

    store_credentials credentials;

    /// Timeout of a single HTTP request
    std::chrono::milliseconds request_timeout{30000};

    /// Adapter-internal retry of reads, listing and metadata calls
    retry_policy read_retry{3, std::chrono::milliseconds(200), std::chrono::milliseconds(5000),
                            2.0, true};

    /// Default validity of presigned URLs
    std::chrono::seconds presign_expiry{3600};

    [[nodiscard]] auto validate() const -> result<void> {
        if (bucket.empty()) {
            return unexpected(error{error_code::invalid_configuration, "bucket name is empty"});
        }
        if (region.empty()) {
            return unexpected(error{error_code::invalid_configuration, "region is empty"});
        }
        if (credentials.empty()) {
            return unexpected(error{error_code::missing_credentials,
                                    "access key id and secret access key are required"});
        }
        if (presign_expiry.count() <= 0 || presign_expiry > std::chrono::hours(24 * 7)) {
            return unexpected(error{error_code::invalid_configuration,
                                    "presigned URL expiry must be within 1 s and 7 days"});
        }
        return read_retry.validate();
    }
};

/**
 * @brief Backup store configuration (messaging channel used as blob storage)
 */
struct channel_store_config {
    /// Default maximum size of one stored message (2000 MiB)
    static constexpr uint64_t default_max_message_size = 2000ULL * 1024 * 1024;

    /// Bot API base URL
    std::string api_base_url = "https://api.telegram.org";

    /// Bot token
    std::string bot_token;

    /// Chat or channel that stores the documents
    std::string chat_id;

    /// Largest document sent in one message; bigger chunks are split
    uint64_t max_message_size = default_max_message_size;

    /// Fetched segments kept in memory for seek-heavy reads
    std::size_t segment_cache_entries = 4;

    /// Timeout of a single API request
    std::chrono::milliseconds request_timeout{120000};

    /// Adapter-internal retry of segment fetches
    retry_policy read_retry{3, std::chrono::milliseconds(500), std::chrono::milliseconds(10000),
                            2.0, true};

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto r = read_retry.validate(); !r) {
            return r;
        }
        if (bot_token.empty()) {
            return unexpected(error{error_code::missing_credentials, "bot token is empty"});
        }
        if (chat_id.empty()) {
            return unexpected(error{error_code::invalid_configuration, "chat id is empty"});
        }
        if (api_base_url.empty()) {
            return unexpected(error{error_code::invalid_configuration, "API base URL is empty"});
        }
        if (max_message_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max message size must be positive"});
        }
        return {};
    }
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_STORE_STORE_CONFIG_H
