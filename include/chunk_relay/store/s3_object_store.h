/**
 * @file s3_object_store.h
 * @brief Primary destination backed by an S3-compatible bucket
 *
 * Objects are written with multipart uploads, one part per chunk
 * (part number = sequence number + 1). Requests are signed with AWS
 * Signature Version 4. Reads use ranged GET requests.
 *
 * @code
 * s3_store_config config;
 * config.bucket = "media";
 * config.region = "us-east-1";
 * config.credentials = {"AKID", "SECRET", std::nullopt};
 *
 * auto store = s3_object_store::create(config);
 * if (store) {
 *     auto bytes = store.value()->get_range("files/x/movie.mp4", 0, 1023);
 * }
 * @endcode
 *
 * S3 requires every part except the last to be at least 5 MiB; chunk sizes
 * below that are only accepted by S3-compatible stores without the limit.
 */

#ifndef CHUNK_RELAY_STORE_S3_OBJECT_STORE_H
#define CHUNK_RELAY_STORE_S3_OBJECT_STORE_H

#include <chunk_relay/store/http_client.h>
#include <chunk_relay/store/remote_store.h>
#include <chunk_relay/store/store_config.h>

#include <memory>

namespace chunk_relay {

class s3_object_store : public remote_store {
public:
    /// S3 limit on parts per multipart upload
    static constexpr uint64_t max_part_count = 10000;

    /// S3 minimum size of every part except the last
    static constexpr uint64_t min_part_size = 5ULL * 1024 * 1024;

    /**
     * @brief Create a store
     * @param config Store configuration (validated)
     * @param client HTTP client; a network_system client is created when null
     */
    [[nodiscard]] static auto create(const s3_store_config& config,
                                     std::shared_ptr<http_client_interface> client = nullptr)
        -> result<std::shared_ptr<s3_object_store>>;

    s3_object_store(const s3_store_config& config,
                    std::shared_ptr<http_client_interface> client);
    ~s3_object_store() override;

    s3_object_store(const s3_object_store&) = delete;
    auto operator=(const s3_object_store&) -> s3_object_store& = delete;

    [[nodiscard]] auto name() const -> std::string_view override;

    /**
     * @brief Require S3-sized parts and at most max_part_count of them
     *
     * An object that fits in a single chunk is accepted at any chunk size.
     */
    [[nodiscard]] auto validate_layout(std::size_t chunk_size, uint64_t object_size_limit) const
        -> result<void> override;

    [[nodiscard]] auto begin_object(const object_id& id, const std::string& content_type)
        -> result<void> override;

    [[nodiscard]] auto put_chunk(const object_id& id, const chunk_descriptor& descriptor,
                                 std::span<const std::byte> data) -> result<void> override;

    [[nodiscard]] auto complete_object(const stored_object_metadata& metadata)
        -> result<std::string> override;

    [[nodiscard]] auto abort_object(const object_id& id) -> result<void> override;

    [[nodiscard]] auto get_range(const object_id& id, uint64_t first, uint64_t last)
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto head_object(const object_id& id) -> result<object_head> override;

    [[nodiscard]] auto list_objects(const std::string& prefix)
        -> result<std::vector<stored_object_metadata>> override;

    [[nodiscard]] auto delete_object(const object_id& id) -> result<void> override;

    [[nodiscard]] auto presigned_url(const object_id& id, std::chrono::seconds expiry)
        -> result<std::string> override;

    [[nodiscard]] auto check_connection() -> result<void> override;

    /**
     * @brief Location string of an object ("s3://bucket/key")
     */
    [[nodiscard]] auto location_of(const object_id& id) const -> std::string override;

    [[nodiscard]] auto config() const -> const s3_store_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_STORE_S3_OBJECT_STORE_H
