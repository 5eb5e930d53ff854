/**
 * @file backup_channel_store.h
 * @brief Backup destination that keeps chunks as messaging channel documents
 *
 * Every chunk is posted as one document, or as several when it exceeds the
 * configured message size. An in-memory index maps each object to its
 * segments (message ID, file ID, byte range and CRC-32). Reads reassemble
 * the requested range from the overlapping segments and verify each one.
 * A small LRU cache of fetched segments serves seek-heavy playback.
 *
 * The index lives only as long as the store; objects written by an earlier
 * process are not readable through it.
 */

#ifndef CHUNK_RELAY_STORE_BACKUP_CHANNEL_STORE_H
#define CHUNK_RELAY_STORE_BACKUP_CHANNEL_STORE_H

#include <chunk_relay/store/channel_client.h>
#include <chunk_relay/store/remote_store.h>
#include <chunk_relay/store/store_config.h>

#include <memory>

namespace chunk_relay {

class backup_channel_store : public remote_store {
public:
    /**
     * @brief Create a store
     * @param config Store configuration (validated)
     * @param client Channel transport; a Bot API client over network_system
     *        is created when null
     */
    [[nodiscard]] static auto create(const channel_store_config& config,
                                     std::shared_ptr<channel_client> client = nullptr)
        -> result<std::shared_ptr<backup_channel_store>>;

    backup_channel_store(const channel_store_config& config,
                         std::shared_ptr<channel_client> client);
    ~backup_channel_store() override;

    backup_channel_store(const backup_channel_store&) = delete;
    auto operator=(const backup_channel_store&) -> backup_channel_store& = delete;

    [[nodiscard]] auto name() const -> std::string_view override;

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

    /**
     * @brief Always fails with operation_not_supported
     */
    [[nodiscard]] auto presigned_url(const object_id& id, std::chrono::seconds expiry)
        -> result<std::string> override;

    [[nodiscard]] auto check_connection() -> result<void> override;

    /**
     * @brief Location string of an object ("channel://<chat>/<id>")
     */
    [[nodiscard]] auto location_of(const object_id& id) const -> std::string override;

    /**
     * @brief Number of segments currently in the read cache
     */
    [[nodiscard]] auto cached_segments() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_STORE_BACKUP_CHANNEL_STORE_H
