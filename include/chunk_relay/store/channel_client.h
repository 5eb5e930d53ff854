/**
 * @file channel_client.h
 * @brief Messaging channel transport used by the backup store
 *
 * The backup store keeps chunks as documents posted to a chat. This header
 * defines the small set of channel calls it needs and an implementation over
 * the Telegram-style Bot API.
 */

#ifndef CHUNK_RELAY_STORE_CHANNEL_CLIENT_H
#define CHUNK_RELAY_STORE_CHANNEL_CLIENT_H

#include <chunk_relay/core/types.h>
#include <chunk_relay/store/http_client.h>
#include <chunk_relay/store/store_config.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace chunk_relay {

/**
 * @brief A document stored in the channel
 */
struct channel_document {
    int64_t message_id = 0;
    std::string file_id;
    uint64_t size = 0;
};

/**
 * @brief Abstract channel transport
 */
class channel_client {
public:
    virtual ~channel_client() = default;

    /**
     * @brief Post a document to the channel
     * @param file_name Name shown for the document
     * @param caption Message caption
     */
    [[nodiscard]] virtual auto send_document(const std::string& file_name,
                                             const std::string& caption,
                                             std::span<const std::byte> data)
        -> result<channel_document> = 0;

    /**
     * @brief Download a document's content by file ID
     */
    [[nodiscard]] virtual auto fetch_document(const std::string& file_id)
        -> result<std::vector<std::byte>> = 0;

    /**
     * @brief Delete the message carrying a document
     *
     * Fails with object_not_found if the message no longer exists.
     */
    [[nodiscard]] virtual auto delete_message(int64_t message_id) -> result<void> = 0;

    /**
     * @brief Name of the authenticated bot; used as a connection check
     */
    [[nodiscard]] virtual auto get_me() -> result<std::string> = 0;
};

/**
 * @brief channel_client over the Bot HTTP API
 *
 * The public Bot API only serves downloads up to 20 MB; chunk sizes above
 * that need a self-hosted Bot API server given as api_base_url.
 */
class bot_api_channel_client : public channel_client {
public:
    bot_api_channel_client(const channel_store_config& config,
                           std::shared_ptr<http_client_interface> http);
    ~bot_api_channel_client() override;

    bot_api_channel_client(const bot_api_channel_client&) = delete;
    auto operator=(const bot_api_channel_client&) -> bot_api_channel_client& = delete;

    [[nodiscard]] auto send_document(const std::string& file_name, const std::string& caption,
                                     std::span<const std::byte> data)
        -> result<channel_document> override;

    [[nodiscard]] auto fetch_document(const std::string& file_id)
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto delete_message(int64_t message_id) -> result<void> override;

    [[nodiscard]] auto get_me() -> result<std::string> override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_STORE_CHANNEL_CLIENT_H
