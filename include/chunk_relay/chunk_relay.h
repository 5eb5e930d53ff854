/**
 * @file chunk_relay.h
 * @brief Main header for the chunk_relay library
 * @version 0.1.0
 *
 * Include this header to access the transfer engine, the remote stores and
 * the supporting core types.
 *
 * @code
 * #include <chunk_relay/chunk_relay.h>
 *
 * using namespace chunk_relay;
 *
 * auto engine = transfer_engine::builder()
 *     .with_primary(primary_store)
 *     .build();
 * @endcode
 */

#ifndef CHUNK_RELAY_CHUNK_RELAY_H
#define CHUNK_RELAY_CHUNK_RELAY_H

#include <cstdint>
#include <string>

// Core types
#include <chunk_relay/core/types.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/core/byte_source.h>
#include <chunk_relay/core/checksum.h>
#include <chunk_relay/core/chunk_stream.h>
#include <chunk_relay/core/progress_tracker.h>
#include <chunk_relay/core/retry_policy.h>
#include <chunk_relay/core/transfer_config.h>
#include <chunk_relay/core/logging.h>

// Stores
#include <chunk_relay/store/remote_store.h>
#include <chunk_relay/store/s3_object_store.h>
#include <chunk_relay/store/backup_channel_store.h>

// Transfers
#include <chunk_relay/transfer/replication_coordinator.h>
#include <chunk_relay/transfer/transfer_session.h>
#include <chunk_relay/transfer/range_server.h>
#include <chunk_relay/transfer/transfer_engine.h>

// Adapters
#include <chunk_relay/adapters/thread_pool_adapter.h>

namespace chunk_relay {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CHUNK_RELAY_H
