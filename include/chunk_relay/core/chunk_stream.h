/**
 * @file chunk_stream.h
 * @brief Lazy splitting of a byte source into ordered chunks
 */

#ifndef CHUNK_RELAY_CORE_CHUNK_STREAM_H
#define CHUNK_RELAY_CORE_CHUNK_STREAM_H

#include <chunk_relay/core/byte_source.h>
#include <chunk_relay/core/chunk_config.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/core/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace chunk_relay {

/**
 * @brief One chunk produced by a chunk_stream
 */
struct stream_chunk {
    chunk_descriptor descriptor;
    std::vector<std::byte> data;
    bool last = false;  ///< no chunk follows this one

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data.size(); }
};

/**
 * @brief Forward-only, non-restartable chunk sequence over a byte_source
 *
 * Every chunk except the last is exactly chunk_size bytes. When the source
 * declares its size the stream knows the last chunk in advance and fails
 * with short_read if the source ends early. For sources of unknown length
 * the stream reads one byte ahead so the final chunk is still flagged.
 *
 * Once next() has returned an error every further call returns the same
 * error. An empty source produces no chunks.
 *
 * @code
 * auto stream = chunk_stream::create(std::move(source), chunk_config{});
 * while (true) {
 *     auto item = stream.value()->next();
 *     if (!item) { handle(item.error()); break; }
 *     if (!item.value()) break;  // end of stream
 *     dispatch(std::move(*item.value()));
 * }
 * @endcode
 */
class chunk_stream {
public:
    /**
     * @brief Create a stream after validating the configuration
     */
    [[nodiscard]] static auto create(std::unique_ptr<byte_source> source,
                                     const chunk_config& config)
        -> result<std::unique_ptr<chunk_stream>>;

    chunk_stream(std::unique_ptr<byte_source> source, const chunk_config& config);

    chunk_stream(const chunk_stream&) = delete;
    auto operator=(const chunk_stream&) -> chunk_stream& = delete;

    /**
     * @brief Produce the next chunk
     * @return Chunk, std::nullopt at clean end of stream, or error
     */
    [[nodiscard]] auto next() -> result<std::optional<stream_chunk>>;

    [[nodiscard]] auto chunks_produced() const noexcept -> uint64_t { return next_sequence_; }
    [[nodiscard]] auto bytes_produced() const noexcept -> uint64_t { return next_offset_; }

    /// Declared total size, or the final size once the stream has finished
    [[nodiscard]] auto total_size() const noexcept -> std::optional<uint64_t>;

    [[nodiscard]] auto is_finished() const noexcept -> bool { return finished_; }
    [[nodiscard]] auto failure() const -> const std::optional<error>& { return failure_; }
    [[nodiscard]] auto config() const -> const chunk_config& { return config_; }

private:
    auto fail(error err) -> unexpected;
    auto fill(std::vector<std::byte>& buffer, std::size_t wanted) -> result<std::size_t>;

    std::unique_ptr<byte_source> source_;
    chunk_config config_;
    std::optional<uint64_t> declared_size_;
    uint64_t next_sequence_ = 0;
    uint64_t next_offset_ = 0;
    std::optional<std::byte> lookahead_;
    bool finished_ = false;
    std::optional<error> failure_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_CHUNK_STREAM_H
