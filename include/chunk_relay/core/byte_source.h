/**
 * @file byte_source.h
 * @brief Pull-based byte sources feeding a chunk_stream
 */

#ifndef CHUNK_RELAY_CORE_BYTE_SOURCE_H
#define CHUNK_RELAY_CORE_BYTE_SOURCE_H

#include <chunk_relay/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace chunk_relay {

/**
 * @brief Forward-only source of bytes
 *
 * read() may return fewer bytes than requested. A return of 0 signals a
 * clean end of stream; an error signals that the source closed abnormally.
 * Implementations are used from one thread at a time.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read, 0 at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Total number of bytes the source will produce, if known
     */
    [[nodiscard]] virtual auto size_hint() const -> std::optional<uint64_t> {
        return std::nullopt;
    }
};

/**
 * @brief Source over an in-memory buffer
 */
class memory_source : public byte_source {
public:
    explicit memory_source(std::vector<std::byte> data);
    explicit memory_source(std::string_view text);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto size_hint() const -> std::optional<uint64_t> override;

private:
    std::vector<std::byte> data_;
    std::size_t position_ = 0;
};

/**
 * @brief Source over a std::istream
 *
 * The stream is either borrowed or owned. A declared size makes the
 * stream's size known to the chunk stream, which then detects truncation.
 */
class stream_source : public byte_source {
public:
    stream_source(std::istream& stream,
                  std::optional<uint64_t> declared_size = std::nullopt);

    stream_source(std::unique_ptr<std::istream> stream,
                  std::optional<uint64_t> declared_size = std::nullopt);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto size_hint() const -> std::optional<uint64_t> override;

    /**
     * @brief Open a file as a sized source
     * @return Source or error if the file cannot be opened
     */
    [[nodiscard]] static auto open_file(const std::filesystem::path& path)
        -> result<std::unique_ptr<byte_source>>;

private:
    std::unique_ptr<std::istream> owned_;
    std::istream* stream_;
    std::optional<uint64_t> declared_size_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_BYTE_SOURCE_H
