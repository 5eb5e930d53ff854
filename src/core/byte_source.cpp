/**
 * @file byte_source.cpp
 * @brief Implementation of memory and stream byte sources
 */

#include <chunk_relay/core/byte_source.h>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace chunk_relay {

// memory_source implementation

memory_source::memory_source(std::vector<std::byte> data) : data_(std::move(data)) {}

memory_source::memory_source(std::string_view text) : data_(text.size()) {
    std::memcpy(data_.data(), text.data(), text.size());
}

auto memory_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto count = std::min(buffer.size(), data_.size() - position_);
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

auto memory_source::size_hint() const -> std::optional<uint64_t> {
    return data_.size();
}

// stream_source implementation

stream_source::stream_source(std::istream& stream, std::optional<uint64_t> declared_size)
    : owned_(nullptr), stream_(&stream), declared_size_(declared_size) {}

stream_source::stream_source(std::unique_ptr<std::istream> stream,
                             std::optional<uint64_t> declared_size)
    : owned_(std::move(stream)), stream_(owned_.get()), declared_size_(declared_size) {}

auto stream_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty()) {
        return std::size_t{0};
    }
    if (stream_->bad()) {
        return unexpected(error{error_code::source_read_error, "stream is in a bad state"});
    }
    if (stream_->eof()) {
        return std::size_t{0};
    }

    stream_->read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
    auto count = static_cast<std::size_t>(stream_->gcount());

    if (stream_->bad()) {
        return unexpected(error{error_code::source_read_error, "stream read failed"});
    }
    return count;
}

auto stream_source::size_hint() const -> std::optional<uint64_t> {
    return declared_size_;
}

auto stream_source::open_file(const std::filesystem::path& path)
    -> result<std::unique_ptr<byte_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(
            error{error_code::source_read_error, "file not found: " + path.string()});
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::source_read_error, "cannot get file size: " + path.string()});
    }

    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*file) {
        return unexpected(
            error{error_code::source_read_error, "cannot open file: " + path.string()});
    }

    return std::unique_ptr<byte_source>(
        std::make_unique<stream_source>(std::move(file), file_size));
}

}  // namespace chunk_relay
