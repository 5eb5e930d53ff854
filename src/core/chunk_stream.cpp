/**
 * @file chunk_stream.cpp
 * @brief Implementation of chunk_stream
 */

#include <chunk_relay/core/chunk_stream.h>

#include <chunk_relay/core/checksum.h>
#include <chunk_relay/core/logging.h>

#include <algorithm>

namespace chunk_relay {

auto chunk_stream::create(std::unique_ptr<byte_source> source, const chunk_config& config)
    -> result<std::unique_ptr<chunk_stream>> {
    if (!source) {
        return unexpected(error{error_code::invalid_configuration, "source is null"});
    }
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto declared = source->size_hint();
    if (declared && *declared > config.max_object_size) {
        return unexpected(error{error_code::object_too_large,
                                "declared size " + format_size(*declared) +
                                    " exceeds limit " + format_size(config.max_object_size)});
    }

    return std::make_unique<chunk_stream>(std::move(source), config);
}

chunk_stream::chunk_stream(std::unique_ptr<byte_source> source, const chunk_config& config)
    : source_(std::move(source)), config_(config) {
    declared_size_ = source_->size_hint();
}

auto chunk_stream::total_size() const noexcept -> std::optional<uint64_t> {
    if (declared_size_) {
        return declared_size_;
    }
    if (finished_) {
        return next_offset_;
    }
    return std::nullopt;
}

auto chunk_stream::fail(error err) -> unexpected {
    CR_LOG_WARN(log_category::chunk,
                "chunk stream failed at offset " + std::to_string(next_offset_) + ": " +
                    err.message);
    failure_ = err;
    return unexpected(std::move(err));
}

auto chunk_stream::fill(std::vector<std::byte>& buffer, std::size_t wanted)
    -> result<std::size_t> {
    std::size_t filled = buffer.size();
    buffer.resize(wanted);

    while (filled < wanted) {
        auto read = source_->read(std::span<std::byte>(buffer.data() + filled, wanted - filled));
        if (!read) {
            buffer.resize(filled);
            return unexpected(read.error());
        }
        if (read.value() == 0) {
            break;
        }
        filled += read.value();
    }

    buffer.resize(filled);
    return filled;
}

auto chunk_stream::next() -> result<std::optional<stream_chunk>> {
    if (failure_) {
        return unexpected(*failure_);
    }
    if (finished_) {
        return std::optional<stream_chunk>{};
    }

    std::size_t wanted = config_.chunk_size;
    if (declared_size_) {
        wanted = static_cast<std::size_t>(
            std::min<uint64_t>(wanted, *declared_size_ - next_offset_));
    }

    std::vector<std::byte> buffer;
    buffer.reserve(wanted);
    if (lookahead_) {
        buffer.push_back(*lookahead_);
        lookahead_.reset();
    }

    auto filled = fill(buffer, wanted);
    if (!filled) {
        return fail(error{error_code::short_read,
                          "source closed abnormally: " + filled.error().message});
    }
    auto got = filled.value();

    bool last = false;
    if (declared_size_) {
        if (got < wanted) {
            return fail(error{error_code::short_read,
                              "source ended at " + std::to_string(next_offset_ + got) +
                                  " of " + std::to_string(*declared_size_) + " bytes"});
        }
        last = next_offset_ + got == *declared_size_;
        if (last) {
            // A sized source must be exhausted exactly at its declared end
            std::byte probe{};
            auto extra = source_->read(std::span<std::byte>(&probe, 1));
            if (!extra) {
                return fail(error{error_code::short_read,
                                  "source closed abnormally: " + extra.error().message});
            }
            if (extra.value() > 0) {
                return fail(error{error_code::source_overrun,
                                  "source produced more than " +
                                      std::to_string(*declared_size_) + " bytes"});
            }
        }
    } else {
        if (got == 0) {
            finished_ = true;
            return std::optional<stream_chunk>{};
        }
        if (got < wanted) {
            last = true;
        } else {
            std::byte probe{};
            auto extra = source_->read(std::span<std::byte>(&probe, 1));
            if (!extra) {
                return fail(error{error_code::short_read,
                                  "source closed abnormally: " + extra.error().message});
            }
            if (extra.value() == 0) {
                last = true;
            } else {
                lookahead_ = probe;
            }
        }
    }

    if (next_offset_ + got > config_.max_object_size) {
        return fail(error{error_code::object_too_large,
                          "object exceeds limit " + format_size(config_.max_object_size)});
    }

    if (got == 0) {
        // Declared size of zero
        finished_ = true;
        return std::optional<stream_chunk>{};
    }

    stream_chunk item;
    item.descriptor.sequence_number = next_sequence_;
    item.descriptor.offset = next_offset_;
    item.descriptor.length = got;
    if (config_.verify_integrity) {
        item.descriptor.checksum =
            checksum::compute(config_.algorithm, std::span<const std::byte>(buffer));
    }
    item.data = std::move(buffer);
    item.last = last;

    ++next_sequence_;
    next_offset_ += got;
    if (last) {
        finished_ = true;
    }

    return std::optional<stream_chunk>(std::move(item));
}

}  // namespace chunk_relay
