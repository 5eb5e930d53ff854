/**
 * @file range_server.cpp
 * @brief Partial-content reads with primary to backup fallback
 */

#include <chunk_relay/transfer/range_server.h>

#include <chunk_relay/core/logging.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace chunk_relay {

namespace {

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

auto parse_offset(std::string_view text) -> std::optional<uint64_t> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
    if (parsed.ec != std::errc{} || parsed.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto not_satisfiable(std::string message) -> unexpected {
    return unexpected(error{error_code::range_not_satisfiable, std::move(message)});
}

}  // namespace

// ============================================================================
// Range header
// ============================================================================

auto parse_range_header(std::string_view header, uint64_t object_size) -> result<byte_range> {
    constexpr std::string_view unit = "bytes=";

    auto value = trim(header);
    if (value.size() < unit.size()) {
        return not_satisfiable("malformed range: " + std::string(header));
    }
    for (std::size_t i = 0; i < unit.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != unit[i]) {
            return not_satisfiable("unsupported range unit: " + std::string(header));
        }
    }
    value.remove_prefix(unit.size());

    if (value.find(',') != std::string_view::npos) {
        return unexpected(error{error_code::operation_not_supported,
                                "multiple ranges are not supported"});
    }

    auto dash = value.find('-');
    if (dash == std::string_view::npos) {
        return not_satisfiable("malformed range: " + std::string(header));
    }
    auto first_text = trim(value.substr(0, dash));
    auto last_text = trim(value.substr(dash + 1));

    if (first_text.empty()) {
        // Suffix form: the last n bytes
        auto suffix = parse_offset(last_text);
        if (!suffix || *suffix == 0 || object_size == 0) {
            return not_satisfiable("unsatisfiable suffix range: " + std::string(header));
        }
        byte_range range;
        range.first = *suffix >= object_size ? 0 : object_size - *suffix;
        range.last = object_size - 1;
        return range;
    }

    auto first = parse_offset(first_text);
    if (!first) {
        return not_satisfiable("malformed range: " + std::string(header));
    }
    if (*first >= object_size) {
        return not_satisfiable("range start " + std::to_string(*first) +
                               " is beyond object size " + std::to_string(object_size));
    }

    byte_range range;
    range.first = *first;
    if (!last_text.empty()) {
        auto last = parse_offset(last_text);
        if (!last || *last < *first) {
            return not_satisfiable("malformed range: " + std::string(header));
        }
        range.last = std::min(*last, object_size - 1);
    }
    return range;
}

auto range_read_result::response_headers() const -> http_headers {
    http_headers headers;
    headers["Content-Range"] = "bytes " + std::to_string(first) + "-" + std::to_string(last) +
                               "/" + std::to_string(total_size);
    headers["Content-Length"] = std::to_string(data.size());
    headers["Content-Type"] = content_type.empty() ? "application/octet-stream" : content_type;
    headers["Accept-Ranges"] = "bytes";
    return headers;
}

// ============================================================================
// range_server
// ============================================================================

range_server::range_server(std::shared_ptr<remote_store> primary,
                           std::shared_ptr<remote_store> backup,
                           std::size_t max_request_size)
    : primary_(std::move(primary)),
      backup_(std::move(backup)),
      max_request_size_(max_request_size == 0 ? 1 : max_request_size) {}

auto range_server::can_fall_back(const stored_object_metadata& metadata) const -> bool {
    return backup_ != nullptr && metadata.backup_location.has_value();
}

auto range_server::read(const stored_object_metadata& metadata, const byte_range& range) const
    -> result<range_read_result> {
    return read(metadata, range.first, range.last);
}

auto range_server::read(const stored_object_metadata& metadata,
                        uint64_t start,
                        std::optional<uint64_t> end) const -> result<range_read_result> {
    if (!primary_) {
        return unexpected(error{error_code::not_initialized, "range server has no primary store"});
    }
    if (start >= metadata.size) {
        return not_satisfiable("range start " + std::to_string(start) +
                               " is beyond object size " + std::to_string(metadata.size));
    }
    if (end && *end < start) {
        return not_satisfiable("range end " + std::to_string(*end) + " is before start " +
                               std::to_string(start));
    }

    const uint64_t last = end ? std::min(*end, metadata.size - 1) : metadata.size - 1;

    range_read_result out;
    out.first = start;
    out.last = last;
    out.total_size = metadata.size;
    out.content_type = metadata.content_type;
    out.data.reserve(static_cast<std::size_t>(last - start + 1));

    remote_store* source = primary_.get();
    bool on_backup = false;

    uint64_t offset = start;
    while (offset <= last) {
        const uint64_t piece_last = std::min<uint64_t>(last, offset + max_request_size_ - 1);
        auto piece = source->get_range(metadata.id, offset, piece_last);

        if (!piece && !on_backup) {
            const auto primary_error = piece.error();
            if (!primary_error.is_transient()) {
                return unexpected(primary_error);
            }
            if (!can_fall_back(metadata)) {
                return unexpected(error{error_code::destination_unavailable,
                                        std::string(primary_->name()) + ": " +
                                            primary_error.message});
            }

            transfer_log_context ctx;
            ctx.object_id = metadata.id;
            ctx.destination = std::string(backup_->name());
            ctx.error_message = primary_error.message;
            CR_LOG_WARN_CTX(log_category::range, "primary unreachable, reading from backup", ctx);

            source = backup_.get();
            on_backup = true;
            piece = source->get_range(metadata.id, offset, piece_last);
            if (!piece) {
                return unexpected(error{error_code::destination_unavailable,
                                        std::string(primary_->name()) + ": " +
                                            primary_error.message + "; " +
                                            std::string(backup_->name()) + ": " +
                                            piece.error().message});
            }
        } else if (!piece) {
            return unexpected(error{error_code::destination_unavailable,
                                    std::string(backup_->name()) + ": " + piece.error().message});
        }

        const uint64_t expected = piece_last - offset + 1;
        if (piece.value().size() != expected) {
            return unexpected(error{error_code::store_response_invalid,
                                    std::string(source->name()) + " returned " +
                                        std::to_string(piece.value().size()) + " bytes for " +
                                        std::to_string(expected) + " requested"});
        }
        out.data.insert(out.data.end(), piece.value().begin(), piece.value().end());
        offset = piece_last + 1;
    }

    out.served_by = std::string(source->name());
    CR_LOG_TRACE(log_category::range,
                 "served bytes " + std::to_string(start) + "-" + std::to_string(last) + " of " +
                     metadata.id + " from " + out.served_by);
    return out;
}

}  // namespace chunk_relay
