/**
 * @file types.h
 * @brief Error and result types for chunk_relay
 */

#ifndef CHUNK_RELAY_CORE_TYPES_H
#define CHUNK_RELAY_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace chunk_relay {

/**
 * @brief Error codes for chunk transfer operations
 */
enum class error_code {
    success = 0,

    // Source and chunk errors (-100 to -119)
    short_read = -100,
    source_read_error = -101,
    source_overrun = -102,
    object_too_large = -103,
    chunk_checksum_mismatch = -104,

    // Session errors (-120 to -139)
    already_started = -120,
    invalid_state = -121,
    session_not_found = -122,
    session_cancelled = -123,

    // Store errors (-140 to -169)
    chunk_put_failed = -140,
    range_not_satisfiable = -141,
    object_not_found = -142,
    destination_unavailable = -143,
    store_request_failed = -144,
    store_response_invalid = -145,
    store_rate_limited = -146,
    store_server_error = -147,
    store_access_denied = -148,
    multipart_failed = -149,
    operation_timeout = -150,
    operation_not_supported = -151,

    // Configuration errors (-170 to -189)
    invalid_chunk_size = -170,
    invalid_configuration = -171,
    missing_credentials = -172,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::short_read:
            return "source closed before end of stream";
        case error_code::source_read_error:
            return "source read error";
        case error_code::source_overrun:
            return "source produced more bytes than declared";
        case error_code::object_too_large:
            return "object too large";
        case error_code::chunk_checksum_mismatch:
            return "chunk checksum mismatch";
        case error_code::already_started:
            return "session already started";
        case error_code::invalid_state:
            return "invalid session state";
        case error_code::session_not_found:
            return "session not found";
        case error_code::session_cancelled:
            return "session cancelled";
        case error_code::chunk_put_failed:
            return "chunk put failed";
        case error_code::range_not_satisfiable:
            return "range not satisfiable";
        case error_code::object_not_found:
            return "object not found";
        case error_code::destination_unavailable:
            return "destination unavailable";
        case error_code::store_request_failed:
            return "store request failed";
        case error_code::store_response_invalid:
            return "invalid store response";
        case error_code::store_rate_limited:
            return "store rate limited";
        case error_code::store_server_error:
            return "store server error";
        case error_code::store_access_denied:
            return "store access denied";
        case error_code::multipart_failed:
            return "multipart upload failed";
        case error_code::operation_timeout:
            return "operation timeout";
        case error_code::operation_not_supported:
            return "operation not supported";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_credentials:
            return "missing credentials";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether a failure may succeed when retried
 *
 * Transient failures are network-level problems, throttling and server-side
 * errors. Bad ranges, missing objects and state errors are permanent.
 */
[[nodiscard]] constexpr auto is_transient_error(error_code code) -> bool {
    switch (code) {
        case error_code::store_request_failed:
        case error_code::store_rate_limited:
        case error_code::store_server_error:
        case error_code::operation_timeout:
        case error_code::destination_unavailable:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto is_transient() const noexcept -> bool {
        return is_transient_error(code);
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_CORE_TYPES_H
