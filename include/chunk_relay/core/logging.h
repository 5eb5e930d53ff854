// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for chunk_relay
 *
 * Records go to logger_system when the build enables it and to stderr
 * otherwise. Credentials that appear in request URLs and headers are
 * scrubbed before a record leaves the process.
 */

#pragma once

#include <chunk_relay/config/feature_flags.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if CHUNK_RELAY_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace chunk_relay {

/**
 * @brief Log categories
 */
struct log_category {
    static constexpr std::string_view engine = "chunk_relay.engine";
    static constexpr std::string_view session = "chunk_relay.session";
    static constexpr std::string_view replication = "chunk_relay.replication";
    static constexpr std::string_view store = "chunk_relay.store";
    static constexpr std::string_view range = "chunk_relay.range";
    static constexpr std::string_view progress = "chunk_relay.progress";
    static constexpr std::string_view chunk = "chunk_relay.chunk";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Which secrets the masker scrubs
 */
struct masking_config {
    bool mask_signatures = true;   ///< X-Amz-Signature / X-Amz-Credential query values
    bool mask_authorization = true;
    bool mask_bot_tokens = true;   ///< "/bot<token>/" path segments
    std::string replacement = "****";

    static masking_config all_masked() {
        return {true, true, true, "****"};
    }

    static masking_config none() {
        return {false, false, false, "****"};
    }
};

/**
 * @brief Scrubs store credentials out of log text
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::all_masked())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;

        if (config_.mask_signatures) {
            static const std::regex query_pattern(
                R"((X-Amz-(?:Signature|Credential|Security-Token)=)[^&\s"]+)",
                std::regex::icase);
            result = std::regex_replace(result, query_pattern, "$1" + config_.replacement);
        }

        if (config_.mask_authorization) {
            static const std::regex auth_pattern(
                R"((Authorization["']?\s*[:=]\s*["']?)[^"'\r\n]+)", std::regex::icase);
            result = std::regex_replace(result, auth_pattern, "$1" + config_.replacement);
        }

        if (config_.mask_bot_tokens) {
            static const std::regex token_pattern(R"((/bot)[0-9]+:[A-Za-z0-9_-]+)");
            result = std::regex_replace(result, token_pattern, "$1" + config_.replacement);
        }

        return result;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured context attached to a log record
 */
struct transfer_log_context {
    std::string session_id;
    std::string object_id;
    std::optional<std::string> destination;
    std::optional<uint64_t> chunk_sequence;
    std::optional<uint64_t> bytes;
    std::optional<uint32_t> attempt;
    std::optional<double> rate_bytes_per_sec;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!object_id.empty()) add_field("object_id", object_id);
        if (destination) add_field("destination", *destination);
        if (chunk_sequence) add_uint("chunk", *chunk_sequence);
        if (bytes) add_uint("bytes", *bytes);
        if (attempt) add_uint("attempt", *attempt);
        if (rate_bytes_per_sec) {
            if (!first) oss << ",";
            oss << "\"rate_bps\":" << std::fixed << std::setprecision(2)
                << *rate_bytes_per_sec;
            first = false;
        }
        if (error_message) {
            add_field("error", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger
 */
class chunk_relay_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    chunk_relay_logger() = default;
    ~chunk_relay_logger() = default;

    chunk_relay_logger(const chunk_relay_logger&) = delete;
    chunk_relay_logger& operator=(const chunk_relay_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times. The engine builder calls it.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CHUNK_RELAY_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if CHUNK_RELAY_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CHUNK_RELAY_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Receive every record that passes the level filter
     *
     * The callback sees the unmasked message and runs on the logging thread.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string record = format == log_output_format::json
            ? format_json(level, category, message, context, masker)
            : format_text(category, message, context, masker);

#if CHUNK_RELAY_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), record, file, line, function);
            } else {
                logger_->log(to_logger_level(level), record);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            record = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                     record;
        }
        output_to_stderr(record);
    }

    void flush() {
#if CHUNK_RELAY_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category, std::string_view message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level, std::string_view category,
                            std::string_view message, const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << detail::escape_json_string(masker.mask(std::string(message))) << "\"";
        if (context) {
            auto ctx = context->to_json(&masker);
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

#if CHUNK_RELAY_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
    std::mutex backend_mutex_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline chunk_relay_logger& get_logger() {
    static chunk_relay_logger instance;
    return instance;
}

#define CR_LOG(level, category, message) \
    chunk_relay::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CR_LOG_CTX(level, category, message, context) \
    chunk_relay::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CR_LOG_TRACE(category, message) \
    CR_LOG(chunk_relay::log_level::trace, category, message)

#define CR_LOG_DEBUG(category, message) \
    CR_LOG(chunk_relay::log_level::debug, category, message)

#define CR_LOG_INFO(category, message) \
    CR_LOG(chunk_relay::log_level::info, category, message)

#define CR_LOG_WARN(category, message) \
    CR_LOG(chunk_relay::log_level::warn, category, message)

#define CR_LOG_ERROR(category, message) \
    CR_LOG(chunk_relay::log_level::error, category, message)

#define CR_LOG_DEBUG_CTX(category, message, ctx) \
    CR_LOG_CTX(chunk_relay::log_level::debug, category, message, ctx)

#define CR_LOG_INFO_CTX(category, message, ctx) \
    CR_LOG_CTX(chunk_relay::log_level::info, category, message, ctx)

#define CR_LOG_WARN_CTX(category, message, ctx) \
    CR_LOG_CTX(chunk_relay::log_level::warn, category, message, ctx)

#define CR_LOG_ERROR_CTX(category, message, ctx) \
    CR_LOG_CTX(chunk_relay::log_level::error, category, message, ctx)

}  // namespace chunk_relay
