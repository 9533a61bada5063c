// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "fileshare/config/feature_flags.h"

#if FILESHARE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace fileshare {

/**
 * @brief Log categories for fileshare
 */
struct log_category {
    static constexpr std::string_view server = "fileshare.server";
    static constexpr std::string_view listing = "fileshare.listing";
    static constexpr std::string_view client = "fileshare.client";
    static constexpr std::string_view transfer = "fileshare.transfer";
    static constexpr std::string_view batch = "fileshare.batch";
    static constexpr std::string_view ledger = "fileshare.ledger";
};

/**
 * @brief Log levels for fileshare
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
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

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
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
 * @brief Structured log context for a request or a file transfer
 */
struct transfer_log_context {
    std::string path;
    std::optional<int64_t> expected_size;
    std::optional<int64_t> bytes_written;
    std::optional<int> status_code;
    std::optional<std::size_t> worker_id;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> server_address;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!path.empty()) add_field("path", path);
        if (expected_size) add_int("expected_size", *expected_size);
        if (bytes_written) add_int("bytes_written", *bytes_written);
        if (status_code) add_int("status_code", *status_code);
        if (worker_id) add_int("worker_id", static_cast<int64_t>(*worker_id));
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (error_message) add_field("error_message", *error_message);
        if (server_address) add_field("server_address", *server_address);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< One JSON object per line
};

/**
 * @brief fileshare logging interface
 *
 * Forwards to logger_system when it is compiled in, otherwise writes to
 * stderr. A custom callback sees every message that passes the level filter.
 */
class fileshare_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    fileshare_logger() = default;
    ~fileshare_logger() = default;

    fileshare_logger(const fileshare_logger&) = delete;
    fileshare_logger& operator=(const fileshare_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if FILESHARE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    /**
     * @brief Flush and release the backend
     */
    void shutdown() {
#if FILESHARE_USE_LOGGER_SYSTEM
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
#if FILESHARE_USE_LOGGER_SYSTEM
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

    /**
     * @brief Set custom log callback (pass an empty function to clear)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string formatted = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context, file, line, function)
            : format_text(category, message, context);

#if FILESHARE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::text) {
            formatted = get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                        "] " + formatted;
        }
        output_to_stderr(formatted);
    }

    void flush() {
#if FILESHARE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const char* file,
                            int line,
                            const char* function) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(file) << "\"";
            if (line > 0) oss << ",\"line\":" << line;
            if (function) oss << ",\"function\":\"" << function << "\"";
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if FILESHARE_USE_LOGGER_SYSTEM
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
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline fileshare_logger& get_logger() {
    static fileshare_logger instance;
    return instance;
}

// Logging macros for convenience
#define FS_LOG(level, category, message) \
    fileshare::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FS_LOG_CTX(level, category, message, context) \
    fileshare::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FS_LOG_TRACE(category, message) \
    FS_LOG(fileshare::log_level::trace, category, message)

#define FS_LOG_DEBUG(category, message) \
    FS_LOG(fileshare::log_level::debug, category, message)

#define FS_LOG_INFO(category, message) \
    FS_LOG(fileshare::log_level::info, category, message)

#define FS_LOG_WARN(category, message) \
    FS_LOG(fileshare::log_level::warn, category, message)

#define FS_LOG_ERROR(category, message) \
    FS_LOG(fileshare::log_level::error, category, message)

#define FS_LOG_DEBUG_CTX(category, message, ctx) \
    FS_LOG_CTX(fileshare::log_level::debug, category, message, ctx)

#define FS_LOG_INFO_CTX(category, message, ctx) \
    FS_LOG_CTX(fileshare::log_level::info, category, message, ctx)

#define FS_LOG_WARN_CTX(category, message, ctx) \
    FS_LOG_CTX(fileshare::log_level::warn, category, message, ctx)

#define FS_LOG_ERROR_CTX(category, message, ctx) \
    FS_LOG_CTX(fileshare::log_level::error, category, message, ctx)

}  // namespace fileshare
