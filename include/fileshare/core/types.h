/**
 * @file types.h
 * @brief Core type definitions for fileshare
 */

#ifndef FILESHARE_CORE_TYPES_H
#define FILESHARE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fileshare {

/**
 * @brief Error codes for fileshare operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    not_a_directory = -102,
    is_a_directory = -103,
    invalid_file_path = -104,
    file_read_error = -105,
    file_write_error = -106,
    directory_create_error = -107,

    // Transfer errors (-120 to -139)
    size_mismatch = -120,
    transfer_cancelled = -121,

    // Configuration errors (-140 to -159)
    invalid_configuration = -141,

    // Network errors (-160 to -179)
    connection_failed = -160,
    http_status_error = -161,
    invalid_response = -162,
    server_not_running = -164,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::not_a_directory:
            return "not a directory";
        case error_code::is_a_directory:
            return "is a directory";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::directory_create_error:
            return "directory create error";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::http_status_error:
            return "http status error";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::server_not_running:
            return "server not running";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Map an error code to the HTTP status reported by the server
 */
[[nodiscard]] constexpr auto to_http_status(error_code code) -> int {
    switch (code) {
        case error_code::success:
            return 200;
        case error_code::file_access_denied:
            return 403;
        case error_code::file_not_found:
            return 404;
        case error_code::not_a_directory:
        case error_code::is_a_directory:
        case error_code::invalid_file_path:
            return 400;
        default:
            return 500;
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
 * Contains either a value of type T or an error, similar to std::expected.
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

/**
 * @brief A file exposed by the server
 *
 * The path is relative to the server root and '/'-separated. The size is
 * the byte length observed when the directory was enumerated.
 */
struct file_record {
    std::string path;
    int64_t size = 0;

    file_record() = default;
    file_record(std::string p, int64_t s) : path(std::move(p)), size(s) {}

    [[nodiscard]] auto operator==(const file_record& other) const -> bool = default;
};

/**
 * @brief Listing returned by the server, in filesystem-walk order
 */
using listing = std::vector<file_record>;

}  // namespace fileshare

#endif  // FILESHARE_CORE_TYPES_H
