/**
 * @file types.h
 * @brief Core type definitions for file_delivery
 */

#ifndef KCENON_FILE_DELIVERY_CORE_TYPES_H
#define KCENON_FILE_DELIVERY_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::file_delivery {

/**
 * @brief Error codes for file delivery operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_already_exists = -102,
    invalid_file_path = -104,
    file_read_error = -105,
    file_write_error = -106,
    file_move_error = -107,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,
    missing_api_key = -142,
    config_parse_error = -143,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    http_error = -165,
    invalid_response = -166,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,

    // Coordination errors (-300 to -319)
    lock_conflict = -300,
    lock_io_error = -301,
    claim_failed = -302,

    // Remote service errors (-400 to -419)
    server_unresponsive = -400,
    host_not_approved = -401,
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
        case error_code::file_already_exists:
            return "file already exists";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_move_error:
            return "file move error";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_api_key:
            return "missing api key";
        case error_code::config_parse_error:
            return "config parse error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::http_error:
            return "http error";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::lock_conflict:
            return "lock conflict";
        case error_code::lock_io_error:
            return "lock io error";
        case error_code::claim_failed:
            return "claim failed";
        case error_code::server_unresponsive:
            return "server unresponsive";
        case error_code::host_not_approved:
            return "host not approved";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and optional HTTP status
 *
 * @c http_status is non-zero only for error_code::http_error.
 */
struct error {
    error_code code;
    std::string message;
    int http_status = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), http_status(status) {}

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
 * Contains either a value of type T or an error.
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

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CORE_TYPES_H
