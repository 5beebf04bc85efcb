/**
 * @file types.h
 * @brief Core type definitions for media_relay_system
 */

#ifndef KCENON_MEDIA_RELAY_CORE_TYPES_H
#define KCENON_MEDIA_RELAY_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::media_relay {

/**
 * @brief Error codes for relay operations
 *
 * Codes are grouped in ranges so that category_of() can map them to the
 * handling policy of each failure class.
 */
enum class error_code {
    success = 0,

    // Connectivity errors (-100 to -119)
    connection_failed = -100,
    connection_timeout = -101,
    connection_refused = -102,
    connection_lost = -103,
    not_connected = -104,
    device_unavailable = -105,
    device_read_error = -106,

    // Protocol errors (-120 to -139)
    malformed_response = -120,
    unexpected_status = -121,
    missing_field = -122,
    remote_rejected = -123,

    // Filesystem errors (-140 to -159)
    file_not_found = -140,
    file_access_denied = -141,
    file_read_error = -142,
    file_write_error = -143,
    file_rename_error = -144,
    file_remove_error = -145,
    storage_unavailable = -146,

    // Cancellation (-160 to -169)
    upload_cancelled = -160,
    download_cancelled = -161,
    transfer_cancelled = -162,

    // Validity (-170 to -179)
    invalid_file = -170,
    already_present = -171,
    already_remote = -172,

    // Internal errors (-200 to -219)
    invalid_configuration = -200,
    invalid_state = -201,
    transfer_force_paused = -202,
    internal_error = -203,
};

/**
 * @brief Failure classes with distinct propagation policy
 */
enum class error_category {
    none,
    connectivity,
    protocol,
    filesystem,
    cancellation,
    validity,
    internal,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::not_connected:
            return "not connected";
        case error_code::device_unavailable:
            return "device unavailable";
        case error_code::device_read_error:
            return "device read error";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::unexpected_status:
            return "unexpected status";
        case error_code::missing_field:
            return "missing field";
        case error_code::remote_rejected:
            return "rejected by remote";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_rename_error:
            return "file rename error";
        case error_code::file_remove_error:
            return "file remove error";
        case error_code::storage_unavailable:
            return "storage unavailable";
        case error_code::upload_cancelled:
            return "upload was cancelled";
        case error_code::download_cancelled:
            return "download was cancelled";
        case error_code::transfer_cancelled:
            return "transfer was cancelled";
        case error_code::invalid_file:
            return "invalid file";
        case error_code::already_present:
            return "already present at destination";
        case error_code::already_remote:
            return "already known to remote";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::transfer_force_paused:
            return "transfer is paused by the system";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Map an error code to its failure class
 */
[[nodiscard]] constexpr auto category_of(error_code code) -> error_category {
    const auto value = static_cast<int>(code);
    if (value == 0) return error_category::none;
    if (value <= -100 && value > -120) return error_category::connectivity;
    if (value <= -120 && value > -140) return error_category::protocol;
    if (value <= -140 && value > -160) return error_category::filesystem;
    if (value <= -160 && value > -170) return error_category::cancellation;
    if (value <= -170 && value > -180) return error_category::validity;
    return error_category::internal;
}

/**
 * @brief Only connectivity failures are worth retrying
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) -> bool {
    return category_of(code) == error_category::connectivity;
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

    [[nodiscard]] auto category() const noexcept -> error_category {
        return category_of(code);
    }

    [[nodiscard]] auto retryable() const noexcept -> bool {
        return is_retryable(code);
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
 * A simple Result type similar to std::expected (C++23).
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

/**
 * @brief User-facing failure description (title, message)
 *
 * Handed to a user_notifier for display. Never localized by the core.
 */
struct user_error {
    std::string title;
    std::string message;

    [[nodiscard]] auto operator==(const user_error& other) const -> bool = default;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_TYPES_H
