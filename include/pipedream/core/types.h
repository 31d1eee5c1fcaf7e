/**
 * @file types.h
 * @brief Core type definitions for pipedream
 */

#ifndef PIPEDREAM_CORE_TYPES_H
#define PIPEDREAM_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace pipedream {

/**
 * @brief Error codes for multipart upload operations
 */
enum class error_code {
    success = 0,

    // Stream errors (-100 to -119)
    stream_read_error = -100,
    empty_input = -101,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,

    // Internal errors (-200 to -219)
    internal_error = -200,

    // Upload lifecycle errors (-800 to -849)
    initiate_failed = -800,
    part_upload_failed = -801,
    completion_failed = -802,
    abort_failed = -803,
    invalid_state_transition = -804,

    // Backend / HTTP errors (-850 to -899)
    http_client_unavailable = -850,
    http_request_failed = -851,
    http_status_error = -852,
    response_parse_error = -853,
    missing_etag = -854,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::stream_read_error:
            return "stream read error";
        case error_code::empty_input:
            return "empty input";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::initiate_failed:
            return "initiate multipart upload failed";
        case error_code::part_upload_failed:
            return "part upload failed";
        case error_code::completion_failed:
            return "complete multipart upload failed";
        case error_code::abort_failed:
            return "abort multipart upload failed";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::http_client_unavailable:
            return "http client unavailable";
        case error_code::http_request_failed:
            return "http request failed";
        case error_code::http_status_error:
            return "http status error";
        case error_code::response_parse_error:
            return "response parse error";
        case error_code::missing_etag:
            return "missing etag";
        default:
            return "unknown error";
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
 * Contains either a value of type T or an error, in the manner of
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

/**
 * @brief Size helpers for configuring part sizes
 */
inline constexpr std::size_t kilobyte = 1024;
inline constexpr std::size_t megabyte = 1024 * kilobyte;

/**
 * @brief A part accepted by the backend
 */
struct completed_part {
    int part_number = 0;
    std::string etag;
    std::size_t size = 0;
};

/**
 * @brief Backend result of a completed multipart upload
 */
struct upload_result {
    std::string location;
    std::string bucket;
    std::string key;
    std::string etag;
    std::string upload_id;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_TYPES_H
