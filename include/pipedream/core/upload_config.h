/**
 * @file upload_config.h
 * @brief Configuration record for a multipart upload
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_UPLOAD_CONFIG_H
#define PIPEDREAM_CORE_UPLOAD_CONFIG_H

#include "types.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipedream {

/**
 * @brief Region used when none is configured
 *
 * Also suitable for services that ignore regions, such as DigitalOcean
 * Spaces.
 */
inline constexpr std::string_view default_region = "us-east-1";

/**
 * @brief Settings for one multipart upload
 *
 * Fields left at their zero value are filled in by apply_defaults().
 * The orchestrator copies the record, so it is immutable for the duration
 * of an upload.
 *
 * @code
 * upload_config config;
 * config.access_key = "AKID";
 * config.secret_key = "secret";
 * config.bucket = "backups";
 * config.endpoint = "sfo2.digitaloceanspaces.com";
 * config.max_part_size = 8 * megabyte;
 * @endcode
 */
struct upload_config {
    static constexpr int default_max_retries = 3;
    static constexpr std::size_t default_max_part_size = 5 * megabyte;

    /// Host name, optionally with scheme (e.g. "nyc3.digitaloceanspaces.com")
    std::string endpoint;

    std::string region;
    std::string bucket;
    std::string access_key;
    std::string secret_key;

    /// Temporary credential token, sent as x-amz-security-token
    std::optional<std::string> session_token;

    /// Attempts per part, including the first one
    int max_retries = 0;

    std::size_t max_part_size = 0;

    /// Address objects as endpoint/bucket/key instead of bucket.endpoint/key
    bool use_path_style = false;

    bool use_ssl = true;

    /// Skip content sniffing and send this type when set
    std::optional<std::string> content_type;

    std::chrono::milliseconds request_timeout{30000};

    /**
     * @brief Fill zero-valued fields with their defaults
     * @return Reference to this config for chaining
     */
    auto apply_defaults() -> upload_config&;

    /**
     * @brief Names of required fields that are empty
     *
     * Names are reported in the order accessKey, secretKey, bucket.
     */
    [[nodiscard]] auto missing_fields() const -> std::vector<std::string>;

    /**
     * @brief Validate the configuration
     * @return Error with code invalid_configuration if unusable
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Endpoint URL including the scheme
     */
    [[nodiscard]] auto endpoint_url() const -> std::string;

    /**
     * @brief Endpoint host without scheme or trailing slash
     */
    [[nodiscard]] auto endpoint_host() const -> std::string;
};

/**
 * @brief Join words as an English list
 *
 * {"a"} -> "a", {"a", "b"} -> "a and b", {"a", "b", "c"} -> "a, b, and c".
 * The comma before "and" is only written for three or more words and only
 * when @p oxford_comma is set.
 */
[[nodiscard]] auto english_join(const std::vector<std::string>& words,
                                bool oxford_comma = true) -> std::string;

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_UPLOAD_CONFIG_H
