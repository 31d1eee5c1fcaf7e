/**
 * @file http_client.h
 * @brief HTTP transport abstraction used by the S3 backend
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CLOUD_HTTP_CLIENT_H
#define PIPEDREAM_CLOUD_HTTP_CLIENT_H

#include "pipedream/core/types.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipedream {

/**
 * @brief HTTP response returned by http_client_interface
 */
struct http_response_base {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    /**
     * @brief Get body as string
     */
    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        for (const auto& [k, v] : headers) {
            std::string lower_k = k;
            std::transform(lower_k.begin(), lower_k.end(), lower_k.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (lower_k == lower_key) {
                return v;
            }
        }

        return std::nullopt;
    }

    /**
     * @brief Check if response indicates success (2xx)
     */
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief HTTP operations needed by the S3 backend
 *
 * A failed result means no response was received. Any received response,
 * whatever its status, is returned as a value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute POST request with string body
     */
    virtual auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> = 0;

    /**
     * @brief Execute PUT request with binary body
     */
    virtual auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> = 0;

    /**
     * @brief Execute DELETE request
     */
    virtual auto del(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> = 0;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CLOUD_HTTP_CLIENT_H
