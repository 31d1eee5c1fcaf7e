/**
 * @file cloud_http_client.cpp
 * @brief HTTP client adapter implementation
 * @version 0.1.0
 */

#include "pipedream/cloud/cloud_http_client.h"
#include "pipedream/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace pipedream {

namespace {

#if !KCENON_WITH_NETWORK_SYSTEM
auto unavailable() -> result<http_response_base> {
    return unexpected{error{error_code::http_client_unavailable,
        "HTTP client not available (built without network_system)"}};
}
#endif

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct cloud_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response_base {
        http_response_base result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Response>
    auto finish(const Response& response, const char* method) -> result<http_response_base> {
        if (response.is_err()) {
            return unexpected{error{error_code::http_request_failed,
                std::string("HTTP ") + method + " request failed: " +
                response.error().message}};
        }
        return convert_response(response.value());
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

cloud_http_client::cloud_http_client(cloud_http_client&&) noexcept = default;
auto cloud_http_client::operator=(cloud_http_client&&) noexcept
    -> cloud_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto cloud_http_client::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response_base> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->post(url, body, headers), "POST");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto cloud_http_client::put(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response_base> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string body_str(body.begin(), body.end());
    return impl_->finish(impl_->client->put(url, body_str, headers), "PUT");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto cloud_http_client::del(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response_base> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->del(url, headers), "DELETE");
#else
    (void)url;
    (void)headers;
    return unavailable();
#endif
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<cloud_http_client> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace pipedream
