/**
 * @file upload_config.cpp
 * @brief Implementation of upload configuration defaults and validation
 */

#include "pipedream/core/upload_config.h"

namespace pipedream {

auto upload_config::apply_defaults() -> upload_config& {
    if (max_retries == 0) {
        max_retries = default_max_retries;
    }
    if (max_part_size == 0) {
        max_part_size = default_max_part_size;
    }
    if (region.empty()) {
        region = std::string(default_region);
    }
    if (endpoint.empty()) {
        endpoint = "s3." + region + ".amazonaws.com";
    }
    return *this;
}

auto upload_config::missing_fields() const -> std::vector<std::string> {
    std::vector<std::string> missing;
    if (access_key.empty()) {
        missing.emplace_back("accessKey");
    }
    if (secret_key.empty()) {
        missing.emplace_back("secretKey");
    }
    if (bucket.empty()) {
        missing.emplace_back("bucket");
    }
    return missing;
}

auto upload_config::validate() const -> result<void> {
    auto missing = missing_fields();
    if (!missing.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "missing " + english_join(missing)}};
    }

    if (max_retries < 1) {
        return unexpected{error{error_code::invalid_configuration,
            "max retries must be at least 1"}};
    }

    if (max_part_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "max part size must be greater than zero"}};
    }

    if (endpoint.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "endpoint is empty"}};
    }

    return {};
}

auto upload_config::endpoint_host() const -> std::string {
    std::string host = endpoint;
    auto scheme_end = host.find("://");
    if (scheme_end != std::string::npos) {
        host = host.substr(scheme_end + 3);
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    return host;
}

auto upload_config::endpoint_url() const -> std::string {
    if (endpoint.find("://") != std::string::npos) {
        std::string url = endpoint;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }
    return (use_ssl ? "https://" : "http://") + endpoint_host();
}

auto english_join(const std::vector<std::string>& words, bool oxford_comma) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            bool last = (i + 1 == words.size());
            if (last) {
                if (oxford_comma && words.size() > 2) {
                    joined += ",";
                }
                joined += " and ";
            } else {
                joined += ", ";
            }
        }
        joined += words[i];
    }
    return joined;
}

}  // namespace pipedream
