/**
 * @file aws_signer.cpp
 * @brief AWS Signature Version 4 implementation
 * @version 0.1.0
 */

#include "pipedream/cloud/aws_signer.h"
#include "pipedream/cloud/cloud_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pipedream {

using namespace cloud_utils;

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

// Trim and collapse runs of spaces.
auto canonical_header_value(const std::string& value) -> std::string {
    std::string out;
    bool pending_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

auto canonical_headers(const std::map<std::string, std::string>& headers)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> sorted;
    for (const auto& [k, v] : headers) {
        auto name = to_lower(k);
        if (name == "authorization") {
            continue;
        }
        sorted[name] = canonical_header_value(v);
    }
    return sorted;
}

}  // namespace

aws_signer::aws_signer(aws_credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials)),
      region_(std::move(region)),
      service_(std::move(service)) {}

auto aws_signer::canonical_query_string(const std::map<std::string, std::string>& query)
    -> std::string {
    std::map<std::string, std::string> encoded;
    for (const auto& [k, v] : query) {
        encoded[url_encode(k)] = url_encode(v);
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [k, v] : encoded) {
        if (!first) oss << "&";
        oss << k << "=" << v;
        first = false;
    }
    return oss.str();
}

auto aws_signer::signed_headers(const std::map<std::string, std::string>& headers)
    -> std::string {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [k, v] : canonical_headers(headers)) {
        if (!first) oss << ";";
        oss << k;
        first = false;
    }
    return oss.str();
}

auto aws_signer::canonical_request(const std::string& method,
                                   const std::string& canonical_uri,
                                   const std::map<std::string, std::string>& query,
                                   const std::map<std::string, std::string>& headers,
                                   const std::string& payload_hash) -> std::string {
    std::ostringstream canonical;
    canonical << method << "\n";
    canonical << (canonical_uri.empty() ? "/" : canonical_uri) << "\n";
    canonical << canonical_query_string(query) << "\n";
    for (const auto& [k, v] : canonical_headers(headers)) {
        canonical << k << ":" << v << "\n";
    }
    canonical << "\n";
    canonical << signed_headers(headers) << "\n";
    canonical << payload_hash;
    return canonical.str();
}

auto aws_signer::credential_scope(const std::string& date_stamp) const -> std::string {
    return date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";
}

auto aws_signer::signing_key(const std::string& date_stamp) const -> std::vector<uint8_t> {
    auto k_date = hmac_sha256("AWS4" + credentials_.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    return hmac_sha256(k_service, "aws4_request");
}

auto aws_signer::signature(const std::string& method,
                           const std::string& canonical_uri,
                           const std::map<std::string, std::string>& query,
                           const std::map<std::string, std::string>& headers,
                           const std::string& payload_hash,
                           const std::string& amz_date) const -> std::string {
    auto date_stamp = amz_date.substr(0, 8);
    auto request = canonical_request(method, canonical_uri, query, headers, payload_hash);

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << credential_scope(date_stamp) << "\n";
    string_to_sign << bytes_to_hex(sha256(request));

    return bytes_to_hex(hmac_sha256(signing_key(date_stamp), string_to_sign.str()));
}

void aws_signer::authorize(const std::string& method,
                           const std::string& canonical_uri,
                           const std::map<std::string, std::string>& query,
                           std::map<std::string, std::string>& headers,
                           const std::string& payload_hash,
                           const std::string& amz_date) const {
    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = payload_hash;
    if (credentials_.session_token) {
        headers["x-amz-security-token"] = *credentials_.session_token;
    }

    auto sig = signature(method, canonical_uri, query, headers, payload_hash, amz_date);

    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << credentials_.access_key_id << "/"
                << credential_scope(amz_date.substr(0, 8)) << ", ";
    auth_header << "SignedHeaders=" << signed_headers(headers) << ", ";
    auth_header << "Signature=" << sig;

    headers["Authorization"] = auth_header.str();
}

}  // namespace pipedream
