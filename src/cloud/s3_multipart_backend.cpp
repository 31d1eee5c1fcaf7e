/**
 * @file s3_multipart_backend.cpp
 * @brief S3 multipart REST protocol implementation
 * @version 0.1.0
 */

#include "pipedream/cloud/s3_multipart_backend.h"
#include "pipedream/cloud/cloud_http_client.h"
#include "pipedream/cloud/cloud_utils.h"
#include "pipedream/core/logging.h"

#include <algorithm>
#include <sstream>

namespace pipedream {

using namespace cloud_utils;

namespace {

auto unescape_quotes(std::string value) -> std::string {
    const std::string entity = "&quot;";
    std::size_t pos = 0;
    while ((pos = value.find(entity, pos)) != std::string::npos) {
        value.replace(pos, entity.size(), "\"");
        ++pos;
    }
    return value;
}

auto upload_query(const std::string& upload_id) -> std::map<std::string, std::string> {
    return {{"uploadId", upload_id}};
}

}  // namespace

s3_multipart_backend::s3_multipart_backend(upload_config config,
                                           std::shared_ptr<http_client_interface> client)
    : config_(std::move(config)),
      signer_(aws_credentials{config_.access_key, config_.secret_key, config_.session_token},
              config_.region),
      client_(std::move(client)) {}

// ============================================================================
// Addressing
// ============================================================================

auto s3_multipart_backend::host_for(const std::string& bucket) const -> std::string {
    if (config_.use_path_style) {
        return config_.endpoint_host();
    }
    return bucket + "." + config_.endpoint_host();
}

auto s3_multipart_backend::path_for(const std::string& bucket, const std::string& key) const
    -> std::string {
    if (config_.use_path_style) {
        return "/" + url_encode(bucket) + "/" + url_encode(key, false);
    }
    return "/" + url_encode(key, false);
}

auto s3_multipart_backend::object_url(const std::string& bucket, const std::string& key) const
    -> std::string {
    auto base = config_.endpoint_url();
    auto scheme = base.substr(0, base.find("://"));
    return scheme + "://" + host_for(bucket) + path_for(bucket, key);
}

auto s3_multipart_backend::build_complete_xml(const std::vector<completed_part>& parts)
    -> std::string {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";

    for (const auto& part : parts) {
        xml << "  <Part>\n";
        xml << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
        xml << "    <ETag>" << xml_escape(part.etag) << "</ETag>\n";
        xml << "  </Part>\n";
    }

    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

// ============================================================================
// Request plumbing
// ============================================================================

auto s3_multipart_backend::sign(const std::string& method,
                                const std::string& bucket,
                                const std::string& key,
                                const std::map<std::string, std::string>& query,
                                std::map<std::string, std::string> headers,
                                const std::string& payload_hash) const -> signed_request {
    headers["host"] = host_for(bucket);
    signer_.authorize(method, path_for(bucket, key), query, headers, payload_hash,
                      get_iso8601_time());

    signed_request request;
    request.url = object_url(bucket, key);
    auto query_string = aws_signer::canonical_query_string(query);
    if (!query_string.empty()) {
        request.url += "?" + query_string;
    }
    request.headers = std::move(headers);
    return request;
}

auto s3_multipart_backend::check_response(result<http_response_base> response,
                                          const std::string& operation) const
    -> result<http_response_base> {
    if (!response) {
        PD_LOG_WARN(log_category::backend, operation + ": " + response.error().message);
        return unexpected{error{response.error().code,
            operation + ": " + response.error().message}};
    }

    auto body = response.value().get_body_string();
    bool error_document = body.find("<Error>") != std::string::npos;
    if (response.value().is_success() && !error_document) {
        return response;
    }

    std::ostringstream msg;
    msg << operation << " failed with HTTP " << response.value().status_code;
    auto code = extract_xml_element(body, "Code");
    auto message = extract_xml_element(body, "Message");
    if (code) {
        msg << " " << *code;
    }
    if (message) {
        msg << ": " << *message;
    }

    PD_LOG_WARN(log_category::backend, msg.str());
    return unexpected{error{error_code::http_status_error, msg.str()}};
}

// ============================================================================
// Multipart protocol
// ============================================================================

auto s3_multipart_backend::initiate(const std::string& bucket,
                                    const std::string& key,
                                    const std::string& content_type) -> result<std::string> {
    std::map<std::string, std::string> query{{"uploads", ""}};
    auto request = sign("POST", bucket, key, query, {{"content-type", content_type}},
                        bytes_to_hex(sha256("")));

    PD_LOG_DEBUG(log_category::backend, "POST " + request.url);
    auto response = check_response(client_->post(request.url, "", request.headers),
                                   "initiate multipart upload");
    if (!response) {
        return unexpected{response.error()};
    }

    auto upload_id = extract_xml_element(response.value().get_body_string(), "UploadId");
    if (!upload_id || upload_id->empty()) {
        return unexpected{error{error_code::response_parse_error,
            "initiate multipart upload: no UploadId in response"}};
    }
    return *upload_id;
}

auto s3_multipart_backend::upload_part(const std::string& upload_id,
                                       const std::string& key,
                                       int part_number,
                                       std::span<const std::byte> data) -> result<std::string> {
    std::map<std::string, std::string> query{
        {"partNumber", std::to_string(part_number)},
        {"uploadId", upload_id}};
    auto request = sign("PUT", config_.bucket, key, query, {},
                        bytes_to_hex(sha256_bytes(data)));

    std::vector<uint8_t> body(data.size());
    std::transform(data.begin(), data.end(), body.begin(),
                   [](std::byte b) { return static_cast<uint8_t>(b); });

    PD_LOG_DEBUG(log_category::backend,
        "PUT " + request.url + " (" + std::to_string(body.size()) + " bytes)");
    auto response = check_response(client_->put(request.url, body, request.headers),
                                   "upload part " + std::to_string(part_number));
    if (!response) {
        return unexpected{response.error()};
    }

    auto etag = response.value().get_header("ETag");
    if (!etag || etag->empty()) {
        return unexpected{error{error_code::missing_etag,
            "upload part " + std::to_string(part_number) + ": no ETag in response"}};
    }
    return *etag;
}

auto s3_multipart_backend::complete_upload(const std::string& upload_id,
                                           const std::string& key,
                                           const std::vector<completed_part>& parts)
    -> result<upload_result> {
    auto xml_body = build_complete_xml(parts);
    auto request = sign("POST", config_.bucket, key, upload_query(upload_id),
                        {{"content-type", "application/xml"}},
                        bytes_to_hex(sha256(xml_body)));

    PD_LOG_DEBUG(log_category::backend, "POST " + request.url);
    auto response = check_response(client_->post(request.url, xml_body, request.headers),
                                   "complete multipart upload");
    if (!response) {
        return unexpected{response.error()};
    }

    auto body = response.value().get_body_string();
    if (body.find("<CompleteMultipartUploadResult") == std::string::npos) {
        return unexpected{error{error_code::response_parse_error,
            "complete multipart upload: unexpected response document"}};
    }

    upload_result result;
    result.location = extract_xml_element(body, "Location").value_or(object_url(config_.bucket, key));
    result.bucket = extract_xml_element(body, "Bucket").value_or(config_.bucket);
    result.key = extract_xml_element(body, "Key").value_or(key);
    result.etag = unescape_quotes(extract_xml_element(body, "ETag").value_or(""));
    result.upload_id = upload_id;
    return result;
}

auto s3_multipart_backend::abort_upload(const std::string& upload_id,
                                        const std::string& key) -> result<void> {
    auto request = sign("DELETE", config_.bucket, key, upload_query(upload_id), {},
                        bytes_to_hex(sha256("")));

    PD_LOG_DEBUG(log_category::backend, "DELETE " + request.url);
    auto response = check_response(client_->del(request.url, request.headers),
                                   "abort multipart upload");
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_s3_multipart_backend(const upload_config& config)
    -> std::shared_ptr<multipart_backend> {
    get_logger().initialize();
    upload_config effective = config;
    effective.apply_defaults();
    auto client = make_cloud_http_client(effective.request_timeout);
    return std::make_shared<s3_multipart_backend>(std::move(effective), std::move(client));
}

}  // namespace pipedream
