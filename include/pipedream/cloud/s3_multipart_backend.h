/**
 * @file s3_multipart_backend.h
 * @brief multipart_backend for Amazon S3 and S3-compatible services
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CLOUD_S3_MULTIPART_BACKEND_H
#define PIPEDREAM_CLOUD_S3_MULTIPART_BACKEND_H

#include "aws_signer.h"
#include "http_client.h"
#include "multipart_backend.h"
#include "pipedream/core/upload_config.h"

#include <map>
#include <memory>
#include <string>

namespace pipedream {

/**
 * @brief Speaks the S3 multipart REST protocol
 *
 * Requests are signed with SigV4 and sent through an http_client_interface.
 * Non-2xx responses, and 200 responses carrying an <Error> document, are
 * turned into errors holding S3's Code and Message. Requests are never
 * retried here.
 */
class s3_multipart_backend : public multipart_backend {
public:
    /**
     * @param config Upload settings (defaults must already be applied)
     * @param client Transport for the signed requests
     */
    s3_multipart_backend(upload_config config,
                         std::shared_ptr<http_client_interface> client);

    [[nodiscard]] auto initiate(
        const std::string& bucket,
        const std::string& key,
        const std::string& content_type) -> result<std::string> override;

    [[nodiscard]] auto upload_part(
        const std::string& upload_id,
        const std::string& key,
        int part_number,
        std::span<const std::byte> data) -> result<std::string> override;

    [[nodiscard]] auto complete_upload(
        const std::string& upload_id,
        const std::string& key,
        const std::vector<completed_part>& parts) -> result<upload_result> override;

    [[nodiscard]] auto abort_upload(
        const std::string& upload_id,
        const std::string& key) -> result<void> override;

    /**
     * @brief Host the requests for @p bucket are sent to
     */
    [[nodiscard]] auto host_for(const std::string& bucket) const -> std::string;

    /**
     * @brief URI-encoded request path for @p key in @p bucket
     */
    [[nodiscard]] auto path_for(const std::string& bucket, const std::string& key) const
        -> std::string;

    /**
     * @brief Object URL without query string
     */
    [[nodiscard]] auto object_url(const std::string& bucket, const std::string& key) const
        -> std::string;

    /**
     * @brief CompleteMultipartUpload request document
     */
    [[nodiscard]] static auto build_complete_xml(const std::vector<completed_part>& parts)
        -> std::string;

private:
    struct signed_request {
        std::string url;
        std::map<std::string, std::string> headers;
    };

    [[nodiscard]] auto sign(const std::string& method,
                            const std::string& bucket,
                            const std::string& key,
                            const std::map<std::string, std::string>& query,
                            std::map<std::string, std::string> headers,
                            const std::string& payload_hash) const -> signed_request;

    [[nodiscard]] auto check_response(result<http_response_base> response,
                                      const std::string& operation) const
        -> result<http_response_base>;

    upload_config config_;
    aws_signer signer_;
    std::shared_ptr<http_client_interface> client_;
};

/**
 * @brief Create an S3 backend using cloud_http_client
 */
[[nodiscard]] auto make_s3_multipart_backend(const upload_config& config)
    -> std::shared_ptr<multipart_backend>;

}  // namespace pipedream

#endif  // PIPEDREAM_CLOUD_S3_MULTIPART_BACKEND_H
