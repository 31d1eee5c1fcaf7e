/**
 * @file aws_signer.h
 * @brief AWS Signature Version 4 request signing
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CLOUD_AWS_SIGNER_H
#define PIPEDREAM_CLOUD_AWS_SIGNER_H

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipedream {

/**
 * @brief Static access credentials
 */
struct aws_credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
};

/**
 * @brief Signs requests with AWS Signature Version 4
 *
 * Every header passed to authorize() is signed. Header names are
 * lowercased and values trimmed for the canonical form.
 *
 * @code
 * aws_signer signer(credentials, "us-east-1");
 * std::map<std::string, std::string> headers{{"host", host}};
 * signer.authorize("PUT", "/key", {{"partNumber", "1"}, {"uploadId", id}},
 *                  headers, payload_hash, cloud_utils::get_iso8601_time());
 * @endcode
 */
class aws_signer {
public:
    static constexpr const char* algorithm = "AWS4-HMAC-SHA256";

    aws_signer(aws_credentials credentials, std::string region,
               std::string service = "s3");

    /**
     * @brief Add x-amz-* and Authorization headers to @p headers
     * @param method HTTP method
     * @param canonical_uri URI-encoded path
     * @param query Unencoded query parameters
     * @param headers Headers to sign, extended in place
     * @param payload_hash Hex SHA256 of the body
     * @param amz_date Request time as YYYYMMDD'T'HHMMSS'Z'
     */
    void authorize(const std::string& method,
                   const std::string& canonical_uri,
                   const std::map<std::string, std::string>& query,
                   std::map<std::string, std::string>& headers,
                   const std::string& payload_hash,
                   const std::string& amz_date) const;

    /**
     * @brief Hex signature over already complete headers
     */
    [[nodiscard]] auto signature(const std::string& method,
                                 const std::string& canonical_uri,
                                 const std::map<std::string, std::string>& query,
                                 const std::map<std::string, std::string>& headers,
                                 const std::string& payload_hash,
                                 const std::string& amz_date) const -> std::string;

    [[nodiscard]] auto credential_scope(const std::string& date_stamp) const -> std::string;

    [[nodiscard]] auto signing_key(const std::string& date_stamp) const
        -> std::vector<uint8_t>;

    [[nodiscard]] static auto canonical_query_string(
        const std::map<std::string, std::string>& query) -> std::string;

    [[nodiscard]] static auto canonical_request(
        const std::string& method,
        const std::string& canonical_uri,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        const std::string& payload_hash) -> std::string;

    /**
     * @brief Semicolon separated, sorted, lowercase header names
     */
    [[nodiscard]] static auto signed_headers(
        const std::map<std::string, std::string>& headers) -> std::string;

    [[nodiscard]] auto region() const -> const std::string& { return region_; }

private:
    aws_credentials credentials_;
    std::string region_;
    std::string service_;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CLOUD_AWS_SIGNER_H
