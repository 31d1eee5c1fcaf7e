/**
 * @file multipart_backend.h
 * @brief Abstract object-storage capability used by the upload core
 * @version 0.1.0
 *
 * The upload orchestration only needs the four multipart calls below.
 * s3_multipart_backend implements them against S3-compatible services;
 * tests substitute scripted implementations.
 */

#ifndef PIPEDREAM_CLOUD_MULTIPART_BACKEND_H
#define PIPEDREAM_CLOUD_MULTIPART_BACKEND_H

#include "pipedream/core/types.h"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace pipedream {

/**
 * @brief Multipart upload protocol of an object store
 *
 * Implementations must be usable from the background upload task.
 */
class multipart_backend {
public:
    virtual ~multipart_backend() = default;

    /**
     * @brief Open a multipart upload
     * @param bucket Destination bucket
     * @param key Destination object key
     * @param content_type MIME type stored with the object
     * @return Remote upload id
     */
    [[nodiscard]] virtual auto initiate(
        const std::string& bucket,
        const std::string& key,
        const std::string& content_type) -> result<std::string> = 0;

    /**
     * @brief Upload one numbered part
     * @param upload_id Id returned by initiate()
     * @param key Destination object key
     * @param part_number Part number (1-based)
     * @param data Part contents
     * @return ETag assigned to the part
     */
    [[nodiscard]] virtual auto upload_part(
        const std::string& upload_id,
        const std::string& key,
        int part_number,
        std::span<const std::byte> data) -> result<std::string> = 0;

    /**
     * @brief Combine the uploaded parts into the final object
     * @param parts Parts sorted by ascending part number
     */
    [[nodiscard]] virtual auto complete_upload(
        const std::string& upload_id,
        const std::string& key,
        const std::vector<completed_part>& parts) -> result<upload_result> = 0;

    /**
     * @brief Discard the upload and any parts stored for it
     */
    [[nodiscard]] virtual auto abort_upload(
        const std::string& upload_id,
        const std::string& key) -> result<void> = 0;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CLOUD_MULTIPART_BACKEND_H
