/**
 * @file part_uploader.cpp
 * @brief Implementation of part_uploader
 */

#include "pipedream/core/part_uploader.h"
#include "pipedream/cloud/multipart_backend.h"
#include "pipedream/core/logging.h"

namespace pipedream {

part_uploader::part_uploader(std::shared_ptr<multipart_backend> backend,
                             int max_attempts,
                             retry_callback on_retry)
    : backend_(std::move(backend)),
      max_attempts_(max_attempts < 1 ? 1 : max_attempts),
      on_retry_(std::move(on_retry)) {}

auto part_uploader::upload(const multipart_session& session,
                           std::span<const std::byte> data,
                           int part_number) -> result<completed_part> {
    if (!session.is_initiated()) {
        return unexpected{error{error_code::invalid_state_transition,
            "cannot upload part " + std::to_string(part_number) +
            " before the upload is initiated"}};
    }

    const auto& upload_id = *session.upload_id();
    struct error last_error;

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        auto etag = backend_->upload_part(upload_id, session.key(), part_number, data);
        if (etag) {
            completed_part part;
            part.part_number = part_number;
            part.etag = std::move(etag.value());
            part.size = data.size();
            return part;
        }

        last_error = etag.error();

        upload_log_context ctx;
        ctx.upload_id = upload_id;
        ctx.key = session.key();
        ctx.part_number = part_number;
        ctx.bytes = data.size();
        ctx.attempt = attempt;
        ctx.max_attempts = max_attempts_;
        ctx.error_message = last_error.message;

        if (attempt == max_attempts_) {
            PD_LOG_ERROR_CTX(log_category::part, "Part upload exhausted all attempts", ctx);
            break;
        }

        PD_LOG_WARN_CTX(log_category::part, "Part upload failed, retrying", ctx);
        if (on_retry_) {
            on_retry_(retry_event{part_number, attempt, max_attempts_});
        }
    }

    return unexpected{error{error_code::part_upload_failed,
        "part " + std::to_string(part_number) + " failed after " +
        std::to_string(max_attempts_) + " attempts: " + last_error.message}};
}

}  // namespace pipedream
