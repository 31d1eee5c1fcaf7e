/**
 * @file part_uploader.h
 * @brief Uploads one part with bounded immediate retry
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_PART_UPLOADER_H
#define PIPEDREAM_CORE_PART_UPLOADER_H

#include "multipart_session.h"
#include "types.h"
#include "upload_events.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <span>

namespace pipedream {

class multipart_backend;

/**
 * @brief Sends a chunk to the backend as a numbered part
 *
 * A part gets max_attempts attempts. Every failed attempt except the last
 * reports a retry_event and is retried immediately, without delay.
 */
class part_uploader {
public:
    using retry_callback = std::function<void(const retry_event&)>;

    part_uploader(std::shared_ptr<multipart_backend> backend,
                  int max_attempts,
                  retry_callback on_retry = nullptr);

    /**
     * @brief Upload @p data as part @p part_number of @p session
     * @return The accepted part, or part_upload_failed carrying the cause
     *         of the last attempt
     */
    [[nodiscard]] auto upload(const multipart_session& session,
                              std::span<const std::byte> data,
                              int part_number) -> result<completed_part>;

    [[nodiscard]] auto max_attempts() const noexcept -> int { return max_attempts_; }

private:
    std::shared_ptr<multipart_backend> backend_;
    int max_attempts_;
    retry_callback on_retry_;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_PART_UPLOADER_H
