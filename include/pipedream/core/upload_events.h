/**
 * @file upload_events.h
 * @brief Events reported while a multipart upload runs
 * @version 0.1.0
 *
 * An upload reports zero or more progress_event / retry_event values in
 * ascending part order, followed by exactly one terminal event:
 * complete_event or error_event.
 */

#ifndef PIPEDREAM_CORE_UPLOAD_EVENTS_H
#define PIPEDREAM_CORE_UPLOAD_EVENTS_H

#include "types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pipedream {

/**
 * @brief Discriminant of upload_event
 *
 * Values follow the alternative order of the variant.
 */
enum class upload_event_type {
    progress = 0,
    retry = 1,
    complete = 2,
    error = 3,
};

[[nodiscard]] constexpr auto to_string(upload_event_type type) -> const char* {
    switch (type) {
        case upload_event_type::progress: return "progress";
        case upload_event_type::retry: return "retry";
        case upload_event_type::complete: return "complete";
        case upload_event_type::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief A part was uploaded successfully
 */
struct progress_event {
    int part_number = 0;
    std::size_t bytes = 0;
};

/**
 * @brief A part attempt failed and the part is being retried
 */
struct retry_event {
    int part_number = 0;
    int retry_number = 0;
    int max_retries = 0;
};

/**
 * @brief The upload finished; no further events follow
 */
struct complete_event {
    uint64_t total_bytes = 0;
    upload_result result;
};

/**
 * @brief The upload failed; no further events follow
 */
struct error_event {
    /// The failure that ended the upload
    struct error cause;

    /// Set when cleaning up the remote session failed as well
    std::optional<struct error> abort_error;

    [[nodiscard]] auto code() const noexcept -> error_code { return cause.code; }

    /**
     * @brief Human-readable description, naming both causes if present
     */
    [[nodiscard]] auto message() const -> std::string {
        if (abort_error) {
            return "upload error: " + cause.message +
                   ", as well as an error aborting the upload: " + abort_error->message;
        }
        return cause.message;
    }
};

using upload_event = std::variant<progress_event, retry_event, complete_event, error_event>;

[[nodiscard]] inline auto event_type(const upload_event& event) noexcept -> upload_event_type {
    return static_cast<upload_event_type>(event.index());
}

/**
 * @brief Whether the event ends the upload
 */
[[nodiscard]] inline auto is_terminal(const upload_event& event) noexcept -> bool {
    auto type = event_type(event);
    return type == upload_event_type::complete || type == upload_event_type::error;
}

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_UPLOAD_EVENTS_H
