/**
 * @file multipart_session.h
 * @brief State of one remote multipart upload
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_MULTIPART_SESSION_H
#define PIPEDREAM_CORE_MULTIPART_SESSION_H

#include "types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pipedream {

/**
 * @brief Lifecycle of a multipart session
 *
 * uninitialized -> active -> completing -> done | failed
 * active | completing -> aborting -> failed
 * uninitialized -> failed (nothing to clean up remotely)
 */
enum class session_state {
    uninitialized,
    active,
    completing,
    aborting,
    done,
    failed,
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::uninitialized: return "uninitialized";
        case session_state::active: return "active";
        case session_state::completing: return "completing";
        case session_state::aborting: return "aborting";
        case session_state::done: return "done";
        case session_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Check whether a state transition is allowed
 */
[[nodiscard]] constexpr auto is_valid_transition(session_state from, session_state to) -> bool {
    switch (from) {
        case session_state::uninitialized:
            return to == session_state::active || to == session_state::failed;
        case session_state::active:
            return to == session_state::completing || to == session_state::aborting;
        case session_state::completing:
            return to == session_state::done || to == session_state::failed ||
                   to == session_state::aborting;
        case session_state::aborting:
            return to == session_state::failed;
        case session_state::done:
        case session_state::failed:
            return false;
        default:
            return false;
    }
}

/**
 * @brief Remote identity and accumulated parts of one upload
 *
 * The part list is append-only and numbered from 1 without gaps, so it is
 * always sorted as the backend's completion call requires.
 */
class multipart_session {
public:
    multipart_session(std::string bucket, std::string key);

    /**
     * @brief Store the remote upload id and enter the active state
     */
    [[nodiscard]] auto begin(std::string upload_id) -> result<void>;

    /**
     * @brief Append an uploaded part
     *
     * The part number must equal next_part_number().
     */
    [[nodiscard]] auto record_part(completed_part part) -> result<void>;

    [[nodiscard]] auto transition_to(session_state next) -> result<void>;

    /**
     * @brief Enter the failed state from any state other than done
     */
    void mark_failed() noexcept;

    [[nodiscard]] auto bucket() const -> const std::string& { return bucket_; }
    [[nodiscard]] auto key() const -> const std::string& { return key_; }
    [[nodiscard]] auto upload_id() const -> const std::optional<std::string>& { return upload_id_; }
    [[nodiscard]] auto parts() const -> const std::vector<completed_part>& { return parts_; }
    [[nodiscard]] auto next_part_number() const noexcept -> int { return next_part_number_; }
    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto state() const noexcept -> session_state { return state_; }

    /**
     * @brief Whether a remote session exists
     */
    [[nodiscard]] auto is_initiated() const noexcept -> bool { return upload_id_.has_value(); }

private:
    std::string bucket_;
    std::string key_;
    std::optional<std::string> upload_id_;
    std::vector<completed_part> parts_;
    int next_part_number_ = 1;
    uint64_t total_bytes_ = 0;
    session_state state_ = session_state::uninitialized;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_MULTIPART_SESSION_H
