/**
 * @file multipart_session.cpp
 * @brief Implementation of multipart_session
 */

#include "pipedream/core/multipart_session.h"
#include "pipedream/core/logging.h"

namespace pipedream {

multipart_session::multipart_session(std::string bucket, std::string key)
    : bucket_(std::move(bucket)), key_(std::move(key)) {}

auto multipart_session::transition_to(session_state next) -> result<void> {
    if (!is_valid_transition(state_, next)) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("cannot move session from ") + to_string(state_) +
            " to " + to_string(next)}};
    }

    PD_LOG_TRACE(log_category::session,
        std::string("Session ") + to_string(state_) + " -> " + to_string(next));
    state_ = next;
    return {};
}

void multipart_session::mark_failed() noexcept {
    if (state_ != session_state::done) {
        state_ = session_state::failed;
    }
}

auto multipart_session::begin(std::string upload_id) -> result<void> {
    if (upload_id.empty()) {
        return unexpected{error{error_code::initiate_failed,
            "backend returned an empty upload id"}};
    }
    if (upload_id_) {
        return unexpected{error{error_code::invalid_state_transition,
            "session already has an upload id"}};
    }

    auto transition = transition_to(session_state::active);
    if (!transition) {
        return transition;
    }
    upload_id_ = std::move(upload_id);
    return {};
}

auto multipart_session::record_part(completed_part part) -> result<void> {
    if (state_ != session_state::active) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("cannot record a part while ") + to_string(state_)}};
    }
    if (part.part_number != next_part_number_) {
        return unexpected{error{error_code::internal_error,
            "part " + std::to_string(part.part_number) + " recorded out of order, expected " +
            std::to_string(next_part_number_)}};
    }

    total_bytes_ += part.size;
    parts_.push_back(std::move(part));
    ++next_part_number_;
    return {};
}

}  // namespace pipedream
