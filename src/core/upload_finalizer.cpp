/**
 * @file upload_finalizer.cpp
 * @brief Implementation of upload_finalizer
 */

#include "pipedream/core/upload_finalizer.h"
#include "pipedream/cloud/multipart_backend.h"
#include "pipedream/core/logging.h"

#include <algorithm>
#include <string>

namespace pipedream {

upload_finalizer::upload_finalizer(std::shared_ptr<multipart_backend> backend)
    : backend_(std::move(backend)) {}

auto upload_finalizer::complete(multipart_session& session) -> result<upload_result> {
    if (session.state() != session_state::completing) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("cannot complete a session that is ") + to_string(session.state())}};
    }

    const auto& parts = session.parts();
    auto out_of_order = std::adjacent_find(parts.begin(), parts.end(),
        [](const completed_part& a, const completed_part& b) {
            return a.part_number >= b.part_number;
        });
    if (parts.empty() || out_of_order != parts.end()) {
        session.mark_failed();
        return unexpected{error{error_code::internal_error,
            parts.empty() ? "no parts to complete" : "parts are not in ascending order"}};
    }

    auto completed = backend_->complete_upload(*session.upload_id(), session.key(), parts);
    if (!completed) {
        session.mark_failed();
        return unexpected{error{error_code::completion_failed,
            "complete multipart upload failed: " + completed.error().message}};
    }

    auto done = session.transition_to(session_state::done);
    if (!done) {
        return unexpected{done.error()};
    }

    upload_log_context ctx;
    ctx.upload_id = *session.upload_id();
    ctx.key = session.key();
    ctx.total_bytes = session.total_bytes();
    PD_LOG_INFO_CTX(log_category::session, "Multipart upload completed", ctx);

    return completed;
}

auto upload_finalizer::abort(multipart_session& session) -> result<void> {
    if (!session.is_initiated()) {
        session.mark_failed();
        return {};
    }

    auto aborting = session.transition_to(session_state::aborting);
    if (!aborting) {
        return aborting;
    }

    upload_log_context ctx;
    ctx.upload_id = *session.upload_id();
    ctx.key = session.key();
    ctx.total_bytes = session.total_bytes();
    const auto stored = " (" + std::to_string(session.parts().size()) + " parts stored)";

    auto aborted = backend_->abort_upload(*session.upload_id(), session.key());
    session.mark_failed();

    if (!aborted) {
        ctx.error_message = aborted.error().message;
        PD_LOG_ERROR_CTX(log_category::session,
            "Abort failed, upload may be left dangling" + stored, ctx);
        return unexpected{error{error_code::abort_failed, aborted.error().message}};
    }

    PD_LOG_WARN_CTX(log_category::session, "Multipart upload aborted" + stored, ctx);
    return {};
}

}  // namespace pipedream
