/**
 * @file upload_finalizer.h
 * @brief Completes or aborts a remote multipart session
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_UPLOAD_FINALIZER_H
#define PIPEDREAM_CORE_UPLOAD_FINALIZER_H

#include "multipart_session.h"
#include "types.h"

#include <memory>

namespace pipedream {

class multipart_backend;

/**
 * @brief Ends a multipart session exactly once
 *
 * complete() expects a session in the completing state and leaves it done
 * or failed. abort() moves the session through aborting to failed, so a
 * second abort on the same session is rejected.
 */
class upload_finalizer {
public:
    explicit upload_finalizer(std::shared_ptr<multipart_backend> backend);

    /**
     * @brief Commit the recorded parts as the final object
     * @return Backend result, or completion_failed
     */
    [[nodiscard]] auto complete(multipart_session& session) -> result<upload_result>;

    /**
     * @brief Discard the remote session and its parts
     *
     * Succeeds without a backend call when no remote session was opened.
     * @return abort_failed if the backend rejects the request
     */
    [[nodiscard]] auto abort(multipart_session& session) -> result<void>;

private:
    std::shared_ptr<multipart_backend> backend_;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_UPLOAD_FINALIZER_H
