/**
 * @file multipart_upload.cpp
 * @brief Implementation of the multipart upload orchestration
 */

#include "pipedream/core/multipart_upload.h"
#include "pipedream/adapters/upload_executor.h"
#include "pipedream/cloud/multipart_backend.h"
#include "pipedream/cloud/s3_multipart_backend.h"
#include "pipedream/core/chunk_reader.h"
#include "pipedream/core/content_sniffer.h"
#include "pipedream/core/logging.h"
#include "pipedream/core/multipart_session.h"
#include "pipedream/core/part_uploader.h"
#include "pipedream/core/upload_finalizer.h"

#include <exception>
#include <functional>
#include <system_error>

namespace pipedream {

namespace {

auto validate(const upload_config& config, const std::string& key) -> result<void> {
    auto missing = config.missing_fields();
    if (key.empty()) {
        missing.emplace_back("key");
    }
    if (!missing.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "missing " + english_join(missing)}};
    }
    return config.validate();
}

auto abort_session(upload_finalizer& finalizer, multipart_session& session) -> result<void> {
    try {
        return finalizer.abort(session);
    } catch (const std::exception& e) {
        session.mark_failed();
        return unexpected{error{error_code::abort_failed, e.what()}};
    }
}

/**
 * @brief Read, initiate, upload and complete; returns after the terminal event
 */
void drive_upload(const upload_config& config,
                  const std::shared_ptr<multipart_backend>& backend,
                  byte_source& source,
                  multipart_session& session,
                  upload_finalizer& finalizer,
                  upload_log_context& ctx,
                  const std::function<void(const error&)>& fail,
                  const multipart_upload::event_sink& emit) {
    const auto& key = session.key();
    chunk_reader reader(source, config.max_part_size);
    part_uploader uploader(backend, config.max_retries,
                           [&emit](const retry_event& retry) { emit(retry); });

    PD_LOG_INFO_CTX(log_category::upload, "Starting multipart upload", ctx);

    while (true) {
        auto chunk = reader.next();
        if (!chunk) {
            fail(chunk.error());
            return;
        }

        auto data = chunk.value();
        if (data.empty()) {
            break;
        }

        // The remote session is opened lazily so the type can be sniffed
        // from real bytes.
        if (!session.is_initiated()) {
            auto content_type = config.content_type.value_or(detect_content_type(data));
            auto upload_id = backend->initiate(config.bucket, key, content_type);
            if (!upload_id) {
                session.mark_failed();
                ctx.error_message = upload_id.error().message;
                PD_LOG_ERROR_CTX(log_category::upload, "Could not initiate multipart upload", ctx);
                emit(error_event{error{error_code::initiate_failed,
                    "initiate multipart upload failed: " + upload_id.error().message},
                    std::nullopt});
                return;
            }

            auto begun = session.begin(upload_id.value());
            if (!begun) {
                fail(begun.error());
                return;
            }
            ctx.upload_id = upload_id.value();
            PD_LOG_INFO_CTX(log_category::upload,
                "Initiated multipart upload (" + content_type + ")", ctx);
        }

        const int part_number = session.next_part_number();
        auto part = uploader.upload(session, data, part_number);
        if (!part) {
            fail(part.error());
            return;
        }

        auto recorded = session.record_part(std::move(part.value()));
        if (!recorded) {
            fail(recorded.error());
            return;
        }

        ctx.part_number = part_number;
        ctx.bytes = data.size();
        ctx.total_bytes = session.total_bytes();
        PD_LOG_DEBUG_CTX(log_category::upload, "Part uploaded", ctx);
        emit(progress_event{part_number, data.size()});
    }

    if (!session.is_initiated()) {
        session.mark_failed();
        PD_LOG_WARN_CTX(log_category::upload, "Input stream contained no data", ctx);
        emit(error_event{error{error_code::empty_input, "input stream contained no data"},
                         std::nullopt});
        return;
    }

    auto completing = session.transition_to(session_state::completing);
    if (!completing) {
        fail(completing.error());
        return;
    }

    // Parts are stored server side at this point, so a failed completion
    // is reported without aborting.
    auto completed = finalizer.complete(session);
    if (!completed) {
        ctx.error_message = completed.error().message;
        PD_LOG_ERROR_CTX(log_category::upload, "Multipart upload failed", ctx);
        emit(error_event{completed.error(), std::nullopt});
        return;
    }

    emit(complete_event{session.total_bytes(), std::move(completed.value())});
}

/**
 * @brief Body of one upload; emits exactly one terminal event
 *
 * An exception from the source, the backend or an allocation is reported
 * as internal_error, and an initiated remote session is aborted first.
 */
void run_upload(const upload_config& config,
                const std::shared_ptr<multipart_backend>& backend,
                byte_source& source,
                const std::string& key,
                const multipart_upload::event_sink& emit) {
    multipart_session session(config.bucket, key);
    upload_finalizer finalizer(backend);

    upload_log_context ctx;
    ctx.key = key;

    // Abort the remote session (if any) and report the original cause.
    auto fail = [&](const error& cause) {
        error_event failure{cause, std::nullopt};
        auto aborted = abort_session(finalizer, session);
        if (!aborted) {
            failure.abort_error = aborted.error();
        }
        ctx.error_message = failure.message();
        PD_LOG_ERROR_CTX(log_category::upload, "Multipart upload failed", ctx);
        emit(failure);
    };

    try {
        drive_upload(config, backend, source, session, finalizer, ctx, fail, emit);
    } catch (const std::exception& e) {
        auto state = session.state();
        if (state == session_state::done || state == session_state::failed) {
            // The terminal event has already been delivered.
            PD_LOG_ERROR(log_category::upload,
                std::string("Exception after upload finished: ") + e.what());
            return;
        }
        PD_LOG_ERROR(log_category::upload,
            std::string("Unexpected exception during upload: ") + e.what());
        fail(error{error_code::internal_error, e.what()});
    }
}

}  // namespace

multipart_upload::multipart_upload(upload_config config,
                                   std::shared_ptr<multipart_backend> backend,
                                   std::shared_ptr<adapters::upload_executor_interface> executor,
                                   std::size_t channel_capacity)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      executor_(executor ? std::move(executor) : adapters::upload_executor_factory::shared()),
      channel_capacity_(channel_capacity) {
    get_logger().initialize();
    config_.apply_defaults();
}

multipart_upload::~multipart_upload() = default;

auto multipart_upload::validate_request(const std::string& key) const -> result<void> {
    auto valid = validate(config_, key);
    if (!valid) {
        return valid;
    }
    if (!backend_) {
        return unexpected{error{error_code::invalid_configuration, "no backend configured"}};
    }
    return {};
}

void multipart_upload::run(byte_source& source, const std::string& key, const event_sink& emit) {
    auto valid = validate_request(key);
    if (!valid) {
        PD_LOG_ERROR(log_category::upload, valid.error().message);
        emit(error_event{valid.error(), std::nullopt});
        return;
    }
    run_upload(config_, backend_, source, key, emit);
}

auto multipart_upload::send(std::unique_ptr<byte_source> source, std::string key)
    -> event_stream {
    auto channel = std::make_shared<event_channel>(channel_capacity_);

    auto valid = validate_request(key);
    if (valid && !source) {
        valid = unexpected{error{error_code::stream_read_error, "no input stream"}};
    }
    if (!valid) {
        PD_LOG_ERROR(log_category::upload, valid.error().message);
        channel->send(error_event{valid.error(), std::nullopt});
        return event_stream(std::move(channel), std::future<void>{});
    }

    std::shared_ptr<byte_source> owned_source(std::move(source));
    auto task = [config = config_, backend = backend_, channel, owned_source,
                 key = std::move(key)]() {
        run_upload(config, backend, *owned_source, key,
                   [&channel](const upload_event& event) { channel->send(event); });
    };

    try {
        return event_stream(channel, executor_->submit(std::move(task)));
    } catch (const std::system_error& e) {
        PD_LOG_ERROR(log_category::upload,
            std::string("Could not start upload task: ") + e.what());
        channel->send(error_event{error{error_code::internal_error, e.what()}, std::nullopt});
        return event_stream(std::move(channel), std::future<void>{});
    }
}

auto send(upload_config config, std::unique_ptr<byte_source> source, std::string key)
    -> event_stream {
    config.apply_defaults();
    auto backend = make_s3_multipart_backend(config);
    multipart_upload upload(std::move(config), std::move(backend));
    return upload.send(std::move(source), std::move(key));
}

}  // namespace pipedream
