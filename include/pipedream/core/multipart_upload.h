/**
 * @file multipart_upload.h
 * @brief Streams a byte_source into object storage as a multipart upload
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_MULTIPART_UPLOAD_H
#define PIPEDREAM_CORE_MULTIPART_UPLOAD_H

#include "byte_source.h"
#include "event_channel.h"
#include "types.h"
#include "upload_config.h"
#include "upload_events.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pipedream {

class multipart_backend;

namespace adapters {
class upload_executor_interface;
}

/**
 * @brief Drives one or more multipart uploads against a backend
 *
 * Each call to send() opens an independent remote session. Parts are read
 * and uploaded strictly one after another on a background task, and all
 * activity is reported through the returned event_stream:
 * progress and retry events in part order, then exactly one complete or
 * error event.
 *
 * @code
 * upload_config config;
 * config.access_key = std::getenv("ACCESS_KEY");
 * config.secret_key = std::getenv("SECRET_KEY");
 * config.bucket = "my-fave-bucket";
 *
 * multipart_upload upload(config, make_s3_multipart_backend(config));
 * auto events = upload.send(file_descriptor_source::standard_input(), "backups/dump.rdb");
 *
 * while (auto event = events.next()) {
 *     if (auto* done = std::get_if<complete_event>(&*event)) {
 *         std::cout << "uploaded " << done->total_bytes << " bytes\n";
 *     } else if (auto* failed = std::get_if<error_event>(&*event)) {
 *         std::cerr << failed->message() << "\n";
 *     }
 * }
 * @endcode
 */
class multipart_upload {
public:
    using event_sink = std::function<void(const upload_event&)>;

    /**
     * @brief Create an uploader
     * @param config Settings; zero-valued fields receive defaults
     * @param backend Storage backend
     * @param executor Runs upload tasks (upload_executor_factory::shared() if null)
     * @param channel_capacity Events buffered before the task blocks
     */
    multipart_upload(upload_config config,
                     std::shared_ptr<multipart_backend> backend,
                     std::shared_ptr<adapters::upload_executor_interface> executor = nullptr,
                     std::size_t channel_capacity = event_channel::default_capacity);

    ~multipart_upload();

    multipart_upload(const multipart_upload&) = delete;
    auto operator=(const multipart_upload&) -> multipart_upload& = delete;

    /**
     * @brief Upload @p source to @p key in the background
     *
     * Configuration problems are reported as an immediate error event
     * without any backend call.
     */
    [[nodiscard]] auto send(std::unique_ptr<byte_source> source, std::string key)
        -> event_stream;

    /**
     * @brief Upload on the calling thread, delivering events to @p emit
     *
     * Emits the same sequence send() would, ending with one terminal event.
     */
    void run(byte_source& source, const std::string& key, const event_sink& emit);

    [[nodiscard]] auto config() const -> const upload_config& { return config_; }

private:
    [[nodiscard]] auto validate_request(const std::string& key) const -> result<void>;

    upload_config config_;
    std::shared_ptr<multipart_backend> backend_;
    std::shared_ptr<adapters::upload_executor_interface> executor_;
    std::size_t channel_capacity_;
};

/**
 * @brief Upload @p source to @p key using the S3 backend built from @p config
 */
[[nodiscard]] auto send(upload_config config,
                        std::unique_ptr<byte_source> source,
                        std::string key) -> event_stream;

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_MULTIPART_UPLOAD_H
