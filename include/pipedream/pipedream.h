/**
 * @file pipedream.h
 * @brief Main header for the pipedream library
 * @version 0.1.0
 *
 * Include this header to stream data of unknown length into S3-compatible
 * object storage as a multipart upload.
 *
 * @code
 * #include <pipedream/pipedream.h>
 *
 * using namespace pipedream;
 *
 * upload_config config;
 * config.access_key = "AKID";
 * config.secret_key = "secret";
 * config.bucket = "backups";
 *
 * auto events = send(config, file_descriptor_source::standard_input(), "dump.rdb");
 * for (const auto& event : events.drain()) {
 *     // progress, retry, then complete or error
 * }
 * @endcode
 */

#ifndef PIPEDREAM_PIPEDREAM_H
#define PIPEDREAM_PIPEDREAM_H

#include <string>

// Core types
#include "pipedream/core/types.h"
#include "pipedream/core/upload_config.h"
#include "pipedream/core/upload_events.h"
#include "pipedream/core/byte_source.h"
#include "pipedream/core/event_channel.h"
#include "pipedream/core/multipart_upload.h"

// Backends
#include "pipedream/cloud/multipart_backend.h"
#include "pipedream/cloud/s3_multipart_backend.h"

// Adapters
#include "pipedream/adapters/upload_executor.h"

namespace pipedream {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace pipedream

#endif  // PIPEDREAM_PIPEDREAM_H
