/**
 * @file chunk_reader.cpp
 * @brief Implementation of chunk_reader
 */

#include "pipedream/core/chunk_reader.h"
#include "pipedream/core/logging.h"

namespace pipedream {

chunk_reader::chunk_reader(byte_source& source, std::size_t max_part_size)
    : source_(source), buffer_(max_part_size) {}

auto chunk_reader::next() -> result<std::span<const std::byte>> {
    if (buffer_.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "max part size must be greater than zero"}};
    }
    if (exhausted_) {
        return std::span<const std::byte>{};
    }

    std::size_t filled = 0;
    while (filled < buffer_.size()) {
        auto read_result = source_.read(std::span<std::byte>(buffer_).subspan(filled));
        if (!read_result) {
            exhausted_ = true;
            PD_LOG_ERROR(log_category::chunk,
                "Input read failed after " + std::to_string(bytes_read_ + filled) +
                " bytes: " + read_result.error().message);
            return unexpected{error{error_code::stream_read_error,
                read_result.error().message}};
        }
        if (read_result.value() == 0) {
            exhausted_ = true;
            break;
        }
        filled += read_result.value();
    }

    if (filled == 0) {
        return std::span<const std::byte>{};
    }

    bytes_read_ += filled;
    ++chunks_read_;
    PD_LOG_TRACE(log_category::chunk,
        "Read chunk " + std::to_string(chunks_read_) + " (" +
        std::to_string(filled) + " bytes)");
    return std::span<const std::byte>(buffer_.data(), filled);
}

}  // namespace pipedream
