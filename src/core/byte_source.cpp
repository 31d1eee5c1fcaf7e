/**
 * @file byte_source.cpp
 * @brief Implementation of the byte_source adapters
 */

#include "pipedream/core/byte_source.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace pipedream {

// ============================================================================
// istream_byte_source
// ============================================================================

istream_byte_source::istream_byte_source(std::istream& stream)
    : stream_(&stream) {}

istream_byte_source::istream_byte_source(std::unique_ptr<std::istream> stream)
    : owned_(std::move(stream)), stream_(owned_.get()) {}

auto istream_byte_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (!stream_) {
        return unexpected{error{error_code::stream_read_error, "stream is null"}};
    }
    // A stream that never opened reports fail() without eof().
    if (stream_->fail() && !stream_->eof()) {
        return unexpected{error{error_code::stream_read_error,
            "input stream is not readable"}};
    }
    if (buffer.empty() || stream_->eof()) {
        return std::size_t{0};
    }

    stream_->read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
    auto count = static_cast<std::size_t>(stream_->gcount());

    if (stream_->bad() || (stream_->fail() && !stream_->eof())) {
        return unexpected{error{error_code::stream_read_error,
            "failed to read from input stream"}};
    }
    return count;
}

// ============================================================================
// memory_byte_source
// ============================================================================

memory_byte_source::memory_byte_source(std::vector<std::byte> data)
    : data_(std::move(data)) {}

auto memory_byte_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto count = std::min(buffer.size(), remaining());
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), count, buffer.begin());
    position_ += count;
    return count;
}

// ============================================================================
// file_descriptor_source
// ============================================================================

file_descriptor_source::file_descriptor_source(int fd, bool take_ownership)
    : fd_(fd), owned_(take_ownership) {}

file_descriptor_source::~file_descriptor_source() {
    if (owned_ && fd_ >= 0) {
#if defined(_WIN32)
        _close(fd_);
#else
        ::close(fd_);
#endif
    }
}

auto file_descriptor_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (fd_ < 0) {
        return unexpected{error{error_code::stream_read_error, "invalid file descriptor"}};
    }

    while (true) {
#if defined(_WIN32)
        auto n = _read(fd_, buffer.data(), static_cast<unsigned int>(buffer.size()));
#else
        auto n = ::read(fd_, buffer.data(), buffer.size());
#endif
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return unexpected{error{error_code::stream_read_error,
            std::string("read failed: ") + std::strerror(errno)}};
    }
}

auto file_descriptor_source::standard_input() -> std::unique_ptr<file_descriptor_source> {
    return std::make_unique<file_descriptor_source>(0);
}

}  // namespace pipedream
