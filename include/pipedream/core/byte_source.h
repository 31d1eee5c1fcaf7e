/**
 * @file byte_source.h
 * @brief Unseekable input streams consumed by an upload
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_BYTE_SOURCE_H
#define PIPEDREAM_CORE_BYTE_SOURCE_H

#include "types.h"

#include <cstddef>
#include <istream>
#include <memory>
#include <span>
#include <vector>

namespace pipedream {

/**
 * @brief Sequential source of bytes
 *
 * Implementations are read once from front to back. A read may return
 * fewer bytes than requested; zero bytes signals end of stream.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @param buffer Destination
     * @return Number of bytes read (0 at end of stream) or stream_read_error
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief byte_source over a std::istream
 *
 * Either borrows the stream (e.g. std::cin) or takes ownership of it.
 */
class istream_byte_source : public byte_source {
public:
    explicit istream_byte_source(std::istream& stream);
    explicit istream_byte_source(std::unique_ptr<std::istream> stream);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

private:
    std::unique_ptr<std::istream> owned_;
    std::istream* stream_;
};

/**
 * @brief byte_source over an in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    explicit memory_byte_source(std::vector<std::byte> data);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    [[nodiscard]] auto remaining() const noexcept -> std::size_t {
        return data_.size() - position_;
    }

private:
    std::vector<std::byte> data_;
    std::size_t position_ = 0;
};

/**
 * @brief byte_source over a POSIX file descriptor such as a pipe
 *
 * The descriptor is not closed unless ownership is requested.
 */
class file_descriptor_source : public byte_source {
public:
    explicit file_descriptor_source(int fd, bool take_ownership = false);
    ~file_descriptor_source() override;

    file_descriptor_source(const file_descriptor_source&) = delete;
    auto operator=(const file_descriptor_source&) -> file_descriptor_source& = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    /**
     * @brief Source reading standard input
     */
    [[nodiscard]] static auto standard_input() -> std::unique_ptr<file_descriptor_source>;

private:
    int fd_;
    bool owned_;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_BYTE_SOURCE_H
