/**
 * @file chunk_reader.h
 * @brief Splits a byte_source into bounded upload parts
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_CHUNK_READER_H
#define PIPEDREAM_CORE_CHUNK_READER_H

#include "byte_source.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pipedream {

/**
 * @brief Lazy, single-pass sequence of chunks read from a byte_source
 *
 * Every chunk except the last holds exactly max_part_size bytes; short
 * reads from the source are accumulated until the buffer is full or the
 * source ends. Only one buffer of max_part_size bytes is kept alive.
 *
 * Usage:
 * @code
 * chunk_reader reader(source, 5 * megabyte);
 * while (true) {
 *     auto chunk = reader.next();
 *     if (!chunk) { handle(chunk.error()); break; }
 *     if (chunk.value().empty()) break;  // end of stream
 *     upload(chunk.value());
 * }
 * @endcode
 */
class chunk_reader {
public:
    chunk_reader(byte_source& source, std::size_t max_part_size);

    chunk_reader(const chunk_reader&) = delete;
    auto operator=(const chunk_reader&) -> chunk_reader& = delete;
    chunk_reader(chunk_reader&&) noexcept = default;
    auto operator=(chunk_reader&&) noexcept -> chunk_reader& = delete;

    /**
     * @brief Read the next chunk
     * @return View of the chunk, valid until the next call; empty at end of
     *         stream; stream_read_error if the source failed
     */
    [[nodiscard]] auto next() -> result<std::span<const std::byte>>;

    /**
     * @brief Whether next() may still produce data
     */
    [[nodiscard]] auto has_more() const noexcept -> bool { return !exhausted_; }

    [[nodiscard]] auto bytes_read() const noexcept -> uint64_t { return bytes_read_; }

    [[nodiscard]] auto chunks_read() const noexcept -> uint64_t { return chunks_read_; }

    [[nodiscard]] auto max_part_size() const noexcept -> std::size_t { return buffer_.size(); }

private:
    byte_source& source_;
    std::vector<std::byte> buffer_;
    uint64_t bytes_read_ = 0;
    uint64_t chunks_read_ = 0;
    bool exhausted_ = false;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_CHUNK_READER_H
