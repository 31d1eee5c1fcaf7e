/**
 * @file test_byte_source.cpp
 * @brief Unit tests for byte_source implementations
 */

#include <gtest/gtest.h>

#include "pipedream/core/byte_source.h"
#include "pipedream/core/chunk_reader.h"

#include <array>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace pipedream::test {

TEST(MemoryByteSourceTest, ReadsInBufferSizedPieces) {
    std::vector<std::byte> data(10, std::byte{0x7f});
    memory_byte_source source(data);
    std::array<std::byte, 4> buffer{};

    auto first = source.read(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 4u);
    EXPECT_EQ(source.remaining(), 6u);

    ASSERT_EQ(source.read(buffer).value(), 4u);
    ASSERT_EQ(source.read(buffer).value(), 2u);
    ASSERT_EQ(source.read(buffer).value(), 0u);
    EXPECT_EQ(source.remaining(), 0u);
}

TEST(IstreamByteSourceTest, ReadsUntilEndOfStream) {
    std::istringstream input("abcdef");
    istream_byte_source source(input);
    std::array<std::byte, 4> buffer{};

    ASSERT_EQ(source.read(buffer).value(), 4u);
    EXPECT_EQ(buffer[0], std::byte{'a'});
    ASSERT_EQ(source.read(buffer).value(), 2u);
    EXPECT_EQ(buffer[1], std::byte{'f'});
    ASSERT_EQ(source.read(buffer).value(), 0u);
}

TEST(IstreamByteSourceTest, UnopenedFileIsReadError) {
    istream_byte_source source(std::make_unique<std::ifstream>("/nonexistent/dir/dump.rdb"));
    std::array<std::byte, 8> buffer{};

    auto read = source.read(buffer);

    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, error_code::stream_read_error);
}

TEST(IstreamByteSourceTest, UnopenedFileIsNotEndOfStreamForChunkReader) {
    istream_byte_source source(std::make_unique<std::ifstream>("/nonexistent/dir/dump.rdb"));
    chunk_reader reader(source, 16);

    auto chunk = reader.next();

    ASSERT_FALSE(chunk.has_value());
    EXPECT_EQ(chunk.error().code, error_code::stream_read_error);
}

TEST(IstreamByteSourceTest, EmptyStreamIsEndOfStream) {
    std::istringstream input("");
    istream_byte_source source(input);
    std::array<std::byte, 4> buffer{};

    auto read = source.read(buffer);

    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read.value(), 0u);
}

TEST(IstreamByteSourceTest, OwnsStream) {
    istream_byte_source source(std::make_unique<std::istringstream>("xyz"));
    std::array<std::byte, 8> buffer{};

    ASSERT_EQ(source.read(buffer).value(), 3u);
}

TEST(FileDescriptorSourceTest, ReadsFromPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    const char payload[] = "piped";
    ASSERT_EQ(::write(fds[1], payload, 5), 5);
    ::close(fds[1]);

    file_descriptor_source source(fds[0], true);
    std::array<std::byte, 16> buffer{};

    std::size_t total = 0;
    while (true) {
        auto n = source.read(buffer);
        ASSERT_TRUE(n.has_value());
        if (n.value() == 0) break;
        total += n.value();
    }
    EXPECT_EQ(total, 5u);
}

TEST(FileDescriptorSourceTest, InvalidDescriptorFails) {
    file_descriptor_source source(-1);
    std::array<std::byte, 4> buffer{};

    auto result = source.read(buffer);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::stream_read_error);
}

}  // namespace pipedream::test
