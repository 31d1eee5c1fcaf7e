/**
 * @file bench_chunk_reader.cpp
 * @brief Benchmarks for splitting a byte stream into parts
 */

#include <benchmark/benchmark.h>

#include <pipedream/core/byte_source.h>
#include <pipedream/core/chunk_reader.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <cstring>

namespace pipedream::benchmark {

namespace {

/**
 * @brief Source that never returns more than a fixed number of bytes per read
 */
class short_read_source : public byte_source {
public:
    short_read_source(const std::vector<std::byte>& data, std::size_t read_size)
        : data_(data), read_size_(read_size) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto n = std::min({buffer.size(), read_size_, data_.size() - offset_});
        std::memcpy(buffer.data(), data_.data() + offset_, n);
        offset_ += n;
        return n;
    }

private:
    const std::vector<std::byte>& data_;
    std::size_t read_size_;
    std::size_t offset_ = 0;
};

}  // namespace

/**
 * @brief Benchmark for chunk_reader over an in-memory stream
 */
static void BM_ChunkReader_Memory(::benchmark::State& state) {
    const auto stream_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<std::size_t>(state.range(1));

    auto data = test_data_generator::generate_random_data(stream_size, 42);

    for (auto _ : state) {
        state.PauseTiming();
        memory_byte_source source(data);
        state.ResumeTiming();

        chunk_reader reader(source, part_size);
        while (true) {
            auto chunk = reader.next();
            if (!chunk) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            if (chunk.value().empty()) {
                break;
            }
            ::benchmark::DoNotOptimize(chunk.value().data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((stream_size + part_size - 1) / part_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for chunk_reader filling parts from many short reads
 */
static void BM_ChunkReader_ShortReads(::benchmark::State& state) {
    const auto stream_size = static_cast<std::size_t>(state.range(0));
    const auto read_size = static_cast<std::size_t>(state.range(1));

    auto data = test_data_generator::generate_random_data(stream_size, 42);

    for (auto _ : state) {
        short_read_source source(data, read_size);
        chunk_reader reader(source, sizes::min_part);
        while (true) {
            auto chunk = reader.next();
            if (!chunk) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            if (chunk.value().empty()) {
                break;
            }
            ::benchmark::DoNotOptimize(chunk.value().data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream_size) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkReader_Memory)
    ->Args({static_cast<int64_t>(sizes::small_stream), static_cast<int64_t>(sizes::min_part)})
    ->Args({static_cast<int64_t>(sizes::medium_stream), static_cast<int64_t>(sizes::min_part)})
    ->Args({static_cast<int64_t>(sizes::large_stream), static_cast<int64_t>(sizes::min_part)})
    ->Args({static_cast<int64_t>(sizes::large_stream), static_cast<int64_t>(sizes::large_part)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkReader_ShortReads)
    ->Args({static_cast<int64_t>(sizes::medium_stream), 4096})
    ->Args({static_cast<int64_t>(sizes::medium_stream), static_cast<int64_t>(sizes::pipe_read)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace pipedream::benchmark
