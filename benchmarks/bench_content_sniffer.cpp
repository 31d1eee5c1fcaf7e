/**
 * @file bench_content_sniffer.cpp
 * @brief Benchmarks for content type detection on the first part
 */

#include <benchmark/benchmark.h>

#include <pipedream/core/content_sniffer.h>

#include "utils/benchmark_helpers.h"

namespace pipedream::benchmark {

/**
 * @brief Benchmark for sniffing binary data
 */
static void BM_ContentSniffer_Binary(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto type = detect_content_type(data);
        ::benchmark::DoNotOptimize(type);
    }
}

/**
 * @brief Benchmark for sniffing plain text
 */
static void BM_ContentSniffer_Text(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_text_data(size, 42);

    for (auto _ : state) {
        auto type = detect_content_type(data);
        ::benchmark::DoNotOptimize(type);
    }
}

BENCHMARK(BM_ContentSniffer_Binary)->Arg(512)->Arg(static_cast<int64_t>(sizes::min_part));
BENCHMARK(BM_ContentSniffer_Text)->Arg(512)->Arg(static_cast<int64_t>(sizes::min_part));

}  // namespace pipedream::benchmark
