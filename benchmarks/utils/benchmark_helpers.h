/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef PIPEDREAM_BENCHMARKS_BENCHMARK_HELPERS_H
#define PIPEDREAM_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace pipedream::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate plain text data
     * @param size Approximate size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of text-like bytes
     */
    static auto generate_text_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

// Common sizes for benchmarks
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_stream = 1 * MB;
constexpr std::size_t medium_stream = 16 * MB;
constexpr std::size_t large_stream = 64 * MB;

// Part sizes for testing
constexpr std::size_t min_part = 5 * MB;
constexpr std::size_t large_part = 16 * MB;

// Read sizes a pipe typically delivers
constexpr std::size_t pipe_read = 64 * KB;
}  // namespace sizes

}  // namespace pipedream::benchmark

#endif  // PIPEDREAM_BENCHMARKS_BENCHMARK_HELPERS_H
