/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

namespace pipedream::benchmark {

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_text_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data;
    data.reserve(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const std::vector<std::string> words = {
        "the", "be", "to", "of", "and", "a", "in", "that", "have", "it",
        "for", "not", "on", "with", "as", "you", "do", "at", "this", "but",
        "backup", "dump", "bucket", "part", "stream", "upload", "object", "byte"
    };

    std::uniform_int_distribution<std::size_t> word_dis(0, words.size() - 1);
    std::uniform_int_distribution<int> space_dis(0, 10);

    while (data.size() < size) {
        const auto& word = words[word_dis(gen)];
        for (char c : word) {
            if (data.size() >= size) break;
            data.push_back(static_cast<std::byte>(c));
        }

        if (data.size() < size) {
            data.push_back(static_cast<std::byte>(space_dis(gen) == 0 ? '\n' : ' '));
        }
    }

    data.resize(size);
    return data;
}

}  // namespace pipedream::benchmark
