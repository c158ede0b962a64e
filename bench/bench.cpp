/**
 * @file bench.cpp
 * @brief Performance benchmarks for epibits pairwise interaction search.
 *
 * Measures intersection throughput over synthetic episode collections for
 * regression testing during development.
 *
 * Usage:
 *   ./build/epibits_bench              # Run with default 10 iterations
 *   ./build/epibits_bench 100          # Run with custom iteration count
 */

#include <epibits/epibits.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <utility>
#include <vector>

using namespace epibits;

static constexpr int DEFAULT_ITERATIONS = 10;
static constexpr std::size_t NUM_EPISODES = 256;

/**
 * @brief One random episode (a run of set bits) per element.
 */
static EncodingCollection make_collection(std::size_t width, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::size_t> dis_start(1, width - 1);
    std::uniform_int_distribution<std::size_t> dis_len(1, width / 4 + 1);

    std::vector<BitVector> codes;
    codes.reserve(NUM_EPISODES);
    for (std::size_t i = 0; i < NUM_EPISODES; ++i) {
        BitVector code(width);
        std::size_t start = dis_start(gen);
        std::size_t len = dis_len(gen);
        for (std::size_t pos = start; pos < width && pos < start + len; ++pos) {
            code.set_bit(pos, 1);
        }
        codes.push_back(code);
    }
    return EncodingCollection::dense_wide(std::move(codes), width);
}

static void bench_intersection(const char* name, std::size_t width, std::size_t extra_bits,
                               int iterations) {
    EncodingCollection lhs = make_collection(width, 1U);
    EncodingCollection rhs = make_collection(width, 2U);

    std::size_t num_pairs = NUM_EPISODES * (NUM_EPISODES - 1) / 2;

    // Warmup run
    IntersectionResult result = lhs.intersection(rhs, extra_bits);

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        result = lhs.intersection(rhs, extra_bits);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_pair_ns = per_iter_us * 1000.0 / static_cast<double>(num_pairs);

    std::printf("%-20s %10.1f µs/iter  %8.2f ns/pair  (%zu pairs, %zu hits)\n",
                name, per_iter_us, per_pair_ns, num_pairs, result.keys.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("epibits Benchmarks (C++ Implementation)\n");
    std::printf("=======================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Episodes per collection: %zu\n\n", NUM_EPISODES);

    std::printf("%-20s %16s  %14s  %s\n", "Test", "Time", "Per-Pair", "Pairs");
    std::printf("%-20s %16s  %14s  %s\n", "----", "----", "--------", "-----");

    std::printf("\nIntersection:\n");
    bench_intersection("32 bits, pe=0", 32, 0, iterations);
    bench_intersection("32 bits, pe=7", 32, 7, iterations);
    bench_intersection("365 bits, pe=30", 365, 30, iterations);
    bench_intersection("1024 bits, pe=90", 1024, 90, iterations);

    return 0;
}
