/**
 * @file bench.cpp
 * @brief Performance benchmarks for the body decoder.
 *
 * Measures decoding throughput on synthetic bodies for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/palraw_bench              # Run with default 20 iterations
 *   ./build/palraw_bench 100          # Run with custom iteration count
 */

#include <palraw/palraw.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace palraw;

static constexpr int DEFAULT_ITERATIONS = 20;

/// One day at 20 Hz
static constexpr std::size_t NUM_GROUPS = 24U * 3600U * 20U;

/**
 * @brief Build a body of literal samples with a share of repeat groups.
 *
 * @param repeat_percent Percentage of groups that are run-length groups
 */
static std::vector<std::uint8_t> make_body(int repeat_percent) {
    std::mt19937 rng(12345U);
    std::uniform_int_distribution<int> axis(1, 254);
    std::uniform_int_distribution<int> percent(0, 99);
    std::uniform_int_distribution<int> run(1, 40);

    std::vector<std::uint8_t> body;
    body.reserve(NUM_GROUPS * GROUP_BYTES + 4U);

    for (std::size_t i = 0; i < NUM_GROUPS; ++i) {
        if (i > 0 && percent(rng) < repeat_percent) {
            body.push_back(0);
            body.push_back(0);
            body.push_back(static_cast<std::uint8_t>(run(rng)));
        } else {
            body.push_back(static_cast<std::uint8_t>(axis(rng)));
            body.push_back(static_cast<std::uint8_t>(axis(rng)));
            body.push_back(static_cast<std::uint8_t>(axis(rng)));
        }
    }

    body.insert(body.end(), std::begin(DATX_TAIL), std::end(DATX_TAIL));
    return body;
}

static void bench_decode(const char* name, int repeat_percent, int iterations) {
    const auto body = make_body(repeat_percent);
    std::vector<RawSample> samples;

    // Warmup run
    if (decode_body(body.data(), body.size(), 220, Layout::Datx, samples) != Error::Ok) {
        std::printf("%-20s FAIL\n", name);
        return;
    }
    const std::size_t rows = samples.size();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        decode_body(body.data(), body.size(), 220, Layout::Datx, samples);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ms = std::chrono::duration<double, std::milli>(end - start).count();
    double per_iter_ms = total_ms / static_cast<double>(iterations);
    double mb_per_s = (static_cast<double>(body.size()) / 1.0e6) / (per_iter_ms / 1000.0);
    double rows_per_s = static_cast<double>(rows) / (per_iter_ms / 1000.0);

    std::printf("%-20s %8.2f ms/iter  %8.1f MB/s  %10.3g rows/s  (%zu rows)\n", name,
                per_iter_ms, mb_per_s, rows_per_s, rows);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("palraw Body Decoder Benchmarks\n");
    std::printf("==============================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Groups:     %zu (%zu bytes)\n\n", NUM_GROUPS, NUM_GROUPS * GROUP_BYTES);

    std::printf("%-20s %14s  %13s  %16s  %s\n", "Test", "Time", "Throughput", "Rows", "Total");
    std::printf("%-20s %14s  %13s  %16s  %s\n", "----", "----", "----------", "----", "-----");

    bench_decode("literal", 0, iterations);
    bench_decode("10% repeats", 10, iterations);
    bench_decode("50% repeats", 50, iterations);

    return 0;
}
