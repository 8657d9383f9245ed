/**
 * @file bench.cpp
 * @brief Performance benchmarks for UBJSON encoding.
 *
 * Measures encoding throughput on synthetic documents for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/ubjson-bench              # Run with default 100 iterations
 *   ./build/ubjson-bench 1000         # Run with custom iteration count
 */

#include <ubjson/ubjson.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace ubjson;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t RECORDS = 1000;

/**
 * @brief Array of small records mixing every scalar width.
 */
static Value make_records(std::size_t count) {
    Array records;
    records.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto n = static_cast<std::int64_t>(i);
        records.push_back(make_object({
            {"id", n},
            {"small", n % 100},
            {"medium", n * 300},
            {"large", n * 100000},
            {"wide", n * 10000000000LL},
            {"ratio", static_cast<double>(i) / 7.0},
            {"name", "record-" + std::to_string(i)},
            {"flag", (i % 2) == 0},
            {"missing", NULL_VALUE},
        }));
    }
    return Value(std::move(records));
}

static Value make_long_strings(std::size_t count) {
    Array strings;
    strings.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        strings.emplace_back(std::string(300 + (i % 200), 'x'));
    }
    return Value(std::move(strings));
}

static void bench_encode(const char* name, const Value& value, int iterations) {
    const Encoder& encoder = default_encoder();
    std::vector<std::uint8_t> output;

    // Warmup run
    if (encoder.encode(value, output) != Error::Ok) {
        std::printf("%-20s FAIL\n", name);
        return;
    }
    std::size_t encoded_size = output.size();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        output.clear();
        encoder.encode(value, output);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(encoded_size) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, encoded_size);
}

static void bench_stream(const char* name, std::int64_t count, int iterations) {
    const Encoder& encoder = default_encoder();
    std::size_t encoded_size = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        encoded_size = 0;
        ChunkStream stream = encoder.iterencode(Value(UnsizedArray::range(0, count)));
        Chunk chunk;
        while (stream.next(chunk)) {
            encoded_size += chunk.size();
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(encoded_size) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, encoded_size);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("UBJSON Encoder Benchmarks (C++ Implementation)\n");
    std::printf("==============================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %13s  %s\n", "Test", "Time", "Throughput", "Size");
    std::printf("%-20s %16s  %13s  %s\n", "----", "----", "----------", "----");

    Value records = make_records(RECORDS);
    Value strings = make_long_strings(RECORDS);

    bench_encode("records", records, iterations);
    bench_encode("long-strings", strings, iterations);
    bench_stream("unsized-range", static_cast<std::int64_t>(RECORDS) * 100, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
