/**
 * @file bench.cpp
 * @brief Performance benchmarks for bitgrid matrix operations.
 *
 * Measures throughput of the word-level scans and row transfers for
 * regression testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bitgrid_bench              # Run with default 100 iterations
 *   ./build/bitgrid_bench 1000         # Run with custom iteration count
 */

#include <bitgrid/bitgrid.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>

using namespace bitgrid;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t GRID_WIDTH = 1920;
static constexpr std::size_t GRID_HEIGHT = 1080;

// Sink for results so the optimizer keeps the loops
static volatile std::size_t g_sink = 0;

/**
 * @brief Fill a matrix with a sparse, repeatable pattern.
 */
static void fill_pattern(BitMatrix& matrix) {
    std::uint32_t state = 0x12345678U;
    for (std::size_t y = 0; y < matrix.height(); ++y) {
        for (std::size_t x = 0; x < matrix.width(); ++x) {
            // xorshift32
            state ^= state << 13;
            state ^= state >> 17;
            state ^= state << 5;
            if ((state & 0x3FU) == 0) {
                matrix.set(x, y);
            }
        }
    }
}

static void report(const char* name, std::chrono::high_resolution_clock::time_point start,
                   std::chrono::high_resolution_clock::time_point end, int iterations) {
    double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    double per_iter_us = (elapsed_ms * 1000.0) / iterations;
    double mpix_per_s = (static_cast<double>(GRID_WIDTH * GRID_HEIGHT) * iterations) /
                        (elapsed_ms * 1000.0);

    std::printf("%-22s %10.2f us/iter  %10.1f Mpix/s\n", name, per_iter_us, mpix_per_s);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iterations must be positive\n");
            return 1;
        }
    }

    BitMatrix matrix;
    Error result = BitMatrix::create(GRID_WIDTH, GRID_HEIGHT, matrix);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }
    fill_pattern(matrix);
    BitMatrix mask = matrix.clone();
    result = mask.rotate180();
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    std::printf("bitgrid %s benchmark: %zux%zu grid, %d iterations\n\n", version(), GRID_WIDTH,
                GRID_HEIGHT, iterations);

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        result = matrix.rotate180();
    }
    auto end = std::chrono::high_resolution_clock::now();
    report("rotate180", start, end, iterations);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: rotate180: %s\n", error_string(result));
        return 1;
    }

    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        result = matrix.xor_with(mask);
    }
    end = std::chrono::high_resolution_clock::now();
    report("xor_with", start, end, iterations);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: xor_with: %s\n", error_string(result));
        return 1;
    }

    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        Rectangle rect;
        if (matrix.get_enclosing_rectangle(rect)) {
            g_sink = g_sink + rect.width;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    report("get_enclosing_rect", start, end, iterations);

    BitArray row;
    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        for (std::size_t y = 0; y < GRID_HEIGHT; ++y) {
            const BitArray& scan = matrix.get_row(y, row);
            for (std::size_t x = scan.next_set(0); x < GRID_WIDTH; x = scan.next_set(x + 1)) {
                g_sink = g_sink + x;
            }
        }
    }
    end = std::chrono::high_resolution_clock::now();
    report("get_row + next_set", start, end, iterations);

    return 0;
}
