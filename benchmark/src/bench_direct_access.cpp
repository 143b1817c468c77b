/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file bench_direct_access.cpp
 * @brief Google Benchmark suite for CsvFile indexing, iteration and getLine(n).
 *
 * Benchmarks cover realistic access patterns:
 *   - buildIndex() scan cost
 *   - loadIndex() from a sidecar vs. scanning
 *   - Sequential iterator() baseline
 *   - Direct access: full sequential via getLine(i)
 *   - Random access: uniformly random row numbers
 *   - Jump: alternating near-start / near-end
 */

#include <benchmark/benchmark.h>
#include <csvidx/csvidx.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// ============================================================================
// Helpers
// ============================================================================

static const std::string BENCH_DIR = "csvidx_test_files/bench_direct_access";

static std::string filePath(size_t nRows) {
    return (fs::path(BENCH_DIR) / ("rows_" + std::to_string(nRows) + ".csv")).string();
}

static std::string ensureFile(size_t nRows) {
    const std::string path = filePath(nRows);
    if (fs::exists(path)) return path;  // Reuse if already written
    fs::create_directories(fs::path(path).parent_path());

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Bench: failed to create " + path);
    }
    out << "time,x,y,id,flag,label\n";
    for (size_t i = 0; i < nRows; ++i) {
        out << static_cast<double>(i) * 0.001 << ','
            << static_cast<float>(i) * 1.5f << ','
            << static_cast<float>(i) * -0.7f << ','
            << i << ','
            << ((i % 3 == 0) ? "true" : "") << ','
            << "row_" << i << '\n';
    }
    return path;
}

static std::string ensureIndex(size_t nRows) {
    const std::string path = ensureFile(nRows);
    const std::string idx = path + ".idx";
    if (!fs::exists(idx)) {
        csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
        csv.buildIndex();
        csv.saveIndex(idx);
    }
    return idx;
}

// ============================================================================
// Indexing
// ============================================================================

static void BM_BuildIndex(benchmark::State& state) {
    size_t nRows = static_cast<size_t>(state.range(0));
    const std::string path = ensureFile(nRows);

    for (auto _ : state) {
        csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
        csv.buildIndex();
        benchmark::DoNotOptimize(csv.lines().value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(nRows) * state.iterations());
    state.SetBytesProcessed(static_cast<int64_t>(fs::file_size(path)) * state.iterations());
}

static void BM_LoadIndex(benchmark::State& state) {
    size_t nRows = static_cast<size_t>(state.range(0));
    const std::string path = ensureFile(nRows);
    const std::string idx = ensureIndex(nRows);

    for (auto _ : state) {
        csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
        csv.loadIndex(idx);
        benchmark::DoNotOptimize(csv.lines().value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(nRows) * state.iterations());
}

// ============================================================================
// Baseline: sequential iteration over entire file
// ============================================================================

static void BM_Sequential_Iterator(benchmark::State& state) {
    size_t nRows = static_cast<size_t>(state.range(0));
    const std::string path = ensureFile(nRows);

    for (auto _ : state) {
        csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
        auto rows = csv.iterator();
        for (const auto& rec : *rows) {
            benchmark::DoNotOptimize(rec.cells.size());
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(nRows) * state.iterations());
}

// ============================================================================
// Direct access
// ============================================================================

static void BM_DirectAccess_FullSequential(benchmark::State& state) {
    size_t nRows = static_cast<size_t>(state.range(0));
    const std::string path = ensureFile(nRows);

    csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
    csv.loadIndex(ensureIndex(nRows));

    for (auto _ : state) {
        for (size_t i = 1; i <= nRows; ++i) {
            auto rec = csv.getLine(i);
            benchmark::DoNotOptimize(rec.index);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(nRows) * state.iterations());
}

static void BM_DirectAccess_Random(benchmark::State& state) {
    size_t nRows  = static_cast<size_t>(state.range(0));
    size_t nReads = static_cast<size_t>(state.range(1));
    const std::string path = ensureFile(nRows);

    csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
    csv.loadIndex(ensureIndex(nRows));

    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> dist(1, nRows);

    for (auto _ : state) {
        for (size_t i = 0; i < nReads; ++i) {
            auto rec = csv.getLine(dist(rng));
            benchmark::DoNotOptimize(rec.index);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(nReads) * state.iterations());
}

static void BM_DirectAccess_Jump(benchmark::State& state) {
    size_t nRows  = static_cast<size_t>(state.range(0));
    size_t nJumps = static_cast<size_t>(state.range(1));
    const std::string path = ensureFile(nRows);

    csvidx::CsvFile csv(path, csvidx::CsvFile::Options{',', true});
    csv.loadIndex(ensureIndex(nRows));

    for (auto _ : state) {
        for (size_t i = 0; i < nJumps; ++i) {
            auto front = csv.getLine(1 + i);
            auto back  = csv.getLine(nRows - i);
            benchmark::DoNotOptimize(front.index + back.index);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(2 * nJumps) * state.iterations());
}

// ============================================================================
// Registration
// ============================================================================

// Indexing                        (rows)
BENCHMARK(BM_BuildIndex)
    ->Arg(10000)->Arg(100000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_LoadIndex)
    ->Arg(10000)->Arg(100000)
    ->Unit(benchmark::kMicrosecond);

// Baseline: sequential iterator   (rows)
BENCHMARK(BM_Sequential_Iterator)
    ->Arg(10000)->Arg(100000)
    ->Unit(benchmark::kMicrosecond);

// Full sequential via getLine(i)  (rows)
BENCHMARK(BM_DirectAccess_FullSequential)
    ->Arg(10000)->Arg(100000)
    ->Unit(benchmark::kMicrosecond);

// Random                          (rows, reads)
BENCHMARK(BM_DirectAccess_Random)
    ->Args({100000, 100})->Args({100000, 1000})
    ->Unit(benchmark::kMicrosecond);

// Jump                            (rows, jumps)
BENCHMARK(BM_DirectAccess_Jump)
    ->Args({100000, 50})
    ->Unit(benchmark::kMicrosecond);

// ============================================================================
// Cleanup hook
// ============================================================================

static void cleanupBenchFiles() {
    if (fs::exists(BENCH_DIR)) {
        fs::remove_all(BENCH_DIR);
    }
}

// Use atexit for cleanup
static bool registered = (std::atexit(cleanupBenchFiles), true);

BENCHMARK_MAIN();
