/**
 * @file  bench/bench_feature_extraction.cpp
 * @brief Google Benchmark suite for zone detection and feature extraction.
 *
 * Benchmarks
 * ----------
 *   BM_ZeroCrossingDetect      : single-pass segmentation, rows/second
 *   BM_ExtractSequential       : extract() per zone on one thread
 *   BM_ExtractAll/<workers>    : extract_all() on 1..8 workers
 *   BM_AnalyzerBatch/<series>  : run_batch() over independent series
 *
 * Build (CMake):
 *   cmake -DZONAL_BENCH=ON ..
 *   cmake --build build --target bench_feature_extraction
 *   ./build/bench_feature_extraction --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "zonal/analyzer.hpp"
#include "zonal/detection.hpp"
#include "zonal/features.hpp"

#include <cmath>
#include <cstddef>
#include <memory>
#include <numbers>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// `n` bars of a drifting cycle with roughly one zone every 40 rows.
static std::shared_ptr<const zonal::SampleTable> make_series(std::size_t n, double seed = 0.0) {
    std::vector<zonal::OHLCV> bars(n);
    std::vector<double> osc(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double x  = static_cast<double>(i);
        const double ph = 2.0 * std::numbers::pi * x / 80.0 + seed;
        const double px = 100.0 + 0.01 * x + 5.0 * std::sin(ph - 0.3);
        bars[i] = zonal::OHLCV{
            .timestamp = x,
            .open      = px,
            .high      = px + 0.5 + 0.2 * std::sin(3.1 * x),
            .low       = px - 0.5 - 0.2 * std::cos(2.3 * x),
            .close     = px,
            .volume    = 1e5 + 2e4 * std::cos(ph),
        };
        osc[i] = std::sin(ph) + 0.1 * std::sin(7.7 * x);
    }
    auto t = std::make_shared<zonal::SampleTable>(zonal::SampleTable::from_bars(bars));
    t->add_column("osc", osc);
    return t;
}

// ── Detection ──────────────────────────────────────────────────────────────────

static void BM_ZeroCrossingDetect(benchmark::State& state) {
    const auto table = make_series(static_cast<std::size_t>(state.range(0)));
    const zonal::ZeroCrossingDetector detector("osc");
    for (auto _ : state) {
        auto zones = detector.detect(table);
        benchmark::DoNotOptimize(zones.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ZeroCrossingDetect)->Arg(1'000)->Arg(10'000)->Arg(100'000);

// ── Extraction ─────────────────────────────────────────────────────────────────

static void BM_ExtractSequential(benchmark::State& state) {
    const auto zones = zonal::ZeroCrossingDetector("osc").detect(make_series(20'000));
    const zonal::ZoneFeatureExtractor extractor;
    for (auto _ : state) {
        for (const auto& z : zones) {
            auto f = extractor.extract(z);
            benchmark::DoNotOptimize(f);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(zones.size()));
}
BENCHMARK(BM_ExtractSequential);

static void BM_ExtractAll(benchmark::State& state) {
    const auto table = make_series(20'000);
    const zonal::ZeroCrossingDetector detector("osc");

    zonal::ExtractorConfig cfg;
    cfg.max_workers = static_cast<std::size_t>(state.range(0));
    const zonal::ZoneFeatureExtractor extractor(cfg);

    std::size_t zone_count = 0;
    for (auto _ : state) {
        state.PauseTiming();
        auto zones = detector.detect(table);  // fresh zones: features are write-once
        state.ResumeTiming();
        zone_count = extractor.extract_all(zones);
        benchmark::DoNotOptimize(zones.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(zone_count));
    state.counters["workers"] = static_cast<double>(extractor.worker_count(zone_count));
}
BENCHMARK(BM_ExtractAll)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

// ── Batch analysis ─────────────────────────────────────────────────────────────

static void BM_AnalyzerBatch(benchmark::State& state) {
    std::vector<std::shared_ptr<const zonal::SampleTable>> tables;
    for (int64_t s = 0; s < state.range(0); ++s) {
        tables.push_back(make_series(5'000, static_cast<double>(s)));
    }

    zonal::AnalyzerConfig cfg;
    cfg.detector.indicator_col = "osc";
    cfg.extractor.max_workers  = 1;
    const zonal::ZoneAnalyzer analyzer(cfg);

    for (auto _ : state) {
        auto results = analyzer.run_batch(tables);
        benchmark::DoNotOptimize(results.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AnalyzerBatch)->Arg(1)->Arg(4)->Arg(16)->UseRealTime();

BENCHMARK_MAIN();
