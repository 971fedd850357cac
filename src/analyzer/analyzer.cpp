/// @file src/analyzer/analyzer.cpp
/// @brief ZoneAnalyzer: per-series pipeline and concurrent batches.

#include "zonal/analyzer.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "batch.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include <utility>

namespace zonal {

ZoneAnalyzer::ZoneAnalyzer(AnalyzerConfig config)
    : config_(std::move(config))
    , detector_(make_detector(config_.detector))
    , extractor_(config_.extractor) {}

ZoneAnalysis ZoneAnalyzer::run(std::shared_ptr<const SampleTable> table,
                               std::stop_token stop) const {
    ZoneAnalysis result;
    try {
        result.zones = detect_zones(detector_, std::move(table));
    } catch (const Error& e) {
        log::get()->error("zone detection failed: {}", e.what());
        throw;
    }

    if (config_.extract_features) {
        extractor_.extract_all(result.zones, stop);
    }
    result.summary = summarize(result.zones);
    return result;
}

std::vector<BatchResult>
ZoneAnalyzer::run_batch(const std::vector<std::shared_ptr<const SampleTable>>& tables,
                        std::stop_token stop) const {
    std::vector<BatchResult> results(tables.size());
    if (tables.empty()) {
        return results;
    }

    std::size_t n_workers = config_.max_parallel_series;
    if (n_workers == 0) {
        n_workers = std::max(1u, std::thread::hardware_concurrency());
    }
    n_workers = std::min(n_workers, tables.size());

    std::atomic<std::size_t> cursor{0};
    const auto worker = [&] {
        while (!stop.stop_requested()) {
            const std::size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= tables.size()) {
                return;
            }
            batch::capture(results[i], [&] { return run(tables[i], stop); });
        }
    };

    std::vector<std::future<void>> workers;
    workers.reserve(n_workers);
    for (std::size_t w = 0; w < n_workers; ++w) {
        workers.push_back(std::async(std::launch::async, worker));
    }
    for (auto& w : workers) {
        w.get();
    }

    const auto failed = std::count_if(results.begin(), results.end(),
                                      [](const BatchResult& r) { return r.error.has_value(); });
    log::get()->info("batch of {} series finished, {} failed", tables.size(), failed);
    return results;
}

}  // namespace zonal
