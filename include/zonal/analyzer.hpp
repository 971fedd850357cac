#pragma once

/// @file include/zonal/analyzer.hpp
/// @brief ZoneAnalyzer: detect, extract and summarize in one call.
///
/// # Module: Zone Analyzer
///
/// ## Responsibility
/// Entry point for one series (`run`) or many independent series
/// (`run_batch`). Detection within a series is sequential; independent
/// series run concurrently with no shared state.
///
/// ## Errors
/// `run` propagates `ConfigurationError` and `DataError` from detection.
/// `run_batch` captures them per series so one bad series does not stop
/// the others.

#include "zonal/detection.hpp"
#include "zonal/features.hpp"
#include "zonal/summary.hpp"
#include "zonal/table.hpp"
#include "zonal/zone.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace zonal {

struct AnalyzerConfig {
    DetectorConfig  detector;
    ExtractorConfig extractor;
    bool            extract_features = true;
    std::size_t     max_parallel_series = 0;  ///< 0 = hardware concurrency
};

/// Zones (with features when enabled) and the run summary of one series.
struct ZoneAnalysis {
    std::vector<Zone> zones;
    ZoneSummary       summary;
};

/// Outcome of one series in a batch: an analysis or the error that stopped it.
/// Neither is set for a series never started because the batch was stopped.
struct BatchResult {
    std::optional<ZoneAnalysis> analysis;
    std::optional<std::string>  error;

    [[nodiscard]] bool ok() const noexcept { return analysis.has_value(); }
};

class ZoneAnalyzer {
public:
    /// # Throws
    /// `ConfigurationError` if the detector or extractor configuration is
    /// invalid.
    explicit ZoneAnalyzer(AnalyzerConfig config);

    /// Detect, extract and summarize one series.
    ///
    /// # Throws
    /// `ConfigurationError` or `DataError` from detection.
    [[nodiscard]] ZoneAnalysis run(std::shared_ptr<const SampleTable> table,
                                   std::stop_token stop = {}) const;

    /// Run every table concurrently. Results are in input order.
    ///
    /// `stop` halts dispatch of further series and is forwarded to each
    /// running series' feature extraction.
    [[nodiscard]] std::vector<BatchResult>
    run_batch(const std::vector<std::shared_ptr<const SampleTable>>& tables,
              std::stop_token stop = {}) const;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    AnalyzerConfig       config_;
    ZoneDetector         detector_;
    ZoneFeatureExtractor extractor_;
};

}  // namespace zonal
