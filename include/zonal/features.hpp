#pragma once

/// @file include/zonal/features.hpp
/// @brief ZoneFeatureExtractor: per-zone orchestration of the strategies.
///
/// # Module: Feature Extraction
///
/// ## Responsibility
/// For each zone:
///   1. Choose the indicator column: the zone's own detection indicator when
///      its data has it, otherwise one ColumnResolver pick reused by every
///      strategy of that zone
///   2. Compute the price descriptors and indicator summary, then Shape,
///      Divergence, Volume, Volatility and Swing, each in its own failure
///      boundary. Volatility and Swing read OHLC only and run without an
///      indicator column
///   3. Store the merged ZoneFeatures on the zone
///
/// ## Guarantees
/// - A failing strategy nulls its own group only; siblings and other zones
///   are unaffected
/// - `extract` is a pure function of the zone: repeated calls give equal
///   results
/// - `extract_all` preserves zone order, writes each zone from exactly one
///   worker, stops dispatching when its stop token fires, and never leaves
///   a partially written feature bag
/// - A zone that exceeds `zone_timeout` gets all groups null and
///   `timed_out = true`
///
/// ## NOT Responsible For
/// - Detecting zones or aggregating across zones (see summary.hpp)

#include "zonal/divergence.hpp"
#include "zonal/metrics.hpp"
#include "zonal/shape.hpp"
#include "zonal/swing.hpp"
#include "zonal/types.hpp"
#include "zonal/volatility.hpp"
#include "zonal/volume.hpp"
#include "zonal/zone.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace zonal {

// ─── PriceDescriptors ─────────────────────────────────────────────────────────

/// Basic price and indicator descriptors of a zone.
struct PriceDescriptors {
    double                start_price = 0.0;        ///< First close
    double                end_price   = 0.0;        ///< Last close
    std::optional<double> price_return;             ///< end / start - 1
    std::optional<double> price_range_pct;          ///< max(high) / min(low) - 1
    std::optional<double> indicator_amplitude;      ///< max - min of the indicator
    std::optional<double> indicator_slope;          ///< max |Δindicator|
    std::optional<double> price_indicator_corr;     ///< Pearson r of close and indicator
    std::optional<double> drawdown_from_peak;       ///< Bullish: end / max(high) - 1
    std::optional<double> rally_from_trough;        ///< Bearish: end / min(low) - 1
    std::optional<double> peak_time_ratio;          ///< Bullish: argmax(high) / duration
    std::optional<double> trough_time_ratio;        ///< Bearish: argmin(low) / duration
    std::size_t           num_peaks   = 0;          ///< Local maxima of high above its mean
    std::size_t           num_troughs = 0;          ///< Local minima of low below its mean

    bool operator==(const PriceDescriptors&) const = default;
};

// ─── IndicatorStats ───────────────────────────────────────────────────────────

/// Summary of the indicator column over a zone's finite values.
struct IndicatorStats {
    std::string           column;
    double                max  = 0.0;
    double                min  = 0.0;
    double                mean = 0.0;
    std::optional<double> std_dev;  ///< Sample (ddof = 1); null below two values

    bool operator==(const IndicatorStats&) const = default;
};

// ─── ZoneFeatures ─────────────────────────────────────────────────────────────

/// Feature bag of one zone.
struct ZoneFeatures {
    int                        zone_id  = 0;
    ZoneType                   type     = ZoneType::Neutral;
    std::size_t                duration = 0;
    std::optional<std::string> indicator_column;  ///< Column the strategies used
    bool                       used_fallback = false;  ///< Column came from the resolver
    std::optional<std::string> signal_line;       ///< Forwarded to divergence, if any

    std::optional<PriceDescriptors>  price;
    std::optional<IndicatorStats>    indicator;
    std::optional<ShapeMetrics>      shape;
    std::optional<DivergenceMetrics> divergence;
    std::optional<VolumeMetrics>     volume;
    std::optional<VolatilityMetrics> volatility;
    std::optional<SwingMetrics>      swing;

    bool timed_out = false;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ZoneFeatures&) const = default;
};

// ─── ExtractorConfig ──────────────────────────────────────────────────────────

struct ExtractorConfig {
    bool enable_shape      = true;
    bool enable_divergence = true;
    bool enable_volume     = true;
    bool enable_volatility = true;
    bool enable_swing      = true;

    ShapeConfig      shape;
    DivergenceConfig divergence;
    VolumeConfig     volume;
    VolatilityConfig volatility;
    SwingConfig      swing;

    /// Worker threads for `extract_all`; 0 = hardware concurrency.
    std::size_t max_workers = 0;

    /// Per-zone deadline; zero disables the timeout.
    std::chrono::nanoseconds zone_timeout{0};
};

// ─── ZoneFeatureExtractor ─────────────────────────────────────────────────────

class ZoneFeatureExtractor {
public:
    /// # Throws
    /// `ConfigurationError` if a strategy configuration is invalid or the
    /// timeout is negative.
    explicit ZoneFeatureExtractor(ExtractorConfig config = {});

    /// Feature bag of one zone. Strategy failures become null groups; this
    /// function does not throw for them.
    [[nodiscard]] ZoneFeatures extract(const Zone& zone) const;

    /// Extract every zone in parallel and store each bag on its zone. Zones
    /// that already have features are skipped, so a stopped run can be
    /// resumed by calling again.
    ///
    /// # Arguments
    /// * `zones` - Zones to fill; each is written by exactly one worker
    /// * `stop`  - Stops dispatch of further zones when requested. Zones not
    ///             yet dispatched keep `has_features() == false`
    ///
    /// # Returns
    /// Number of zones that received features in this call.
    std::size_t extract_all(std::vector<Zone>& zones, std::stop_token stop = {}) const;

    /// Workers `extract_all` would start for `zone_count` zones.
    [[nodiscard]] std::size_t worker_count(std::size_t zone_count) const noexcept;

    [[nodiscard]] const ExtractorConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] ZoneFeatures extract_until(const Zone& zone,
                                             std::optional<Clock::time_point> deadline) const;

    ExtractorConfig    config_;
    ShapeStrategy      shape_;
    DivergenceStrategy divergence_;
    VolumeStrategy     volume_;
    VolatilityStrategy volatility_;
    SwingStrategy      swing_;
};

/// Price descriptors of `zone_data` for a zone of `type`, using
/// `indicator_col` for the indicator fields when given.
///
/// # Throws
/// `DataError` if `close`, `high` or `low` is missing.
[[nodiscard]] PriceDescriptors
describe_prices(const TableSlice& zone_data,
                ZoneType type,
                const std::optional<std::string>& indicator_col);

/// Max, min, mean and sample std of `column` over the finite values of
/// `zone_data`.
///
/// # Throws
/// `DataError` if the column is missing, `ComputationError` if it has no
/// finite value in the zone.
[[nodiscard]] IndicatorStats describe_indicator(const TableSlice& zone_data,
                                                const std::string& column);

}  // namespace zonal
