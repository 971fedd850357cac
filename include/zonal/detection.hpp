#pragma once

/// @file include/zonal/detection.hpp
/// @brief Zone detector family: ZeroCrossing, ThresholdBand, LineCrossing.
///
/// # Module: Zone Detection
///
/// ## Responsibility
/// Segment a time-ordered SampleTable into contiguous zones from the regime of
/// an indicator, in one sequential pass, and stamp every zone with an
/// IndicatorContext naming the column(s) and strategy that produced it.
///
/// ## Regimes
/// | Detector        | Bullish                 | Bearish          | Neutral               |
/// |-----------------|-------------------------|------------------|-----------------------|
/// | ZeroCrossing    | value >= 0              | value < 0        | never                 |
/// | ThresholdBand   | value > upper           | value < lower    | lower <= value <= upper |
/// | LineCrossing    | line1 >= line2          | line1 < line2    | never                 |
///
/// ## Missing values
/// A NaN sample has no regime. It neither closes the open zone nor starts a
/// new one: the zone's span continues through it, and the next boundary is
/// the first later non-NaN sample whose regime differs. Samples before the
/// first classifiable one belong to no zone.
///
/// ## Guarantees
/// - Zones are non-overlapping and sorted by `start_idx`
/// - Zone ids are 0, 1, 2, ... over the zones returned
/// - Every zone of one run shares one IndicatorContext
/// - Detectors are immutable after construction; `detect` is const and
///   may be called concurrently on different tables
///
/// ## Errors
/// - `ConfigurationError` at construction for invalid parameters, and from
///   `detect` when a configured column is absent (before scanning)
/// - `DataError` from `detect` for an empty table or decreasing timestamps

#include "zonal/constants.hpp"
#include "zonal/table.hpp"
#include "zonal/types.hpp"
#include "zonal/zone.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zonal {

// ─── Enumerations ─────────────────────────────────────────────────────────────

enum class DetectionStrategy {
    ZeroCrossing,
    ThresholdBand,
    LineCrossing,
};

/// Strategy name as used in configuration and in IndicatorContext,
/// e.g. "zero_crossing".
[[nodiscard]] const char* to_string(DetectionStrategy s) noexcept;

/// Parse "zero_crossing", "threshold_band" or "line_crossing".
///
/// # Throws
/// `ConfigurationError` for any other name.
[[nodiscard]] DetectionStrategy parse_detection_strategy(std::string_view name);

/// Treatment of the first and last zone of a series, which the series edges
/// may have cut short.
enum class BoundaryPolicy {
    ApplyMinLength,  ///< Same minimum-length rule as interior zones
    Keep,            ///< Always kept
    Drop,            ///< Always dropped
};

[[nodiscard]] const char* to_string(BoundaryPolicy p) noexcept;

// ─── ZoneFilter ───────────────────────────────────────────────────────────────

/// Post-scan selection shared by all detectors.
struct ZoneFilter {
    std::size_t           min_zone_length = constants::DEFAULT_MIN_ZONE_LENGTH;
    BoundaryPolicy        boundary_policy = BoundaryPolicy::ApplyMinLength;
    std::vector<ZoneType> zone_types;  ///< Empty = keep every type
};

// ─── Detectors ────────────────────────────────────────────────────────────────

/// Regime = sign of one column, optionally smoothed by a trailing mean.
class ZeroCrossingDetector {
public:
    /// # Arguments
    /// * `indicator_col` - Column to classify
    /// * `smooth_window` - Trailing rolling-mean window (>= 2), none by default
    /// * `filter`        - Minimum length, boundary policy, type filter
    ///
    /// # Throws
    /// `ConfigurationError` on an empty column name, `smooth_window < 2`, or
    /// `min_zone_length < 1`.
    explicit ZeroCrossingDetector(std::string indicator_col,
                                  std::optional<std::size_t> smooth_window = std::nullopt,
                                  ZoneFilter filter = {});

    [[nodiscard]] std::vector<Zone> detect(std::shared_ptr<const SampleTable> table) const;

    [[nodiscard]] const std::string& indicator_col() const noexcept { return indicator_col_; }
    [[nodiscard]] const ZoneFilter& filter() const noexcept { return filter_; }

private:
    std::string                indicator_col_;
    std::optional<std::size_t> smooth_window_;
    ZoneFilter                 filter_;
};

/// Regime = position of one column relative to an upper and a lower band.
class ThresholdBandDetector {
public:
    /// # Throws
    /// `ConfigurationError` on an empty column name, non-finite thresholds,
    /// `upper <= lower`, or `min_zone_length < 1`.
    ThresholdBandDetector(std::string indicator_col,
                          double upper_threshold,
                          double lower_threshold,
                          bool emit_neutral = false,
                          ZoneFilter filter = {});

    [[nodiscard]] std::vector<Zone> detect(std::shared_ptr<const SampleTable> table) const;

    [[nodiscard]] const std::string& indicator_col() const noexcept { return indicator_col_; }
    [[nodiscard]] double upper_threshold() const noexcept { return upper_; }
    [[nodiscard]] double lower_threshold() const noexcept { return lower_; }
    [[nodiscard]] const ZoneFilter& filter() const noexcept { return filter_; }

private:
    std::string indicator_col_;
    double      upper_;
    double      lower_;
    bool        emit_neutral_;
    ZoneFilter  filter_;
};

/// Regime = sign of `line1 - line2`.
class LineCrossingDetector {
public:
    /// # Throws
    /// `ConfigurationError` on an empty or identical pair of column names, or
    /// `min_zone_length < 1`.
    LineCrossingDetector(std::string line1_col,
                         std::string line2_col,
                         ZoneFilter filter = {});

    [[nodiscard]] std::vector<Zone> detect(std::shared_ptr<const SampleTable> table) const;

    [[nodiscard]] const std::string& line1_col() const noexcept { return line1_col_; }
    [[nodiscard]] const std::string& line2_col() const noexcept { return line2_col_; }
    [[nodiscard]] const ZoneFilter& filter() const noexcept { return filter_; }

private:
    std::string line1_col_;
    std::string line2_col_;
    ZoneFilter  filter_;
};

/// Closed set of detector variants.
using ZoneDetector = std::variant<ZeroCrossingDetector,
                                  ThresholdBandDetector,
                                  LineCrossingDetector>;

// ─── Configuration ────────────────────────────────────────────────────────────

/// Flat detector configuration, as read from a caller's settings.
struct DetectorConfig {
    DetectionStrategy          strategy = DetectionStrategy::ZeroCrossing;
    std::string                indicator_col;
    std::optional<double>      upper_threshold;   ///< ThresholdBand, required
    std::optional<double>      lower_threshold;   ///< ThresholdBand, required
    std::optional<std::string> line1_col;         ///< LineCrossing, defaults to indicator_col
    std::optional<std::string> line2_col;         ///< LineCrossing, required
    std::optional<std::size_t> min_zone_length;   ///< Defaults to DEFAULT_MIN_ZONE_LENGTH
    std::optional<std::size_t> smooth_window;     ///< ZeroCrossing only
    bool                       emit_neutral    = false;
    BoundaryPolicy             boundary_policy = BoundaryPolicy::ApplyMinLength;
    std::vector<ZoneType>      zone_types;
};

/// Validate `config` and build the matching detector.
///
/// # Throws
/// `ConfigurationError` if a parameter required by the strategy is missing or
/// invalid.
[[nodiscard]] ZoneDetector make_detector(const DetectorConfig& config);

/// Run whichever detector `detector` holds.
[[nodiscard]] std::vector<Zone> detect_zones(const ZoneDetector& detector,
                                             std::shared_ptr<const SampleTable> table);

/// Build the detector `config` describes and run it.
///
/// # Throws
/// `ConfigurationError` for an invalid configuration or missing columns,
/// `DataError` for an unusable table.
[[nodiscard]] std::vector<Zone> detect_zones(const DetectorConfig& config,
                                             std::shared_ptr<const SampleTable> table);

/// Strategy of the held detector.
[[nodiscard]] DetectionStrategy strategy_of(const ZoneDetector& detector) noexcept;

}  // namespace zonal
