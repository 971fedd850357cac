#pragma once

/// @file include/zonal/metrics.hpp
/// @brief Value records produced by the analytical strategies.

#include "zonal/constants.hpp"
#include "zonal/types.hpp"

#include <optional>
#include <string>

namespace zonal {

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Prevailing divergence kind in a zone.
enum class DivergenceType {
    Bullish,  ///< Price lower low, indicator higher low
    Bearish,  ///< Price higher high, indicator lower high
    None,     ///< No divergence or no strict majority
};

/// Overall divergence direction; `Mixed` when both kinds occur equally often.
enum class DivergenceDirection {
    Bullish,
    Bearish,
    Mixed,
    None,
};

/// Direction of ATR across a zone, from its relative change.
enum class AtrTrend {
    Increasing,
    Decreasing,
    Stable,
};

[[nodiscard]] const char* to_string(DivergenceType t) noexcept;
[[nodiscard]] const char* to_string(DivergenceDirection d) noexcept;
[[nodiscard]] const char* to_string(AtrTrend t) noexcept;

// ─── ShapeMetrics ─────────────────────────────────────────────────────────────

/// Distribution shape of the indicator inside a zone.
struct ShapeMetrics {
    double                skewness   = 0.0;
    double                kurtosis   = constants::NEUTRAL_KURTOSIS;  ///< Pearson (normal = 3)
    std::optional<double> smoothness;  ///< Std of first differences
    ParamMap              strategy_params;

    /// The record returned when there is too little data to measure shape.
    [[nodiscard]] static ShapeMetrics neutral(ParamMap params);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ShapeMetrics&) const = default;
};

// ─── DivergenceMetrics ────────────────────────────────────────────────────────

struct DivergenceMetrics {
    int                 divergence_count = 0;
    int                 bullish_count    = 0;
    int                 bearish_count    = 0;
    DivergenceType      dominant_type    = DivergenceType::None;
    double              avg_strength     = 0.0;
    DivergenceDirection direction        = DivergenceDirection::None;
    ParamMap            strategy_params;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const DivergenceMetrics&) const = default;
};

// ─── VolumeMetrics ────────────────────────────────────────────────────────────

struct VolumeMetrics {
    std::optional<double> zone_volume_ratio;      ///< avg zone volume / baseline
    std::optional<double> entry_volume_change;    ///< first volume / baseline - 1
    std::optional<double> volume_indicator_corr;  ///< Pearson r
    double                avg_zone_volume = 0.0;
    ParamMap              strategy_params;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const VolumeMetrics&) const = default;
};

// ─── VolatilityMetrics ────────────────────────────────────────────────────────

struct VolatilityMetrics {
    double   avg_atr              = 0.0;
    double   atr_normalized_range = 0.0;  ///< (max(high) - min(low)) / avg_atr, 0 if avg_atr <= 0
    double   atr_change           = 0.0;  ///< end / start - 1, 0 if start <= 0
    AtrTrend atr_trend            = AtrTrend::Stable;
    bool     atr_estimated        = false;  ///< True range used in place of an ATR column
    ParamMap strategy_params;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const VolatilityMetrics&) const = default;
};

// ─── SwingMetrics ─────────────────────────────────────────────────────────────

/// Rallies and drops between consecutive pivots. Amplitudes are percentages.
struct SwingMetrics {
    int      num_swings    = 0;  ///< min(rally_count, drop_count)
    int      rally_count   = 0;
    int      drop_count    = 0;
    double   avg_rally_pct = 0.0;
    double   avg_drop_pct  = 0.0;
    double   max_rally_pct = 0.0;
    double   max_drop_pct  = 0.0;
    double   rally_to_drop_ratio = 0.0;  ///< avg_rally_pct / avg_drop_pct, 0 without drops
    double   avg_rally_duration  = 0.0;  ///< Bars
    double   avg_drop_duration   = 0.0;
    double   avg_rally_speed     = 0.0;  ///< Percent per bar
    double   avg_drop_speed      = 0.0;
    double   duration_symmetry   = 0.0;  ///< avg_rally_duration / avg_drop_duration
    ParamMap strategy_params;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const SwingMetrics&) const = default;
};

}  // namespace zonal
