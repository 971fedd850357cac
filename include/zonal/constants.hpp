#pragma once

#include <cstddef>

/// @file include/zonal/constants.hpp
/// @brief Default parameters and fixed numeric constants for zone analysis.
///
/// Every configurable default used by a config struct lives here so that
/// tests and callers can refer to the same value the library uses.

namespace zonal::constants {

// ─── Detection ────────────────────────────────────────────────────────────────

/// Default minimum zone length in samples. Zones shorter than this are
/// discarded (interior zones always; boundary zones per BoundaryPolicy).
static constexpr std::size_t DEFAULT_MIN_ZONE_LENGTH = 2;

// ─── Shape ────────────────────────────────────────────────────────────────────

/// Fewer non-missing values than this → neutral shape record. Fixed.
static constexpr std::size_t SHAPE_MIN_SAMPLES = 3;

/// Kurtosis reported for the neutral shape record (normal distribution).
static constexpr double NEUTRAL_KURTOSIS = 3.0;

// ─── Divergence ───────────────────────────────────────────────────────────────

/// Minimum distance between two extrema of the same kind (samples).
static constexpr std::size_t DEFAULT_MIN_PEAK_DISTANCE = 5;

/// Prominence threshold as a fraction of the series' standard deviation.
static constexpr double DEFAULT_PROMINENCE_FACTOR = 0.5;

/// Maximum index distance when pairing a price extremum with an indicator one.
static constexpr std::size_t DEFAULT_MAX_MATCH_DISTANCE = 10;

/// Minimum |Δindicator / indicator_prev| for a divergence to count.
static constexpr double DEFAULT_MIN_DIVERGENCE_STRENGTH = 0.01;

// ─── Volume ───────────────────────────────────────────────────────────────────

/// Rows preceding a zone used to derive its baseline volume.
static constexpr std::size_t DEFAULT_BASELINE_WINDOW = 50;

/// Minimum pairwise-complete samples for volume/indicator correlation.
static constexpr std::size_t DEFAULT_CORRELATION_MIN_PERIODS = 3;

// ─── Volatility ───────────────────────────────────────────────────────────────

/// Fewer rows than this → no volatility metrics. Fixed.
static constexpr std::size_t VOLATILITY_MIN_SAMPLES = 3;

/// |ATR change| above this fraction marks the trend increasing/decreasing.
static constexpr double DEFAULT_ATR_TREND_THRESHOLD = 0.2;

/// Rows averaged at each end of the estimated true range for its trend.
static constexpr std::size_t DEFAULT_ATR_TREND_WINDOW = 5;

// ─── Swing ────────────────────────────────────────────────────────────────────

/// Bars on each side a pivot high (low) must strictly exceed (undercut).
static constexpr std::size_t DEFAULT_PIVOT_LEFT_BARS  = 2;
static constexpr std::size_t DEFAULT_PIVOT_RIGHT_BARS = 2;

/// Moves between pivots smaller than this fraction are ignored.
static constexpr double DEFAULT_MIN_SWING_AMPLITUDE = 0.015;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Variance below this is treated as zero (degenerate moments/correlation).
static constexpr double VARIANCE_EPSILON = 1e-18;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

}  // namespace zonal::constants
